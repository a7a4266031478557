#include "application/services/StreamMonitor.hpp"

#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <exception>

#include "shared/async/TaskGroup.hpp"

using streamscout::application::ports::LivenessSample;
using streamscout::application::ports::LogLevel;
using streamscout::application::ports::StreamDocument;
using streamscout::domain::ActiveStreamRecord;
using streamscout::domain::StreamState;

namespace streamscout::application::services
{
namespace asio = boost::asio;

StreamMonitor::StreamMonitor(ports::ILivenessProbe& probe, ports::IStreamStore& store,
                             ports::ILogger& log, domain::Settings::Monitor cfg, Clock clock)
    : probe_(probe), store_(store), log_(log), cfg_(std::move(cfg)), clock_(std::move(clock))
{
}

asio::awaitable<void> StreamMonitor::start_monitoring(std::set<std::string> seeds)
{
  auto ex = co_await asio::this_coro::executor;
  asio::steady_timer sleeper(ex);
  sleeper_ = &sleeper;
  running_ = true;

  log_.app(LogLevel::info, "Monitoring " + std::to_string(seeds.size()) + " seed URL(s), " +
                               std::to_string(registry_.size()) + " active");

  while (!stop_)
  {
    bool failed = false;
    try
    {
      co_await run_cycle(seeds);
    }
    catch (const std::exception& e)
    {
      log_.app(LogLevel::err, std::string("Error in monitor loop: ") + e.what());
      failed = true;
    }
    if (stop_) break;

    sleeper.expires_after(std::chrono::milliseconds(failed ? cfg_.errorBackoffMs : cfg_.intervalMs));
    boost::system::error_code ec;
    co_await sleeper.async_wait(asio::redirect_error(asio::use_awaitable, ec));
  }

  sleeper_ = nullptr;
  running_ = false;
  log_.app(LogLevel::info, "Monitoring stopped after " + std::to_string(cycles_) + " cycle(s)");
}

void StreamMonitor::stop()
{
  stop_ = true;
  if (sleeper_) sleeper_->cancel();
}

std::size_t StreamMonitor::restore()
{
  std::size_t n = 0;
  for (auto& r : store_.load(StreamDocument::active))
  {
    if (!r.active) continue;
    const auto url = r.url;
    if (registry_.emplace(url, std::move(r)).second) ++n;
  }
  if (n) log_.app(LogLevel::info, "Restored " + std::to_string(n) + " active stream(s)");
  return n;
}

asio::awaitable<void> StreamMonitor::run_cycle(const std::set<std::string>& seeds)
{
  std::set<std::string> targets = seeds;
  for (const auto& [url, rec] : registry_) targets.insert(url);

  auto ex = co_await asio::this_coro::executor;
  shared::async::TaskGroup<std::optional<LivenessSample>> probes(ex);
  const std::vector<std::string> order(targets.begin(), targets.end());
  for (const auto& url : order) probes.spawn(probe_.verify(url));

  auto outcomes = co_await probes.join();
  const auto now = clock_();

  std::vector<ActiveStreamRecord> touched;
  for (std::size_t i = 0; i < outcomes.size(); ++i)
  {
    const auto& url = order[i];
    if (!outcomes[i].ok())
    {
      log_.app(LogLevel::debug, "Error monitoring stream " + url + ": " + outcomes[i].error);
      continue;
    }
    const auto& sample = *outcomes[i].value;
    if (!sample) continue;

    auto it = registry_.find(url);
    if (it == registry_.end())
    {
      ActiveStreamRecord rec{url, sample->contentType, now, now, sample->size, true};
      it = registry_.emplace(url, std::move(rec)).first;
      expired_.erase(url);
      log_.app(LogLevel::info, "New active stream detected: " + url);
    }
    else
    {
      it->second.lastActive = now;
      it->second.contentType = sample->contentType;
      it->second.size = sample->size;
    }
    touched.push_back(it->second);
  }

  // expiry first: a failing write of the refreshed records must not hold stale ones back
  sweep(now);
  persist(touched);
  ++cycles_;
}

std::vector<std::string> StreamMonitor::sweep(domain::Timestamp now)
{
  const std::chrono::seconds stale(cfg_.staleAfterS);

  std::vector<std::string> urls;
  std::vector<ActiveStreamRecord> gone;
  for (auto it = registry_.begin(); it != registry_.end();)
  {
    if (now - it->second.lastActive > stale)
    {
      it->second.active = false;
      urls.push_back(it->first);
      gone.push_back(std::move(it->second));
      expired_.insert(it->first);
      it = registry_.erase(it);
    }
    else
    {
      ++it;
    }
  }

  if (gone.empty()) return urls;

  for (const auto& u : urls) log_.app(LogLevel::info, "Stream expired: " + u);

  // history first: an expired stream must not vanish from both documents
  if (!store_.upsert(StreamDocument::history, gone))
    log_.app(LogLevel::warn, "Could not record expired streams in history");
  if (!store_.remove(StreamDocument::active, urls))
    log_.app(LogLevel::warn, "Could not drop expired streams from the active document");
  return urls;
}

domain::StreamState StreamMonitor::state_of(const std::string& url) const
{
  if (registry_.count(url)) return StreamState::active;
  if (expired_.count(url)) return StreamState::expired;
  return StreamState::unverified;
}

void StreamMonitor::persist(const std::vector<ActiveStreamRecord>& touched)
{
  if (touched.empty()) return;
  if (!store_.upsert(StreamDocument::active, touched))
    log_.app(LogLevel::warn, "Could not update the active stream document");
  if (!store_.upsert(StreamDocument::history, touched))
    log_.app(LogLevel::warn, "Could not update the stream history document");
}

}  // namespace streamscout::application::services
