#include "application/services/ScanCoordinator.hpp"

#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/this_coro.hpp>
#include <exception>
#include <utility>

#include "shared/async/TaskGroup.hpp"

using streamscout::application::ports::LogLevel;
using streamscout::domain::StreamCandidate;

namespace streamscout::application::services
{

boost::asio::awaitable<std::set<std::string>> ScanCoordinator::scan_network(
    std::vector<std::string> hosts)
{
  progress_ = {};
  progress_.totalHosts = hosts.size();
  candidates_.clear();
  peak_hosts_ = 0;
  interrupted_ = false;

  if (hosts.empty())
  {
    log_.app(LogLevel::warn, "No hosts to scan");
    interrupted_ = std::exchange(stop_, false);
    co_return std::set<std::string>{};
  }

  auto ex = co_await boost::asio::this_coro::executor;
  shared::async::AsyncGate gate(ex, max_hosts_);
  shared::async::TaskGroup<std::set<StreamCandidate>> scans(ex);

  log_.app(LogLevel::info, "Scanning " + std::to_string(hosts.size()) + " host(s), " +
                               std::to_string(max_hosts_) + " at a time");

  for (auto& host : hosts)
  {
    if (stop_) break;
    auto slot = co_await gate.acquire();
    if (stop_) break;
    scans.spawn(scan_admitted(std::move(slot), std::move(host)));
  }

  if (stop_)
    log_.app(LogLevel::warn, "Scan interrupted, waiting for " + std::to_string(scans.size()) +
                                 " admitted host(s)");

  for (auto& outcome : co_await scans.join())
  {
    if (outcome.ok()) candidates_.insert(outcome.value->begin(), outcome.value->end());
  }
  peak_hosts_ = gate.peak();
  interrupted_ = std::exchange(stop_, false);

  std::set<std::string> urls;
  for (const auto& c : candidates_) urls.insert(c.url);

  log_.app(LogLevel::info, "Scan completed: " + std::to_string(urls.size()) +
                               " stream URL(s) on " + std::to_string(progress_.scannedCount) +
                               "/" + std::to_string(progress_.totalHosts) + " host(s)");
  co_return urls;
}

boost::asio::awaitable<std::set<StreamCandidate>> ScanCoordinator::scan_admitted(
    shared::async::AsyncGate::Slot slot, std::string host)
{
  std::set<StreamCandidate> found;
  try
  {
    found = co_await scanner_.scan(host, progress_);
  }
  catch (const std::exception& e)
  {
    log_.app(LogLevel::err, "Error scanning host " + host + ": " + e.what());
    ++progress_.scannedCount;
    ++progress_.failedScans;
  }

  slot.reset();
  if (on_progress_) on_progress_(progress_);
  co_return found;
}

}  // namespace streamscout::application::services
