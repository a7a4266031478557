#pragma once

#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <cstddef>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "application/ports/ILivenessProbe.hpp"
#include "application/ports/ILogger.hpp"
#include "application/ports/IStreamStore.hpp"
#include "domain/Settings.hpp"
#include "domain/StreamRecord.hpp"

namespace streamscout::application::services
{

// Recurring liveness loop over seed URLs and the active registry.
// unverified -> active on a successful probe, active -> expired once the last success is older
// than the stale threshold. An expired URL that verifies again starts a new record.
class StreamMonitor
{
 public:
  using Clock = std::function<domain::Timestamp()>;

  StreamMonitor(ports::ILivenessProbe& probe, ports::IStreamStore& store, ports::ILogger& log,
                domain::Settings::Monitor cfg, Clock clock);

  // Runs cycles until stop(). Cycle failures are logged and followed by the error backoff.
  boost::asio::awaitable<void> start_monitoring(std::set<std::string> seeds);

  // Observed before the next cycle; a pending interval sleep is cut short.
  void stop();

  // Loads the persisted active document into the registry.
  std::size_t restore();

  // One probe round over seeds + registry, then sweep and persist the refreshed records.
  boost::asio::awaitable<void> run_cycle(const std::set<std::string>& seeds);

  // Expires records whose last success is older than the threshold; returns their URLs.
  std::vector<std::string> sweep(domain::Timestamp now);

  const std::map<std::string, domain::ActiveStreamRecord>& registry() const noexcept
  {
    return registry_;
  }
  domain::StreamState state_of(const std::string& url) const;

  bool running() const noexcept { return running_; }
  std::size_t cycles() const noexcept { return cycles_; }

 private:
  void persist(const std::vector<domain::ActiveStreamRecord>& touched);

  ports::ILivenessProbe& probe_;
  ports::IStreamStore& store_;
  ports::ILogger& log_;
  domain::Settings::Monitor cfg_;
  Clock clock_;

  std::map<std::string, domain::ActiveStreamRecord> registry_;
  std::set<std::string> expired_;
  bool running_{false};
  bool stop_{false};
  std::size_t cycles_{0};
  boost::asio::steady_timer* sleeper_{nullptr};
};

}  // namespace streamscout::application::services
