#pragma once

#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <cstddef>
#include <functional>
#include <set>
#include <string>
#include <vector>

#include "application/ports/ILogger.hpp"
#include "application/services/HostScanner.hpp"
#include "domain/ScanProgress.hpp"
#include "shared/async/AsyncGate.hpp"

namespace streamscout::application::services
{

class ScanCoordinator
{
 public:
  using ProgressFn = std::function<void(const domain::ScanProgress&)>;

  ScanCoordinator(HostScanner& scanner, ports::ILogger& log, std::size_t maxConcurrentHosts)
      : scanner_(scanner), log_(log), max_hosts_(maxConcurrentHosts == 0 ? 1 : maxConcurrentHosts)
  {
  }

  // Union of every host's stream URLs. An empty host list returns at once.
  boost::asio::awaitable<std::set<std::string>> scan_network(std::vector<std::string> hosts);

  // Applies to the running pass, or to the next one when none is running: hosts not yet
  // admitted are skipped, running host scans finish normally. Each pass consumes the request.
  void request_stop() noexcept { stop_ = true; }
  bool stop_requested() const noexcept { return stop_; }

  // true when the last pass ended because of request_stop()
  bool interrupted() const noexcept { return interrupted_; }

  void on_progress(ProgressFn fn) { on_progress_ = std::move(fn); }

  const domain::ScanProgress& progress() const noexcept { return progress_; }
  const std::set<domain::StreamCandidate>& candidates() const noexcept { return candidates_; }
  std::size_t max_hosts() const noexcept { return max_hosts_; }

  // highest number of hosts scanned at once during the last pass
  std::size_t peak_hosts() const noexcept { return peak_hosts_; }

 private:
  boost::asio::awaitable<std::set<domain::StreamCandidate>> scan_admitted(
      shared::async::AsyncGate::Slot slot, std::string host);

  HostScanner& scanner_;
  ports::ILogger& log_;
  std::size_t max_hosts_;
  bool stop_{false};
  bool interrupted_{false};
  ProgressFn on_progress_;
  domain::ScanProgress progress_;
  std::set<domain::StreamCandidate> candidates_;
  std::size_t peak_hosts_{0};
};

}  // namespace streamscout::application::services
