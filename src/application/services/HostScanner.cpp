#include "application/services/HostScanner.hpp"

#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/this_coro.hpp>
#include <exception>
#include <map>
#include <vector>

#include "shared/async/Delay.hpp"
#include "shared/async/TaskGroup.hpp"

using streamscout::application::ports::LogLevel;
using streamscout::domain::StreamCandidate;

namespace streamscout::application::services
{

boost::asio::awaitable<std::set<StreamCandidate>> HostScanner::scan(std::string host,
                                                                  domain::ScanProgress& progress)
{
  auto ex = co_await boost::asio::this_coro::executor;
  shared::async::TaskGroup<std::vector<StreamCandidate>> probers(ex);

  std::set<StreamCandidate> found;
  std::map<uint16_t, bool> reachable;  // several protocols share ports
  bool failed = false;

  try
  {
    for (const auto& spec : catalog_.specs())
    {
      for (const auto port : spec.ports)
      {
        auto it = reachable.find(port);
        if (it == reachable.end())
        {
          co_await shared::async::delay(opts_.pacing);
          const bool open = co_await connectivity_.is_reachable(host, port, opts_.connectTimeout);
          it = reachable.emplace(port, open).first;
          if (open) log_.app(LogLevel::debug, "Open port " + host + ":" + std::to_string(port));
        }
        if (!it->second) continue;

        probers.spawn(prober_.probe(spec, host, port));
      }
    }
  }
  catch (const std::exception& e)
  {
    log_.app(LogLevel::err, "Error scanning host " + host + ": " + e.what());
    failed = true;
  }

  // probers already started run to completion even when the port sweep failed
  for (auto& outcome : co_await probers.join())
  {
    if (!outcome.ok())
    {
      log_.app(LogLevel::err, "Error during protocol scan of " + host + ": " + outcome.error);
      failed = true;
      continue;
    }
    found.insert(outcome.value->begin(), outcome.value->end());
  }

  ++progress.scannedCount;
  if (failed)
    ++progress.failedScans;
  else
    ++progress.successfulScans;

  co_return found;
}

}  // namespace streamscout::application::services
