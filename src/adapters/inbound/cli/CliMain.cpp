#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <exception>
#include <functional>
#include <iostream>
#include <set>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

#include "adapters/inbound/cli/ProgressReporter.hpp"
#include "application/services/Bootstrap.hpp"
#include "application/services/HostScanner.hpp"
#include "application/services/ScanCoordinator.hpp"
#include "application/services/StreamMonitor.hpp"
#include "domain/protocol/ProtocolCatalog.hpp"
#include "infrastructure/config/Config_Toml.hpp"
#include "infrastructure/logging/Logger_Spdlog.hpp"
#include "infrastructure/net/ConnectivityProbe_Asio.hpp"
#include "infrastructure/net/HttpClient_Beast.hpp"
#include "infrastructure/net/NetworkRange.hpp"
#include "infrastructure/persistence/StreamStore_Json.hpp"
#include "infrastructure/probe/LivenessProbe_Asio.hpp"
#include "infrastructure/probe/ProtocolProber_Asio.hpp"
#include "shared/async/AsyncGate.hpp"
#include "shared/time/Timestamp.hpp"

namespace asio = boost::asio;
using namespace streamscout;
using application::ports::LogLevel;
using std::chrono::milliseconds;

namespace {

enum class Mode { scan, monitor, run };

void usage() {
  std::cout << "usage: streamscout [scan|monitor|run] [config.toml]\n"
               "  scan     discover stream URLs and write the results file\n"
               "  monitor  re-verify URLs from the results file and the active document\n"
               "  run      scan, then monitor what was found (default)\n";
}

// Composition root: one io_context thread, every component wired by reference.
struct App {
  App(asio::io_context& io, const domain::Settings& s, application::ports::ILogger& log)
      : log(log),
        catalog(s.protocols),
        connGate(io.get_executor(), s.scan.maxConcurrentConnections),
        connectivity(connGate, log,
                     {s.scan.connectAttempts, milliseconds(s.scan.connectRetryDelayMs)}),
        connector(&connGate),
        http(connector, log),
        rtsp(connector, log),
        ws(connector, log),
        prober(connectivity, http, rtsp, ws, log, milliseconds(s.scan.probeRetryDelayMs)),
        scanner(connectivity, prober, log, catalog,
                {milliseconds(s.scan.connectTimeoutMs), milliseconds(s.scan.portPacingMs)}),
        coordinator(scanner, log, s.scan.maxConcurrentHosts),
        store(s.monitor.activeFile, s.monitor.historyFile, s.scan.resultsFile, log),
        liveness(http, rtsp, log, s.monitor,
                 domain::protocol::ProtocolCatalog::video_content_types()),
        monitor(liveness, store, log, s.monitor, &shared::time::now),
        progress(std::cout),
        targets(s.scan.targets) {
    coordinator.on_progress([this](const domain::ScanProgress& p) { progress(p); });
  }

  asio::awaitable<int> scan(std::set<std::string>& urls) {
    const auto hosts = infrastructure::net::NetworkRange::enumerate(targets, log);
    if (hosts.empty()) {
      log.app(LogLevel::err, "No valid network range found");
      co_return 1;
    }

    urls = co_await coordinator.scan_network(hosts);
    progress.finish();

    std::size_t weak = 0;
    for (const auto& c : coordinator.candidates())
    {
      if (c.confidence == domain::Confidence::reachable_only) ++weak;
      log.app(LogLevel::info, "  " + c.url + " [" + c.protocol + ", " +
                                  domain::to_string(c.confidence) + "]");
    }
    log.app(LogLevel::info, "Found " + std::to_string(urls.size()) + " stream URL(s), " +
                                std::to_string(weak) + " of them reachable-only");

    co_return store.write_results(urls) ? 0 : 1;
  }

  asio::awaitable<int> watch(std::set<std::string> seeds) {
    monitor.restore();
    co_await monitor.start_monitoring(std::move(seeds));
    co_return 0;
  }

  asio::awaitable<int> execute(Mode mode) {
    if (mode == Mode::monitor) co_return co_await watch(store.load_results());

    std::set<std::string> urls;
    const int rc = co_await scan(urls);
    if (mode == Mode::scan || rc != 0 || coordinator.interrupted()) co_return rc;
    co_return co_await watch(std::move(urls));
  }

  void interrupt() {
    log.app(LogLevel::warn, "Interrupted, finishing current work");
    coordinator.request_stop();
    monitor.stop();
  }

  application::ports::ILogger& log;
  domain::protocol::ProtocolCatalog catalog;
  shared::async::AsyncGate connGate;
  infrastructure::net::ConnectivityProbe_Asio connectivity;
  infrastructure::net::TcpConnector connector;
  infrastructure::net::HttpClient_Beast http;
  infrastructure::probe::RtspProbe rtsp;
  infrastructure::probe::WebSocketProbe ws;
  infrastructure::probe::ProtocolProber_Asio prober;
  application::services::HostScanner scanner;
  application::services::ScanCoordinator coordinator;
  infrastructure::persistence::StreamStore_Json store;
  infrastructure::probe::LivenessProbe_Asio liveness;
  application::services::StreamMonitor monitor;
  adapters::cli::ProgressReporter progress;
  std::vector<std::string> targets;
};

}  // namespace

int main(int argc, char** argv) {
  Mode mode = Mode::run;
  std::string configPath{"streamscout.toml"};

  int argi = 1;
  if (argi < argc) {
    const std::string a = argv[argi];
    if (a == "-h" || a == "--help") {
      usage();
      return 0;
    }
    if (a == "scan")         { mode = Mode::scan;    ++argi; }
    else if (a == "monitor") { mode = Mode::monitor; ++argi; }
    else if (a == "run")     { mode = Mode::run;     ++argi; }
  }
  if (argi < argc) configPath = argv[argi];

  infrastructure::config::Config_Toml   cfg_impl;
  infrastructure::logging::Logger_Spdlog log_impl;

  int rc = 0;
  try {
    application::services::Bootstrap boot{cfg_impl, log_impl};
    const auto settings = boot.run(configPath);

    asio::io_context io;
    App app(io, settings, log_impl);

    // first signal stops admission and the monitor; a second one aborts
    asio::signal_set signals(io, SIGINT, SIGTERM);
    bool interrupted = false;
    std::function<void(const boost::system::error_code&, int)> on_signal =
        [&](const boost::system::error_code& ec, int) {
          if (ec) return;
          if (interrupted) {
            log_impl.app(LogLevel::warn, "Second interrupt, aborting");
            io.stop();
            return;
          }
          interrupted = true;
          app.interrupt();
          signals.async_wait(on_signal);
        };
    signals.async_wait(on_signal);

    asio::co_spawn(io, app.execute(mode),
                   [&](std::exception_ptr ep, int result) {
                     boost::system::error_code ignored;
                     signals.cancel(ignored);
                     if (!ep) {
                       rc = result;
                       return;
                     }
                     try {
                       std::rethrow_exception(ep);
                     } catch (const std::exception& e) {
                       log_impl.app(LogLevel::critical, std::string("Fatal: ") + e.what());
                       rc = 1;
                     }
                   });
    io.run();
  } catch (const std::exception& e) {
    std::cerr << "streamscout: " << e.what() << "\n";
    rc = 1;
  }

  spdlog::shutdown();
  return rc;
}
