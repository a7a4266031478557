#include <gtest/gtest.h>

#include <algorithm>

#include "application/services/HostScanner.hpp"
#include "application/services/ScanCoordinator.hpp"
#include "domain/protocol/ProtocolCatalog.hpp"
#include "shared/async/Delay.hpp"
#include "support/Fixtures.hpp"

namespace asio = boost::asio;
using streamscout::application::ports::IConnectivityProbe;
using streamscout::application::ports::IProtocolProber;
using streamscout::application::services::HostScanner;
using streamscout::application::services::ScanCoordinator;
using streamscout::domain::ProbeStrategy;
using streamscout::domain::ProtocolSpec;
using streamscout::domain::ScanProgress;
using streamscout::domain::StreamCandidate;
using streamscout::domain::protocol::ProtocolCatalog;
using namespace streamscout::testing;
using std::chrono::milliseconds;

namespace
{
// Each check takes a few milliseconds; a host's checks are sequential, so the number of checks
// in flight equals the number of hosts being scanned.
struct SlowConnectivity : IConnectivityProbe
{
  asio::awaitable<bool> is_reachable(std::string, uint16_t port, milliseconds) override
  {
    ++calls;
    ++in_flight;
    max_in_flight = std::max(max_in_flight, in_flight);
    co_await streamscout::shared::async::delay(milliseconds(5));
    --in_flight;
    co_return open.count(port) > 0;
  }

  std::set<uint16_t> open;
  std::size_t calls{0};
  std::size_t in_flight{0};
  std::size_t max_in_flight{0};
};

// Every host exposes one private URL plus one URL shared by all hosts.
struct EchoProber : IProtocolProber
{
  asio::awaitable<std::vector<StreamCandidate>> probe(const ProtocolSpec& spec, std::string host,
                                                      uint16_t) override
  {
    co_return std::vector<StreamCandidate>{{"rtsp://" + host + "/live", spec.name},
                                           {"rtsp://relay.local/live", spec.name}};
  }
};

std::vector<std::string> hosts(std::size_t n)
{
  std::vector<std::string> out;
  for (std::size_t i = 1; i <= n; ++i) out.push_back("10.0.0." + std::to_string(i));
  return out;
}

struct CoordinatorRig
{
  explicit CoordinatorRig(std::size_t maxHosts, std::set<uint16_t> open = {})
      : coordinator(scanner, log, maxHosts)
  {
    conn.open = std::move(open);
  }

  ProtocolCatalog make_catalog()
  {
    ProtocolSpec s;
    s.name = "rtsp";
    s.strategy = ProbeStrategy::rtsp;
    s.ports = {554, 8554};
    s.paths = {"live"};
    return ProtocolCatalog({s});
  }

  asio::io_context io;
  TestLogger log;
  SlowConnectivity conn;
  EchoProber prober;
  ProtocolCatalog catalog{make_catalog()};
  HostScanner scanner{conn, prober, log, catalog, {milliseconds(100), milliseconds(0)}};
  ScanCoordinator coordinator;
};
}  // namespace

TEST(ScanCoordinator, EmptyHostListReturnsImmediately)
{
  CoordinatorRig rig(4);

  const auto urls = run_sync(rig.io, rig.coordinator.scan_network({}));

  EXPECT_TRUE(urls.empty());
  EXPECT_EQ(rig.conn.calls, 0u);
  EXPECT_EQ(rig.coordinator.progress().totalHosts, 0u);
  EXPECT_TRUE(rig.log.saw("No hosts to scan"));
}

TEST(ScanCoordinator, HostConcurrencyNeverExceedsLimit)
{
  CoordinatorRig rig(3);
  std::size_t reports = 0;
  rig.coordinator.on_progress([&](const ScanProgress&) { ++reports; });

  run_sync(rig.io, rig.coordinator.scan_network(hosts(10)));

  EXPECT_LE(rig.coordinator.peak_hosts(), 3u);
  EXPECT_GE(rig.coordinator.peak_hosts(), 1u);
  EXPECT_LE(rig.conn.max_in_flight, 3u);
  EXPECT_EQ(rig.conn.calls, 20u);

  const auto& p = rig.coordinator.progress();
  EXPECT_EQ(p.totalHosts, 10u);
  EXPECT_EQ(p.scannedCount, 10u);
  EXPECT_EQ(p.successfulScans, 10u);
  EXPECT_EQ(p.failedScans, 0u);
  EXPECT_EQ(reports, 10u);
}

TEST(ScanCoordinator, ZeroLimitIsClampedToOne)
{
  CoordinatorRig rig(0);
  EXPECT_EQ(rig.coordinator.max_hosts(), 1u);

  run_sync(rig.io, rig.coordinator.scan_network(hosts(4)));
  EXPECT_EQ(rig.conn.max_in_flight, 1u);
}

TEST(ScanCoordinator, ResultIsUnionOfDistinctUrls)
{
  CoordinatorRig rig(4, {554});

  const auto urls = run_sync(rig.io, rig.coordinator.scan_network(hosts(5)));

  EXPECT_EQ(urls.size(), 6u);
  EXPECT_EQ(urls.count("rtsp://relay.local/live"), 1u);
  EXPECT_EQ(urls.count("rtsp://10.0.0.3/live"), 1u);
  EXPECT_EQ(rig.coordinator.candidates().size(), 6u);
}

TEST(ScanCoordinator, StopBeforeScanAdmitsNothing)
{
  CoordinatorRig rig(2);
  rig.coordinator.request_stop();

  const auto urls = run_sync(rig.io, rig.coordinator.scan_network(hosts(5)));

  EXPECT_TRUE(urls.empty());
  EXPECT_EQ(rig.conn.calls, 0u);
  EXPECT_EQ(rig.coordinator.progress().scannedCount, 0u);
  EXPECT_EQ(rig.coordinator.progress().totalHosts, 5u);
  EXPECT_TRUE(rig.coordinator.interrupted());
}

TEST(ScanCoordinator, StopDuringScanLetsAdmittedHostsFinish)
{
  CoordinatorRig rig(2);
  rig.coordinator.on_progress([&](const ScanProgress&) { rig.coordinator.request_stop(); });

  run_sync(rig.io, rig.coordinator.scan_network(hosts(6)));

  EXPECT_EQ(rig.coordinator.progress().scannedCount, 2u);
  EXPECT_TRUE(rig.coordinator.interrupted());
  EXPECT_FALSE(rig.coordinator.stop_requested());
  EXPECT_TRUE(rig.log.saw("Scan interrupted"));
}

TEST(ScanCoordinator, NextPassAfterStopScansEveryHost)
{
  CoordinatorRig rig(2, {554});
  rig.coordinator.request_stop();
  run_sync(rig.io, rig.coordinator.scan_network(hosts(4)));
  ASSERT_TRUE(rig.coordinator.interrupted());
  ASSERT_EQ(rig.conn.calls, 0u);

  const auto urls = run_sync(rig.io, rig.coordinator.scan_network(hosts(4)));

  EXPECT_FALSE(rig.coordinator.interrupted());
  EXPECT_EQ(rig.coordinator.progress().scannedCount, 4u);
  EXPECT_EQ(rig.conn.calls, 8u);
  EXPECT_EQ(urls.size(), 5u);
}
