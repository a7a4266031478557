#include <gtest/gtest.h>

#include "infrastructure/net/ConnectivityProbe_Asio.hpp"
#include "shared/async/TaskGroup.hpp"
#include "support/Fixtures.hpp"

namespace asio = boost::asio;
using streamscout::application::ports::ConnectPolicy;
using streamscout::infrastructure::net::ConnectivityProbe_Asio;
using streamscout::shared::async::AsyncGate;
using streamscout::shared::async::TaskGroup;
using namespace streamscout::testing;
using std::chrono::milliseconds;

TEST(ConnectivityProbe, ListeningPortIsReachable)
{
  LoopbackServer server([](tcp::socket&) {});
  asio::io_context io;
  AsyncGate gate(io.get_executor(), 4);
  TestLogger log;
  ConnectivityProbe_Asio probe(gate, log);

  EXPECT_TRUE(run_sync(io, probe.is_reachable("127.0.0.1", server.port(), milliseconds(1000))));
  EXPECT_EQ(gate.in_use(), 0u);
}

TEST(ConnectivityProbe, ClosedPortIsUnreachableAfterBoundedAttempts)
{
  asio::io_context io;
  AsyncGate gate(io.get_executor(), 4);
  TestLogger log;
  ConnectivityProbe_Asio probe(gate, log, ConnectPolicy{5, milliseconds(1)});

  EXPECT_EQ(probe.policy().attempts, ConnectivityProbe_Asio::kMaxAttempts);
  EXPECT_FALSE(run_sync(io, probe.is_reachable("127.0.0.1", closed_port(), milliseconds(500))));
  EXPECT_EQ(gate.in_use(), 0u);
}

TEST(ConnectivityProbe, UnresolvableHostIsUnreachable)
{
  asio::io_context io;
  AsyncGate gate(io.get_executor(), 4);
  TestLogger log;
  ConnectivityProbe_Asio probe(gate, log, ConnectPolicy{1, milliseconds(0)});

  EXPECT_FALSE(run_sync(io, probe.is_reachable("no-such-host.invalid", 80, milliseconds(2000))));
  EXPECT_EQ(gate.in_use(), 0u);
}

TEST(ConnectivityProbe, GateCapsConcurrentChecks)
{
  LoopbackServer server([](tcp::socket&) {});
  asio::io_context io;
  AsyncGate gate(io.get_executor(), 2);
  TestLogger log;
  ConnectivityProbe_Asio probe(gate, log);

  TaskGroup<bool> group(io.get_executor());
  for (int i = 0; i < 12; ++i)
    group.spawn(probe.is_reachable("127.0.0.1", server.port(), milliseconds(1000)));
  auto outcomes = run_sync(io, group.join());

  ASSERT_EQ(outcomes.size(), 12u);
  for (const auto& o : outcomes)
  {
    ASSERT_TRUE(o.ok());
    EXPECT_TRUE(*o.value);
  }
  EXPECT_LE(gate.peak(), 2u);
  EXPECT_EQ(gate.in_use(), 0u);
}
