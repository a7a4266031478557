#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include "shared/async/AsyncGate.hpp"
#include "shared/async/Delay.hpp"
#include "shared/async/TaskGroup.hpp"
#include "support/Fixtures.hpp"

namespace asio = boost::asio;
using streamscout::shared::async::AsyncGate;
using streamscout::shared::async::TaskGroup;
using streamscout::shared::async::delay;
using streamscout::testing::run_sync;
using std::chrono::milliseconds;

static asio::awaitable<int> occupy(AsyncGate& gate, int id, std::vector<int>& admitted,
                                   std::size_t& worst)
{
  auto slot = co_await gate.acquire();
  admitted.push_back(id);
  worst = (std::max)(worst, gate.in_use());
  co_await delay(milliseconds(5));
  co_return id;
}

TEST(AsyncGate, NeverExceedsLimitAndAdmitsInOrder)
{
  asio::io_context io;
  AsyncGate gate(io.get_executor(), 3);
  std::vector<int> admitted;
  std::size_t worst = 0;

  TaskGroup<int> group(io.get_executor());
  for (int i = 0; i < 10; ++i) group.spawn(occupy(gate, i, admitted, worst));
  auto outcomes = run_sync(io, group.join());

  ASSERT_EQ(outcomes.size(), 10u);
  EXPECT_LE(worst, 3u);
  EXPECT_EQ(gate.peak(), 3u);
  EXPECT_EQ(gate.in_use(), 0u);
  EXPECT_EQ(gate.waiting(), 0u);
  EXPECT_EQ(admitted, (std::vector<int>{0, 1, 2, 3, 4, 5, 6, 7, 8, 9}));
}

TEST(AsyncGate, SlotReleasesOnScopeExit)
{
  asio::io_context io;
  AsyncGate gate(io.get_executor(), 1);

  auto task = [&]() -> asio::awaitable<std::size_t> {
    {
      auto a = co_await gate.acquire();
      EXPECT_TRUE(a);
      EXPECT_EQ(gate.in_use(), 1u);
    }
    auto b = co_await gate.acquire();  // would hang if the first slot leaked
    co_return gate.in_use();
  };
  EXPECT_EQ(run_sync(io, task()), 1u);
  EXPECT_EQ(gate.in_use(), 0u);
}

TEST(AsyncGate, ZeroLimitIsClampedToOne)
{
  asio::io_context io;
  AsyncGate gate(io.get_executor(), 0);
  EXPECT_EQ(gate.limit(), 1u);
}

static asio::awaitable<int> fail_after(milliseconds d)
{
  co_await delay(d);
  throw std::runtime_error("prober blew up");
}

static asio::awaitable<int> value_after(milliseconds d, int v)
{
  co_await delay(d);
  co_return v;
}

TEST(TaskGroup, FailureIsIsolatedFromSiblings)
{
  asio::io_context io;
  TaskGroup<int> group(io.get_executor());
  group.spawn(value_after(milliseconds(10), 1));
  group.spawn(fail_after(milliseconds(1)));
  group.spawn(value_after(milliseconds(20), 3));

  auto outcomes = run_sync(io, group.join());
  ASSERT_EQ(outcomes.size(), 3u);
  ASSERT_TRUE(outcomes[0].ok());
  EXPECT_EQ(*outcomes[0].value, 1);
  EXPECT_FALSE(outcomes[1].ok());
  EXPECT_EQ(outcomes[1].error, "prober blew up");
  ASSERT_TRUE(outcomes[2].ok());
  EXPECT_EQ(*outcomes[2].value, 3);
}

TEST(TaskGroup, EmptyGroupJoinsImmediately)
{
  asio::io_context io;
  TaskGroup<int> group(io.get_executor());
  EXPECT_TRUE(run_sync(io, group.join()).empty());
}
