#pragma once

#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <cstddef>
#include <deque>
#include <memory>
#include <utility>

namespace streamscout::shared::async
{

// Counting admission control for coroutines running on one io_context thread.
// acquire() suspends while `limit` slots are taken; waiters are admitted in FIFO order.
class AsyncGate
{
 public:
  // Move-only RAII handle; releases its slot when destroyed.
  class Slot
  {
   public:
    Slot() = default;
    explicit Slot(AsyncGate* gate) : gate_(gate) {}
    Slot(Slot&& o) noexcept : gate_(std::exchange(o.gate_, nullptr)) {}
    Slot& operator=(Slot&& o) noexcept
    {
      if (this != &o)
      {
        reset();
        gate_ = std::exchange(o.gate_, nullptr);
      }
      return *this;
    }
    Slot(const Slot&) = delete;
    Slot& operator=(const Slot&) = delete;
    ~Slot() { reset(); }

    void reset()
    {
      if (gate_) std::exchange(gate_, nullptr)->release();
    }
    explicit operator bool() const noexcept { return gate_ != nullptr; }

   private:
    AsyncGate* gate_{nullptr};
  };

  AsyncGate(boost::asio::any_io_executor ex, std::size_t limit);
  AsyncGate(const AsyncGate&) = delete;
  AsyncGate& operator=(const AsyncGate&) = delete;

  boost::asio::awaitable<Slot> acquire();

  std::size_t limit() const noexcept { return limit_; }
  std::size_t in_use() const noexcept { return in_use_; }
  std::size_t waiting() const noexcept { return waiters_.size(); }

  // highest simultaneous occupancy observed
  std::size_t peak() const noexcept { return peak_; }

 private:
  void release();

  boost::asio::any_io_executor ex_;
  std::size_t limit_;
  std::size_t in_use_{0};
  std::size_t peak_{0};
  std::deque<std::shared_ptr<boost::asio::steady_timer>> waiters_;
};

}  // namespace streamscout::shared::async
