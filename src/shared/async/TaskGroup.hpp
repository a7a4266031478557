#pragma once

#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <cstddef>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace streamscout::shared::async
{

// Spawns sibling coroutines and joins them. A failing task never cancels the others; its
// exception is captured in its Outcome. Must be used from the io_context thread.
template <typename T>
class TaskGroup
{
 public:
  struct Outcome
  {
    std::optional<T> value;
    std::string error;  // what() of the escaped exception, empty on success

    bool ok() const noexcept { return value.has_value(); }
  };

  explicit TaskGroup(boost::asio::any_io_executor ex)
      : ex_(ex), state_(std::make_shared<State>(ex))
  {
  }

  void spawn(boost::asio::awaitable<T> task)
  {
    const std::size_t idx = state_->outcomes.size();
    state_->outcomes.emplace_back();
    ++state_->pending;

    boost::asio::co_spawn(ex_, std::move(task),
                          [st = state_, idx](std::exception_ptr ep, T value)
                          {
                            auto& out = st->outcomes[idx];
                            if (ep)
                              out.error = describe(ep);
                            else
                              out.value = std::move(value);

                            if (--st->pending == 0) st->done.cancel();
                          });
  }

  std::size_t size() const noexcept { return state_->outcomes.size(); }

  // Outcomes in spawn order.
  boost::asio::awaitable<std::vector<Outcome>> join()
  {
    if (state_->pending > 0)
    {
      boost::system::error_code ec;
      co_await state_->done.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }
    co_return std::move(state_->outcomes);
  }

 private:
  struct State
  {
    explicit State(boost::asio::any_io_executor ex)
        : done(ex, boost::asio::steady_timer::time_point::max())
    {
    }
    boost::asio::steady_timer done;
    std::size_t pending{0};
    std::vector<Outcome> outcomes;
  };

  static std::string describe(std::exception_ptr ep)
  {
    try
    {
      std::rethrow_exception(ep);
    }
    catch (const std::exception& e)
    {
      return e.what();
    }
    catch (...)
    {
      return "unknown exception";
    }
  }

  boost::asio::any_io_executor ex_;
  std::shared_ptr<State> state_;
};

}  // namespace streamscout::shared::async
