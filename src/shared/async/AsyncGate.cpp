#include "shared/async/AsyncGate.hpp"

#include <algorithm>
#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace streamscout::shared::async
{

AsyncGate::AsyncGate(boost::asio::any_io_executor ex, std::size_t limit)
    : ex_(std::move(ex)), limit_((std::max)(limit, std::size_t{1}))
{
}

boost::asio::awaitable<AsyncGate::Slot> AsyncGate::acquire()
{
  if (in_use_ < limit_ && waiters_.empty())
  {
    ++in_use_;
    peak_ = (std::max)(peak_, in_use_);
    co_return Slot{this};
  }

  // Park on a timer that never fires; release() cancels it to hand the slot over.
  auto t = std::make_shared<boost::asio::steady_timer>(ex_,
                                                       boost::asio::steady_timer::time_point::max());
  waiters_.push_back(t);

  boost::system::error_code ec;
  co_await t->async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));

  co_return Slot{this};
}

void AsyncGate::release()
{
  if (!waiters_.empty())
  {
    // slot passes to the oldest waiter; occupancy is unchanged
    auto next = std::move(waiters_.front());
    waiters_.pop_front();
    next->cancel();
    return;
  }
  if (in_use_ > 0) --in_use_;
}

}  // namespace streamscout::shared::async
