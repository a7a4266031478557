#include "infrastructure/net/ConnectivityProbe_Asio.hpp"

#include <algorithm>
#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/this_coro.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <cstdio>

#include "infrastructure/net/TcpConnector.hpp"
#include "shared/async/Delay.hpp"

using streamscout::application::ports::LogLevel;

namespace streamscout::infrastructure::net
{

ConnectivityProbe_Asio::ConnectivityProbe_Asio(shared::async::AsyncGate& gate,
                                               application::ports::ILogger& log,
                                               application::ports::ConnectPolicy policy)
    : gate_(gate), log_(log), policy_(policy)
{
  policy_.attempts = std::clamp(policy_.attempts, 1, kMaxAttempts);
  if (policy_.retryDelay.count() < 0) policy_.retryDelay = std::chrono::milliseconds(0);
}

boost::asio::awaitable<bool> ConnectivityProbe_Asio::is_reachable(std::string host, uint16_t port,
                                                                  std::chrono::milliseconds timeout)
{
  // one slot for the whole check, retries included
  auto slot = co_await gate_.acquire();

  // the slot is already held, so the per-attempt connector runs ungated
  const TcpConnector connector;
  auto ex = co_await boost::asio::this_coro::executor;

  for (int attempt = 1; attempt <= policy_.attempts; ++attempt)
  {
    if (attempt > 1) co_await shared::async::delay(policy_.retryDelay);

    boost::beast::tcp_stream stream(ex);
    stream.expires_after(timeout);
    const auto ec = co_await connector.connect(stream, host, port);
    if (!ec)
    {
      boost::beast::error_code ignored;
      stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
      stream.close();
      co_return true;
    }

    char b[256];
    std::snprintf(b, sizeof(b), "[Connectivity] %s:%u attempt %d/%d: %s", host.c_str(),
                  (unsigned)port, attempt, policy_.attempts, ec.message().c_str());
    log_.net(LogLevel::trace, b);
  }

  co_return false;
}

}  // namespace streamscout::infrastructure::net
