#include "infrastructure/net/TcpConnector.hpp"

#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace streamscout::infrastructure::net
{
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

asio::awaitable<boost::beast::error_code> TcpConnector::connect(boost::beast::tcp_stream& stream,
                                                                std::string host,
                                                                uint16_t port) const
{
  shared::async::AsyncGate::Slot slot;
  if (gate_) slot = co_await gate_->acquire();

  boost::beast::error_code ec;

  // literal addresses skip the resolver
  const auto addr = asio::ip::make_address(host, ec);
  if (!ec)
  {
    co_await stream.async_connect(tcp::endpoint{addr, port},
                                  asio::redirect_error(asio::use_awaitable, ec));
    co_return ec;
  }

  ec = {};
  tcp::resolver resolver(stream.get_executor());
  auto results = co_await resolver.async_resolve(host, std::to_string(port),
                                                 tcp::resolver::numeric_service,
                                                 asio::redirect_error(asio::use_awaitable, ec));
  if (ec) co_return ec;

  co_await stream.async_connect(results, asio::redirect_error(asio::use_awaitable, ec));
  co_return ec;
}

}  // namespace streamscout::infrastructure::net
