#include "infrastructure/probe/WebSocketProbe.hpp"

#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/buffer.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

using streamscout::application::ports::LogLevel;

namespace streamscout::infrastructure::probe
{
namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace ssl = asio::ssl;

namespace
{
template <class Ws>
asio::awaitable<Verdict> exchange(Ws& ws, std::string authority, std::string target,
                                  application::ports::ILogger& log)
{
  beast::error_code ec;

  ws.set_option(websocket::stream_base::decorator(
      [](websocket::request_type& req) { req.set(http::field::user_agent, "streamscout/1.0"); }));

  co_await ws.async_handshake(authority, target, asio::redirect_error(asio::use_awaitable, ec));
  if (ec == websocket::error::upgrade_declined) co_return Verdict::rejected;
  if (ec)
  {
    log.net(LogLevel::trace, "[WebSocket] handshake " + authority + target + ": " + ec.message());
    co_return Verdict::unreachable;
  }

  ws.text(true);
  co_await ws.async_write(asio::buffer(std::string_view{WebSocketProbe::kSubscribeMessage}),
                          asio::redirect_error(asio::use_awaitable, ec));
  if (ec) co_return Verdict::unreachable;

  beast::flat_buffer buffer;
  co_await ws.async_read(buffer, asio::redirect_error(asio::use_awaitable, ec));
  if (!ec && buffer.size() > 0) co_return Verdict::confirmed;

  // upgraded but silent within the window
  log.net(LogLevel::trace, "[WebSocket] no reply on " + authority + target +
                               (ec ? ": " + ec.message() : std::string{}));
  co_return Verdict::rejected;
}
}  // namespace

WebSocketProbe::WebSocketProbe(net::TcpConnector connector, application::ports::ILogger& log)
    : connector_(connector), log_(log), tls_(ssl::context::tls_client)
{
  tls_.set_verify_mode(ssl::verify_none);
}

asio::awaitable<Verdict> WebSocketProbe::subscribe(std::string scheme, std::string host,
                                                   uint16_t port, std::string target,
                                                   std::chrono::milliseconds timeout)
{
  auto ex = co_await asio::this_coro::executor;
  const std::string authority = host + ":" + std::to_string(port);
  if (target.empty() || target.front() != '/') target.insert(target.begin(), '/');

  if (scheme == "wss")
  {
    websocket::stream<beast::ssl_stream<beast::tcp_stream>> ws(ex, tls_);
    beast::get_lowest_layer(ws).expires_after(timeout);
    if (auto ec = co_await connector_.connect(beast::get_lowest_layer(ws), host, port))
      co_return Verdict::unreachable;

    beast::error_code ec;
    co_await ws.next_layer().async_handshake(ssl::stream_base::client,
                                             asio::redirect_error(asio::use_awaitable, ec));
    if (ec)
    {
      log_.net(LogLevel::trace, "[WebSocket] TLS " + authority + ": " + ec.message());
      co_return Verdict::unreachable;
    }
    co_return co_await exchange(ws, authority, target, log_);
  }

  websocket::stream<beast::tcp_stream> ws(ex);
  beast::get_lowest_layer(ws).expires_after(timeout);
  if (auto ec = co_await connector_.connect(beast::get_lowest_layer(ws), host, port))
    co_return Verdict::unreachable;

  co_return co_await exchange(ws, authority, target, log_);
}

}  // namespace streamscout::infrastructure::probe
