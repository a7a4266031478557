#include "infrastructure/net/HttpClient_Beast.hpp"

#include <array>
#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/ip/address.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <limits>

using streamscout::application::ports::LogLevel;

namespace streamscout::infrastructure::net
{
namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = asio::ssl;

namespace
{
constexpr const char* kUserAgent = "streamscout/1.0";
constexpr std::size_t kChunk = 4096;

bool is_redirect(unsigned status)
{
  return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

bool is_ip_literal(const std::string& host)
{
  beast::error_code ec;
  asio::ip::make_address(host, ec);
  return !ec;
}

// One request/response over an already connected (and handshaken) stream.
template <class Stream>
asio::awaitable<std::optional<HttpResponse>> exchange(Stream& stream, http::verb verb,
                                                      const Url& url, std::size_t bodyLimit)
{
  beast::error_code ec;

  http::request<http::empty_body> req{verb, url.target, 11};
  req.set(http::field::host, url.authority());
  req.set(http::field::user_agent, kUserAgent);
  req.set(http::field::accept, "*/*");
  req.set(http::field::connection, "close");

  co_await http::async_write(stream, req, asio::redirect_error(asio::use_awaitable, ec));
  if (ec) co_return std::nullopt;

  beast::flat_buffer buffer;
  http::response_parser<http::buffer_body> parser;
  parser.body_limit(std::numeric_limits<std::uint64_t>::max());
  if (verb == http::verb::head) parser.skip(true);

  co_await http::async_read_header(stream, buffer, parser,
                                   asio::redirect_error(asio::use_awaitable, ec));
  if (ec) co_return std::nullopt;

  HttpResponse out;
  out.status = parser.get().result_int();
  out.contentType = std::string(parser.get()[http::field::content_type]);
  out.location = std::string(parser.get()[http::field::location]);
  out.finalUrl = url.str();

  // bounded body sample; whatever arrived before an error is kept
  std::array<char, kChunk> chunk;
  while (!parser.is_done() && out.body.size() < bodyLimit)
  {
    parser.get().body().data = chunk.data();
    parser.get().body().size = chunk.size();
    co_await http::async_read(stream, buffer, parser,
                              asio::redirect_error(asio::use_awaitable, ec));
    out.body.append(chunk.data(), chunk.size() - parser.get().body().size);
    if (ec == http::error::need_buffer) ec = {};
    if (ec) break;
  }
  if (out.body.size() > bodyLimit) out.body.resize(bodyLimit);

  co_return out;
}
}  // namespace

HttpClient_Beast::HttpClient_Beast(TcpConnector connector, application::ports::ILogger& log,
                                   int maxRedirects)
    : connector_(connector), log_(log), max_redirects_(maxRedirects),
      tls_(ssl::context::tls_client)
{
  // LAN cameras and encoders present self-signed certificates
  tls_.set_verify_mode(ssl::verify_none);
}

asio::awaitable<std::optional<HttpResponse>> HttpClient_Beast::head(std::string url,
                                                                   std::chrono::milliseconds timeout)
{
  co_return co_await request(http::verb::head, std::move(url), timeout, 0);
}

asio::awaitable<std::optional<HttpResponse>> HttpClient_Beast::get(std::string url,
                                                                  std::chrono::milliseconds timeout,
                                                                  std::size_t bodyLimit)
{
  co_return co_await request(http::verb::get, std::move(url), timeout, bodyLimit);
}

asio::awaitable<std::optional<HttpResponse>> HttpClient_Beast::request(
    http::verb verb, std::string url, std::chrono::milliseconds timeout, std::size_t bodyLimit)
{
  auto parsed = Url::parse(url);
  if (!parsed || (parsed->scheme != "http" && parsed->scheme != "https"))
  {
    log_.net(LogLevel::debug, "[Http] unsupported url " + url);
    co_return std::nullopt;
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  Url current = *parsed;

  for (int hop = 0;; ++hop)
  {
    auto res = co_await request_once(verb, current, deadline, bodyLimit);
    if (!res) co_return std::nullopt;

    if (!is_redirect(res->status) || res->location.empty() || hop >= max_redirects_)
      co_return res;

    auto next = follow(current, res->location);
    if (!next || (next->scheme != "http" && next->scheme != "https")) co_return res;

    log_.net(LogLevel::trace, "[Http] " + current.str() + " -> " + next->str());
    current = std::move(*next);
  }
}

asio::awaitable<std::optional<HttpResponse>> HttpClient_Beast::request_once(
    http::verb verb, Url url, std::chrono::steady_clock::time_point deadline,
    std::size_t bodyLimit)
{
  auto ex = co_await asio::this_coro::executor;

  if (!url.secure())
  {
    beast::tcp_stream stream(ex);
    stream.expires_at(deadline);
    if (auto ec = co_await connector_.connect(stream, url.host, url.port))
    {
      log_.net(LogLevel::debug, "[Http] connect " + url.authority() + " failed: " + ec.message());
      co_return std::nullopt;
    }
    auto res = co_await exchange(stream, verb, url, bodyLimit);
    if (!res) log_.net(LogLevel::debug, "[Http] no answer from " + url.str());
    co_return res;
  }

  beast::ssl_stream<beast::tcp_stream> stream(ex, tls_);
  beast::get_lowest_layer(stream).expires_at(deadline);
  if (auto ec = co_await connector_.connect(beast::get_lowest_layer(stream), url.host, url.port))
  {
    log_.net(LogLevel::debug, "[Http] connect " + url.authority() + " failed: " + ec.message());
    co_return std::nullopt;
  }

  if (!is_ip_literal(url.host) &&
      !SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str()))
  {
    log_.net(LogLevel::debug, "[Http] SNI rejected for " + url.host);
    co_return std::nullopt;
  }

  beast::error_code ec;
  co_await stream.async_handshake(ssl::stream_base::client,
                                  asio::redirect_error(asio::use_awaitable, ec));
  if (ec)
  {
    log_.net(LogLevel::debug, "[Http] TLS handshake " + url.authority() + " failed: " + ec.message());
    co_return std::nullopt;
  }

  auto res = co_await exchange(stream, verb, url, bodyLimit);
  if (!res) log_.net(LogLevel::debug, "[Http] no answer from " + url.str());
  co_return res;
}

std::optional<Url> HttpClient_Beast::follow(const Url& base, const std::string& location)
{
  if (location.find("://") != std::string::npos) return Url::parse(location);

  Url next = base;
  if (!location.empty() && location.front() == '/')
  {
    next.target = location;
  }
  else
  {
    auto dir = base.target.substr(0, base.target.find_first_of("?#"));
    dir = dir.substr(0, dir.rfind('/') + 1);
    next.target = dir + location;
  }
  return next;
}

}  // namespace streamscout::infrastructure::net
