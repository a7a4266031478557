#pragma once

#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/http/verb.hpp>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

#include "application/ports/ILogger.hpp"
#include "infrastructure/net/TcpConnector.hpp"
#include "infrastructure/net/Url.hpp"

namespace streamscout::infrastructure::net
{

struct HttpResponse
{
  unsigned status{0};
  std::string contentType;
  std::string body;      // at most the requested sample size
  std::string finalUrl;  // after redirects
  std::string location;  // Location header of a redirect answer

  bool ok() const noexcept { return status >= 200 && status < 300; }
};

// Minimal HTTP/1.1 client for probing: one request per connection, hard deadline covering
// connect, TLS, redirects and the body sample, and a bounded body read so endless media
// responses are cut after `bodyLimit` bytes.
class HttpClient_Beast
{
 public:
  HttpClient_Beast(TcpConnector connector, application::ports::ILogger& log, int maxRedirects = 3);

  // nullopt on transport failure (connect, TLS, timeout, malformed response)
  boost::asio::awaitable<std::optional<HttpResponse>> head(std::string url,
                                                           std::chrono::milliseconds timeout);

  boost::asio::awaitable<std::optional<HttpResponse>> get(std::string url,
                                                          std::chrono::milliseconds timeout,
                                                          std::size_t bodyLimit);

 private:
  boost::asio::awaitable<std::optional<HttpResponse>> request(boost::beast::http::verb verb,
                                                              std::string url,
                                                              std::chrono::milliseconds timeout,
                                                              std::size_t bodyLimit);

  boost::asio::awaitable<std::optional<HttpResponse>> request_once(
      boost::beast::http::verb verb, Url url, std::chrono::steady_clock::time_point deadline,
      std::size_t bodyLimit);

  static std::optional<Url> follow(const Url& base, const std::string& location);

  TcpConnector connector_;
  application::ports::ILogger& log_;
  int max_redirects_;
  boost::asio::ssl::context tls_;
};

}  // namespace streamscout::infrastructure::net
