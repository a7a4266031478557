#pragma once

#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl/context.hpp>
#include <chrono>
#include <cstdint>
#include <string>

#include "application/ports/ILogger.hpp"
#include "infrastructure/net/TcpConnector.hpp"
#include "infrastructure/probe/RtspProbe.hpp"

namespace streamscout::infrastructure::probe
{

// Opens a ws:// or wss:// connection, sends a subscribe message and waits for any reply
// until the deadline.
class WebSocketProbe
{
 public:
  static constexpr const char* kSubscribeMessage = R"({"type":"subscribe","channel":"stream"})";

  WebSocketProbe(net::TcpConnector connector, application::ports::ILogger& log);

  boost::asio::awaitable<Verdict> subscribe(std::string scheme, std::string host, uint16_t port,
                                            std::string target, std::chrono::milliseconds timeout);

 private:
  net::TcpConnector connector_;
  application::ports::ILogger& log_;
  boost::asio::ssl::context tls_;
};

}  // namespace streamscout::infrastructure::probe
