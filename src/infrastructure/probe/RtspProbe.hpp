#pragma once

#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "application/ports/ILogger.hpp"
#include "infrastructure/net/TcpConnector.hpp"

namespace streamscout::infrastructure::probe
{

enum class Verdict
{
  confirmed,    // the endpoint answered the way a stream does
  rejected,     // it answered, but not with a stream
  unreachable   // connect failed, timed out or the exchange was cut
};

struct RtspReply
{
  Verdict verdict{Verdict::unreachable};
  std::string statusLine;
  std::size_t bytes{0};
};

// One RTSP OPTIONS exchange on a fresh connection; the connection is closed on return.
class RtspProbe
{
 public:
  static constexpr std::size_t kMaxResponse = 4096;

  RtspProbe(net::TcpConnector connector, application::ports::ILogger& log)
      : connector_(connector), log_(log)
  {
  }

  boost::asio::awaitable<RtspReply> options(std::string host, uint16_t port, std::string url,
                                            std::chrono::milliseconds timeout);

 private:
  net::TcpConnector connector_;
  application::ports::ILogger& log_;
  unsigned cseq_{0};
};

}  // namespace streamscout::infrastructure::probe
