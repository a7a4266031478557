#include "infrastructure/probe/RtspProbe.hpp"

#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/buffer.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/tcp_stream.hpp>

#include "domain/protocol/ContentRules.hpp"

using streamscout::application::ports::LogLevel;
using streamscout::domain::protocol::ContentRules;

namespace streamscout::infrastructure::probe
{
namespace asio = boost::asio;
namespace beast = boost::beast;

boost::asio::awaitable<RtspReply> RtspProbe::options(std::string host, uint16_t port,
                                                     std::string url,
                                                     std::chrono::milliseconds timeout)
{
  RtspReply reply;

  beast::tcp_stream stream(co_await asio::this_coro::executor);
  stream.expires_after(timeout);

  if (auto ec = co_await connector_.connect(stream, host, port))
  {
    log_.net(LogLevel::trace, "[Rtsp] connect " + url + ": " + ec.message());
    co_return reply;
  }

  const std::string req = "OPTIONS " + url + " RTSP/1.0\r\n" + "CSeq: " + std::to_string(++cseq_) +
                          "\r\n" + "User-Agent: streamscout/1.0\r\n\r\n";

  beast::error_code ec;
  co_await asio::async_write(stream, asio::buffer(req), asio::redirect_error(asio::use_awaitable, ec));
  if (ec)
  {
    log_.net(LogLevel::trace, "[Rtsp] write " + url + ": " + ec.message());
    co_return reply;
  }

  std::string data;
  co_await asio::async_read_until(stream, asio::dynamic_buffer(data, kMaxResponse), "\r\n\r\n",
                                  asio::redirect_error(asio::use_awaitable, ec));

  // a status line that arrived before eof/limit still counts
  reply.bytes = data.size();
  reply.statusLine = data.substr(0, data.find("\r\n"));

  if (ContentRules::is_rtsp_ok(data))
  {
    reply.verdict = Verdict::confirmed;
  }
  else if (data.find("\r\n") == std::string::npos)
  {
    // nothing or a cut status line: treat as a transport failure so it can be retried
    log_.net(LogLevel::trace, "[Rtsp] no answer " + url + ": " + ec.message());
  }
  else if (data.rfind("RTSP/", 0) == 0)
  {
    reply.verdict = Verdict::rejected;
    log_.net(LogLevel::trace, "[Rtsp] " + url + " -> " + reply.statusLine);
  }
  else
  {
    // something else listens on this port
    reply.verdict = Verdict::rejected;
  }

  beast::error_code ignored;
  stream.socket().shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
  stream.close();
  co_return reply;
}

}  // namespace streamscout::infrastructure::probe
