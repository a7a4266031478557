#pragma once

#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <cstdint>
#include <string>

#include "shared/async/AsyncGate.hpp"

namespace streamscout::infrastructure::net
{

// Resolves and connects a beast::tcp_stream. The caller arms the stream deadline first; the
// connect runs under it. When a gate is set, one slot is held for the duration of the connect.
class TcpConnector
{
 public:
  explicit TcpConnector(shared::async::AsyncGate* gate = nullptr) : gate_(gate) {}

  boost::asio::awaitable<boost::beast::error_code> connect(boost::beast::tcp_stream& stream,
                                                           std::string host, uint16_t port) const;

  shared::async::AsyncGate* gate() const noexcept { return gate_; }

 private:
  shared::async::AsyncGate* gate_;
};

}  // namespace streamscout::infrastructure::net
