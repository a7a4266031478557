#pragma once

#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <cstdint>
#include <string>

namespace streamscout::application::ports
{

struct ConnectPolicy
{
  int attempts{2};  // clamped to [1, 2]
  std::chrono::milliseconds retryDelay{250};
};

struct IConnectivityProbe
{
  virtual ~IConnectivityProbe() = default;

  // true when host:port accepted a TCP connection within `timeout`; every failure reason
  // (timeout, refused, unreachable, resolution) reads as false
  virtual boost::asio::awaitable<bool> is_reachable(std::string host, uint16_t port,
                                                    std::chrono::milliseconds timeout) = 0;
};

}  // namespace streamscout::application::ports
