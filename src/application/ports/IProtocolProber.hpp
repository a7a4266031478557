#pragma once

#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <cstdint>
#include <string>
#include <vector>

#include "domain/ProtocolSpec.hpp"

namespace streamscout::application::ports
{

struct IProtocolProber
{
  virtual ~IProtocolProber() = default;

  // Turns a reachable (host, port) into the stream URLs the protocol handshake confirmed.
  // Connection failures, timeouts and rejections yield an empty result, never an exception.
  virtual boost::asio::awaitable<std::vector<streamscout::domain::StreamCandidate>> probe(
      const streamscout::domain::ProtocolSpec& spec, std::string host, uint16_t port) = 0;
};

}  // namespace streamscout::application::ports
