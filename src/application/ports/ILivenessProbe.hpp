#pragma once

#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <cstddef>
#include <optional>
#include <string>

namespace streamscout::application::ports
{

struct LivenessSample
{
  std::string contentType;
  std::size_t size{0};
};

struct ILivenessProbe
{
  virtual ~ILivenessProbe() = default;

  // nullopt when the URL did not answer like a live stream
  virtual boost::asio::awaitable<std::optional<LivenessSample>> verify(std::string url) = 0;
};

}  // namespace streamscout::application::ports
