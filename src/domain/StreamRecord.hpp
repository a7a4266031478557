#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace streamscout::domain
{

using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

enum class StreamState
{
  unverified,
  active,
  expired
};

struct ActiveStreamRecord
{
  std::string url;
  std::string contentType;
  Timestamp firstSeen{};
  Timestamp lastActive{};
  std::size_t size{0};  // bytes read by the last successful verification
  bool active{true};

  bool operator==(const ActiveStreamRecord&) const = default;
};

inline const char* to_string(StreamState s)
{
  switch (s)
  {
    case StreamState::unverified: return "unverified";
    case StreamState::active:     return "active";
    case StreamState::expired:    return "expired";
  }
  return "unverified";
}

}  // namespace streamscout::domain
