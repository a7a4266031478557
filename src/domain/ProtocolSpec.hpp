#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace streamscout::domain
{

enum class ProbeStrategy
{
  rtsp,
  hls,
  dash,
  http,
  rtmp,
  websocket
};

// RTMP endpoints are inferred from an open port only.
enum class Confidence
{
  confirmed,
  reachable_only
};

struct ProtocolSpec
{
  std::string name;
  ProbeStrategy strategy{ProbeStrategy::http};
  std::vector<std::string> schemes;
  std::vector<uint16_t> ports;
  std::vector<std::string> paths;
  std::vector<std::string> variants;  // appended to each path (manifest file names)
  std::string signature;              // expected leading bytes of a valid answer
  std::vector<std::string> contentTypes;
  std::chrono::milliseconds timeout{5000};
  int retries{1};
};

struct StreamCandidate
{
  std::string url;
  std::string protocol;
  Confidence confidence{Confidence::confirmed};

  // URL is the identity of a candidate
  bool operator<(const StreamCandidate& o) const noexcept { return url < o.url; }
  bool operator==(const StreamCandidate& o) const noexcept { return url == o.url; }
};

inline const char* to_string(ProbeStrategy s)
{
  switch (s)
  {
    case ProbeStrategy::rtsp:      return "rtsp";
    case ProbeStrategy::hls:       return "hls";
    case ProbeStrategy::dash:      return "dash";
    case ProbeStrategy::http:      return "http";
    case ProbeStrategy::rtmp:      return "rtmp";
    case ProbeStrategy::websocket: return "websocket";
  }
  return "http";
}

inline std::optional<ProbeStrategy> strategy_from_string(std::string_view s)
{
  if (s == "rtsp") return ProbeStrategy::rtsp;
  if (s == "hls") return ProbeStrategy::hls;
  if (s == "dash") return ProbeStrategy::dash;
  if (s == "http") return ProbeStrategy::http;
  if (s == "rtmp") return ProbeStrategy::rtmp;
  if (s == "websocket" || s == "ws") return ProbeStrategy::websocket;
  return std::nullopt;
}

inline const char* to_string(Confidence c)
{
  return c == Confidence::confirmed ? "confirmed" : "reachable-only";
}

}  // namespace streamscout::domain
