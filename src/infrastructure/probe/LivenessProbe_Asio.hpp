#pragma once

#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "application/ports/ILivenessProbe.hpp"
#include "application/ports/ILogger.hpp"
#include "domain/Settings.hpp"
#include "infrastructure/net/HttpClient_Beast.hpp"
#include "infrastructure/probe/RtspProbe.hpp"

namespace streamscout::infrastructure::probe
{

// Liveness by URL scheme:
//  - http/https: GET a bounded sample; 2xx plus a video content type or a media signature,
//    and an HLS playlist must list segments or variants
//  - rtsp: OPTIONS answered with 200
//  - anything else (rtmp, ws, wss) cannot be content-verified and never passes
class LivenessProbe_Asio final : public streamscout::application::ports::ILivenessProbe
{
 public:
  LivenessProbe_Asio(net::HttpClient_Beast& http, RtspProbe& rtsp,
                     streamscout::application::ports::ILogger& log,
                     const domain::Settings::Monitor& cfg, std::vector<std::string> videoTypes);

  // ILivenessProbe
  boost::asio::awaitable<std::optional<streamscout::application::ports::LivenessSample>> verify(
      std::string url) override;

 private:
  net::HttpClient_Beast& http_;
  RtspProbe& rtsp_;
  streamscout::application::ports::ILogger& log_;
  std::chrono::milliseconds timeout_;
  std::size_t sample_bytes_;
  std::vector<std::string> video_types_;
};

}  // namespace streamscout::infrastructure::probe
