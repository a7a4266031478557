#include "infrastructure/probe/LivenessProbe_Asio.hpp"

#include "domain/protocol/ContentRules.hpp"
#include "infrastructure/net/Url.hpp"

using streamscout::application::ports::LivenessSample;
using streamscout::application::ports::LogLevel;
using streamscout::domain::protocol::ContentRules;

namespace streamscout::infrastructure::probe
{
namespace asio = boost::asio;

LivenessProbe_Asio::LivenessProbe_Asio(net::HttpClient_Beast& http, RtspProbe& rtsp,
                                       application::ports::ILogger& log,
                                       const domain::Settings::Monitor& cfg,
                                       std::vector<std::string> videoTypes)
    : http_(http), rtsp_(rtsp), log_(log), timeout_(cfg.probeTimeoutMs),
      sample_bytes_(cfg.sampleBytes), video_types_(std::move(videoTypes))
{
}

asio::awaitable<std::optional<LivenessSample>> LivenessProbe_Asio::verify(std::string url)
{
  const auto parsed = net::Url::parse(url);
  if (!parsed)
  {
    log_.net(LogLevel::debug, "[Liveness] unparsable url " + url);
    co_return std::nullopt;
  }

  if (parsed->scheme == "http" || parsed->scheme == "https")
  {
    const auto res = co_await http_.get(url, timeout_, sample_bytes_);
    if (!res || !res->ok()) co_return std::nullopt;

    if (!ContentRules::is_video_content_type(res->contentType, video_types_) &&
        !ContentRules::sniff_media(res->body))
    {
      log_.net(LogLevel::trace, "[Liveness] " + url + " answered [" + res->contentType +
                                    "] without media content");
      co_return std::nullopt;
    }
    // a playlist without segment or variant entries is an idle channel
    if (ContentRules::is_hls_playlist(res->body) && !ContentRules::is_active_playlist(res->body))
    {
      log_.net(LogLevel::trace, "[Liveness] " + url + " serves an empty playlist");
      co_return std::nullopt;
    }
    co_return LivenessSample{res->contentType, res->body.size()};
  }

  if (parsed->scheme == "rtsp")
  {
    const auto reply = co_await rtsp_.options(parsed->host, parsed->port, url, timeout_);
    if (reply.verdict != Verdict::confirmed) co_return std::nullopt;
    co_return LivenessSample{"application/x-rtsp", reply.bytes};
  }

  log_.net(LogLevel::trace, "[Liveness] " + parsed->scheme + " is not content-verifiable: " + url);
  co_return std::nullopt;
}

}  // namespace streamscout::infrastructure::probe
