#include "infrastructure/probe/ProtocolProber_Asio.hpp"

#include "domain/protocol/ContentRules.hpp"
#include "infrastructure/net/Url.hpp"
#include "shared/async/Delay.hpp"
#include "shared/text/Text.hpp"

using streamscout::application::ports::LogLevel;
using streamscout::domain::Confidence;
using streamscout::domain::ProbeStrategy;
using streamscout::domain::ProtocolSpec;
using streamscout::domain::StreamCandidate;
using streamscout::domain::protocol::ContentRules;
using streamscout::domain::protocol::ContentVerdict;

namespace streamscout::infrastructure::probe
{
namespace asio = boost::asio;

namespace
{
std::vector<std::string> schemes_of(const ProtocolSpec& spec)
{
  if (!spec.schemes.empty()) return spec.schemes;
  switch (spec.strategy)
  {
    case ProbeStrategy::rtsp:      return {"rtsp"};
    case ProbeStrategy::rtmp:      return {"rtmp"};
    case ProbeStrategy::websocket: return {"ws"};
    default:                       return {"http"};
  }
}

// "live" + "index.m3u8" -> "live/index.m3u8"; no variants -> the path itself
std::vector<std::string> targets_of(const ProtocolSpec& spec)
{
  if (spec.variants.empty()) return spec.paths;

  std::vector<std::string> out;
  out.reserve(spec.paths.size() * spec.variants.size());
  for (const auto& p : spec.paths)
  {
    std::string base = p;
    while (!base.empty() && base.back() == '/') base.pop_back();
    for (const auto& v : spec.variants) out.push_back(base.empty() ? v : base + "/" + v);
  }
  return out;
}
}  // namespace

ProtocolProber_Asio::ProtocolProber_Asio(application::ports::IConnectivityProbe& connectivity,
                                         net::HttpClient_Beast& http, RtspProbe& rtsp,
                                         WebSocketProbe& ws, application::ports::ILogger& log,
                                         std::chrono::milliseconds retryDelay)
    : connectivity_(connectivity), http_(http), rtsp_(rtsp), ws_(ws), log_(log),
      retry_delay_(retryDelay)
{
}

asio::awaitable<std::vector<StreamCandidate>> ProtocolProber_Asio::probe(const ProtocolSpec& spec,
                                                                        std::string host,
                                                                        uint16_t port)
{
  if (spec.strategy == ProbeStrategy::rtmp) co_return co_await probe_rtmp(spec, host, port);

  std::vector<StreamCandidate> found;
  const auto targets = targets_of(spec);

  for (const auto& scheme : schemes_of(spec))
  {
    for (const auto& target : targets)
    {
      const std::string url = net::Url::compose(scheme, host, port, target);

      Attempt attempt;
      switch (spec.strategy)
      {
        case ProbeStrategy::rtsp:
          attempt = [&]() { return check_rtsp(spec, host, port, url); };
          break;
        case ProbeStrategy::hls:
          attempt = [&]() { return check_hls(spec, url); };
          break;
        case ProbeStrategy::dash:
          attempt = [&]() { return check_dash(spec, url); };
          break;
        case ProbeStrategy::websocket:
          attempt = [&]() { return ws_.subscribe(scheme, host, port, target, spec.timeout); };
          break;
        case ProbeStrategy::http:
        case ProbeStrategy::rtmp:
          attempt = [&]() { return check_http(spec, url); };
          break;
      }

      const auto verdict = co_await with_retries(spec.retries, attempt);
      if (verdict == Verdict::confirmed)
      {
        log_.app(LogLevel::info, "Found " + spec.name + " stream: " + url);
        found.push_back({url, spec.name, Confidence::confirmed});
      }
    }
  }

  co_return found;
}

asio::awaitable<Verdict> ProtocolProber_Asio::with_retries(int attempts, const Attempt& attempt)
{
  Verdict v = Verdict::unreachable;
  for (int i = 1; i <= (attempts < 1 ? 1 : attempts); ++i)
  {
    if (i > 1) co_await shared::async::delay(retry_delay_);
    v = co_await attempt();
    if (v != Verdict::unreachable) break;
  }
  co_return v;
}

asio::awaitable<Verdict> ProtocolProber_Asio::check_rtsp(const ProtocolSpec& spec,
                                                         const std::string& host, uint16_t port,
                                                         const std::string& url)
{
  const auto reply = co_await rtsp_.options(host, port, url, spec.timeout);
  co_return reply.verdict;
}

asio::awaitable<Verdict> ProtocolProber_Asio::check_hls(const ProtocolSpec& spec,
                                                        const std::string& url)
{
  const auto res = co_await http_.get(url, spec.timeout, ContentRules::kSniffWindow);
  if (!res) co_return Verdict::unreachable;
  if (res->status != 200) co_return Verdict::rejected;

  const std::string_view marker = spec.signature.empty() ? "#EXTM3U" : spec.signature;
  co_return ContentRules::is_hls_playlist(res->body, marker) ? Verdict::confirmed
                                                              : Verdict::rejected;
}

asio::awaitable<Verdict> ProtocolProber_Asio::check_dash(const ProtocolSpec& spec,
                                                         const std::string& url)
{
  const auto res = co_await http_.get(url, spec.timeout, ContentRules::kSniffWindow);
  if (!res) co_return Verdict::unreachable;
  if (res->status != 200) co_return Verdict::rejected;

  const std::string_view prologue = spec.signature.empty() ? "<?xml" : spec.signature;
  co_return ContentRules::is_dash_manifest(res->body, prologue) ? Verdict::confirmed
                                                                 : Verdict::rejected;
}

asio::awaitable<Verdict> ProtocolProber_Asio::check_http(const ProtocolSpec& spec,
                                                         const std::string& url)
{
  const auto head = co_await http_.head(url, spec.timeout);
  if (head && head->ok() &&
      ContentRules::classify_content_type(head->contentType, spec.contentTypes) ==
          ContentVerdict::video)
  {
    co_return Verdict::confirmed;
  }
  if (head && head->ok() &&
      ContentRules::classify_content_type(head->contentType, spec.contentTypes) ==
          ContentVerdict::other)
  {
    // a definite non-media type (html, json, ...) is not worth a GET
    co_return Verdict::rejected;
  }

  // non-2xx, ambiguous type, or HEAD not supported: sniff the body
  const auto res = co_await http_.get(url, spec.timeout, ContentRules::kSniffWindow);
  if (!res) co_return Verdict::unreachable;
  if (!res->ok()) co_return Verdict::rejected;

  if (ContentRules::is_video_content_type(res->contentType, spec.contentTypes) ||
      ContentRules::sniff_media(res->body))
  {
    co_return Verdict::confirmed;
  }

  log_.net(LogLevel::trace, "[Prober] " + url + " [" + res->contentType + "] " +
                                shared::text::hex_preview(res->body));
  co_return Verdict::rejected;
}

asio::awaitable<std::vector<StreamCandidate>> ProtocolProber_Asio::probe_rtmp(
    const ProtocolSpec& spec, const std::string& host, uint16_t port)
{
  std::vector<StreamCandidate> found;
  if (!co_await connectivity_.is_reachable(host, port, spec.timeout)) co_return found;

  for (const auto& scheme : schemes_of(spec))
  {
    for (const auto& path : spec.paths)
    {
      auto url = net::Url::compose(scheme, host, port, path);
      log_.app(LogLevel::info, "Found potential " + spec.name + " endpoint: " + url);
      found.push_back({std::move(url), spec.name, Confidence::reachable_only});
    }
  }
  co_return found;
}

}  // namespace streamscout::infrastructure::probe
