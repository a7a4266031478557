#include "domain/protocol/ProtocolCatalog.hpp"

#include <algorithm>
#include <set>

namespace streamscout::domain::protocol
{

namespace
{
using std::chrono::milliseconds;

const std::vector<std::string> kVideoContentTypes = {
    "video/",
    "application/x-mpegurl",
    "application/vnd.apple.mpegurl",
    "application/dash+xml",
    "application/x-rtsp",
    "application/x-rtmp",
    "application/x-flv",
    "application/x-fcs",
};

ProtocolSpec make(std::string name, ProbeStrategy strategy, std::vector<std::string> schemes,
                  std::vector<uint16_t> ports, std::vector<std::string> paths,
                  std::vector<std::string> variants, std::string signature, milliseconds timeout,
                  int retries)
{
  ProtocolSpec s;
  s.name = std::move(name);
  s.strategy = strategy;
  s.schemes = std::move(schemes);
  s.ports = std::move(ports);
  s.paths = std::move(paths);
  s.variants = std::move(variants);
  s.signature = std::move(signature);
  s.contentTypes = kVideoContentTypes;
  s.timeout = timeout;
  s.retries = retries;
  return s;
}
}  // namespace

ProtocolCatalog::ProtocolCatalog(std::vector<ProtocolSpec> specs) : specs_(std::move(specs))
{
  for (auto& s : specs_) normalize(s);
}

const std::vector<std::string>& ProtocolCatalog::video_content_types()
{
  return kVideoContentTypes;
}

std::vector<ProtocolSpec> ProtocolCatalog::default_specs()
{
  std::vector<ProtocolSpec> v;

  v.push_back(make("rtsp", ProbeStrategy::rtsp, {"rtsp"}, {554, 8554},
                   {"live", "stream", "cam", "video0", "video1", "h264", "mpeg4", "media",
                    "videoMain", "video1+audio1", "primary", "track1", "ch01", "ch1", "sub",
                    "main", "av0_0", "av0_1", "streaming"},
                   {}, "RTSP/1.0", milliseconds(5000), 3));

  v.push_back(make("http", ProbeStrategy::http, {"http"}, {80, 8080, 8000, 8800, 8888, 3000, 5000},
                   {"stream", "live", "hls", "dash", "channel", "video", "mobile/stream",
                    "mobile/live", "mobile/playlist"},
                   {}, "", milliseconds(8000), 1));

  v.push_back(make("https", ProbeStrategy::http, {"https"}, {443, 8443, 4443},
                   {"stream", "live", "hls", "dash", "channel", "video", "mobile/stream",
                    "mobile/live", "mobile/playlist"},
                   {}, "", milliseconds(8000), 1));

  v.push_back(make("hls", ProbeStrategy::hls, {"http"}, {8081, 1935, 8082, 8083},
                   {"hls", "live", "stream", "streaming", "playlist", "channel", "live/stream",
                    "live/channel1", "video", "media", "content", "stream1", "stream2", "ch1",
                    "ch2", "feed1", "feed2", "mobile/stream"},
                   {"index.m3u8", "playlist.m3u8", "master.m3u8"}, "#EXTM3U", milliseconds(8000),
                   3));

  v.push_back(make("dash", ProbeStrategy::dash, {"http"}, {80, 8080, 8081},
                   {"dash", "stream", "live", "content", "media", "channel", "video", "streaming",
                    "manifest", "mpd", "output"},
                   {"manifest.mpd", "stream.mpd", "index.mpd"}, "<?xml", milliseconds(8000), 3));

  v.push_back(make("rtmp", ProbeStrategy::rtmp, {"rtmp"}, {1935, 1936, 1937},
                   {"live", "stream", "app", "broadcast", "channel", "streaming", "live/stream",
                    "media", "content"},
                   {}, "", milliseconds(5000), 1));

  v.push_back(make("websocket", ProbeStrategy::websocket, {"ws", "wss"},
                   {8084, 8085, 8086, 8443, 4443},
                   {"ws", "stream", "live", "websocket", "mobile/stream"}, {}, "",
                   milliseconds(8000), 1));

  for (auto& s : v) normalize(s);
  return v;
}

void ProtocolCatalog::normalize(ProtocolSpec& spec)
{
  std::vector<uint16_t> out;
  out.reserve(spec.ports.size());
  std::set<uint16_t> seen;
  for (auto p : spec.ports)
  {
    if (p == 0) continue;
    if (seen.insert(p).second) out.push_back(p);
  }
  spec.ports = std::move(out);
  if (spec.retries < 1) spec.retries = 1;
}

const ProtocolSpec* ProtocolCatalog::find(std::string_view name) const noexcept
{
  for (const auto& s : specs_)
  {
    if (s.name == name) return &s;
  }
  return nullptr;
}

std::vector<uint16_t> ProtocolCatalog::ports_for(std::string_view name) const
{
  if (auto s = find(name)) return s->ports;
  return {};
}

std::vector<std::string> ProtocolCatalog::paths_for(std::string_view name) const
{
  if (auto s = find(name)) return s->paths;
  return {};
}

std::chrono::milliseconds ProtocolCatalog::timeout_for(std::string_view name) const
{
  if (auto s = find(name)) return s->timeout;
  return kUnknownTimeout;
}

std::vector<uint16_t> ProtocolCatalog::all_ports() const
{
  std::set<uint16_t> all;
  for (const auto& s : specs_) all.insert(s.ports.begin(), s.ports.end());
  return {all.begin(), all.end()};
}

}  // namespace streamscout::domain::protocol
