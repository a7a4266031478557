#include "domain/protocol/ContentRules.hpp"

#include <algorithm>

#include "shared/text/Text.hpp"

namespace streamscout::domain::protocol
{
namespace text = streamscout::shared::text;

namespace
{
// generic types servers use for everything; never proof of a stream on their own
constexpr std::string_view kAmbiguousTypes[] = {
    "application/octet-stream", "binary/octet-stream", "text/plain", "application/xml",
    "text/xml",
};

constexpr std::string_view kBinarySignatures[] = {"ftyp", "moov", "mdat", "webm", "matroska", "FLV"};

constexpr unsigned char kTsSync = 0x47;
constexpr std::size_t kTsPacket = 188;
}  // namespace

ContentVerdict ContentRules::classify_content_type(std::string_view contentType,
                                                   const std::vector<std::string>& known)
{
  if (contentType.empty()) return ContentVerdict::ambiguous;

  const auto ct = text::to_lower(contentType);
  for (const auto& k : known)
  {
    if (text::contains(ct, text::to_lower(k))) return ContentVerdict::video;
  }
  for (auto a : kAmbiguousTypes)
  {
    if (text::contains(ct, a)) return ContentVerdict::ambiguous;
  }
  return ContentVerdict::other;
}

bool ContentRules::is_video_content_type(std::string_view contentType,
                                         const std::vector<std::string>& known)
{
  return classify_content_type(contentType, known) == ContentVerdict::video;
}

bool ContentRules::has_binary_media_signature(std::string_view body)
{
  if (body.empty()) return false;

  for (auto sig : kBinarySignatures)
  {
    if (text::contains_within(body, sig, kBinaryHeaderWindow)) return true;
  }

  // MPEG-TS: sync byte repeated on packet boundaries
  if (body.size() > kTsPacket && static_cast<unsigned char>(body[0]) == kTsSync &&
      static_cast<unsigned char>(body[kTsPacket]) == kTsSync)
    return true;

  return false;
}

bool ContentRules::has_text_media_marker(std::string_view body)
{
  const auto window = body.substr(0, (std::min)(kSniffWindow, body.size()));
  return text::contains(window, "#EXT") || is_dash_manifest(window);
}

bool ContentRules::is_hls_playlist(std::string_view body, std::string_view marker)
{
  return text::contains(body, marker.empty() ? std::string_view{"#EXTM3U"} : marker);
}

bool ContentRules::is_active_playlist(std::string_view body)
{
  return is_hls_playlist(body) &&
         (text::contains(body, "#EXT-X-STREAM-INF") || text::contains(body, "#EXTINF"));
}

bool ContentRules::is_dash_manifest(std::string_view body, std::string_view prologue)
{
  if (!text::contains(body, prologue.empty() ? std::string_view{"<?xml"} : prologue)) return false;
  return text::contains(body, "MPD") || text::icontains(body, "manifest");
}

bool ContentRules::is_rtsp_ok(std::string_view response)
{
  return text::contains(response, "RTSP/1.0 200") || text::contains(response, "RTSP/1.1 200");
}

}  // namespace streamscout::domain::protocol
