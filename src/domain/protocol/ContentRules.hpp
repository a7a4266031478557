#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace streamscout::domain::protocol
{

enum class ContentVerdict
{
  video,      // content type names a streaming format
  ambiguous,  // generic binary / text / missing: needs a body sniff
  other
};

// Heuristic classification of what an endpoint answered.
struct ContentRules
{
  static constexpr std::size_t kSniffWindow = 16 * 1024;
  static constexpr std::size_t kBinaryHeaderWindow = 1024;

  // `known` is the catalog's list of video content-type substrings
  static ContentVerdict classify_content_type(std::string_view contentType,
                                              const std::vector<std::string>& known);

  static bool is_video_content_type(std::string_view contentType,
                                    const std::vector<std::string>& known);

  // Container signatures (ftyp/moov/mdat, WebM/Matroska, FLV, MPEG-TS)
  static bool has_binary_media_signature(std::string_view body);

  // Playlist / manifest text markers
  static bool has_text_media_marker(std::string_view body);

  static bool sniff_media(std::string_view body)
  {
    return has_binary_media_signature(body) || has_text_media_marker(body);
  }

  static bool is_hls_playlist(std::string_view body, std::string_view marker = "#EXTM3U");

  // A playlist that actually lists variants or segments
  static bool is_active_playlist(std::string_view body);

  static bool is_dash_manifest(std::string_view body, std::string_view prologue = "<?xml");

  static bool is_rtsp_ok(std::string_view response);
};

}  // namespace streamscout::domain::protocol
