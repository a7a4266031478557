#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace streamscout::shared::text
{

// -----------------------------------------------------------------------------
// to_lower(s)
// -----------------------------------------------------------------------------
inline std::string to_lower(std::string_view s)
{
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

// -----------------------------------------------------------------------------
// contains / icontains / starts_with
// -----------------------------------------------------------------------------
inline bool contains(std::string_view hay, std::string_view needle)
{
  return !needle.empty() && hay.find(needle) != std::string_view::npos;
}

inline bool icontains(std::string_view hay, std::string_view needle)
{
  if (needle.empty() || needle.size() > hay.size()) return false;
  auto it = std::search(hay.begin(), hay.end(), needle.begin(), needle.end(),
                        [](unsigned char a, unsigned char b)
                        { return std::tolower(a) == std::tolower(b); });
  return it != hay.end();
}

// search restricted to the first `window` bytes
inline bool contains_within(std::string_view hay, std::string_view needle, std::size_t window)
{
  return contains(hay.substr(0, (std::min)(window, hay.size())), needle);
}

inline bool starts_with(std::string_view s, std::string_view prefix)
{
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

// -----------------------------------------------------------------------------
// join(items, sep)
// -----------------------------------------------------------------------------
template <typename Seq>
inline std::string join(const Seq& items, std::string_view sep = ", ")
{
  std::ostringstream oss;
  bool first = true;
  for (const auto& v : items)
  {
    if (!first) oss << sep;
    oss << v;
    first = false;
  }
  return oss.str();
}

// -----------------------------------------------------------------------------
// hex_preview(data, max_len)
//  - first bytes of a body sample, for net-channel diagnostics
// -----------------------------------------------------------------------------
inline std::string hex_preview(std::string_view data, std::size_t max_len = 16)
{
  std::ostringstream oss;
  oss << std::hex << std::uppercase << std::setfill('0');

  const std::size_t take = (std::min)(max_len, data.size());
  for (std::size_t i = 0; i < take; ++i)
  {
    oss << std::setw(2) << static_cast<unsigned int>(static_cast<unsigned char>(data[i])) << ' ';
  }
  if (take < data.size()) oss << "...(" << std::dec << data.size() << " bytes total)";
  return oss.str();
}

}  // namespace streamscout::shared::text
