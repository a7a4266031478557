#include "infrastructure/net/Url.hpp"

#include <charconv>

#include "shared/text/Text.hpp"

namespace streamscout::infrastructure::net
{

uint16_t Url::default_port(std::string_view scheme) noexcept
{
  if (scheme == "http" || scheme == "ws") return 80;
  if (scheme == "https" || scheme == "wss") return 443;
  if (scheme == "rtsp") return 554;
  if (scheme == "rtmp") return 1935;
  return 0;
}

std::string Url::authority() const
{
  return host + ":" + std::to_string(port);
}

std::string Url::str() const
{
  return scheme + "://" + authority() + target;
}

std::string Url::compose(std::string_view scheme, std::string_view host, uint16_t port,
                         std::string_view path)
{
  while (!path.empty() && path.front() == '/') path.remove_prefix(1);

  std::string out;
  out.reserve(scheme.size() + host.size() + path.size() + 10);
  out.append(scheme).append("://").append(host).append(":").append(std::to_string(port));
  out.append("/").append(path);
  return out;
}

std::optional<Url> Url::parse(std::string_view text)
{
  const auto sep = text.find("://");
  if (sep == std::string_view::npos || sep == 0) return std::nullopt;

  Url u;
  u.scheme = shared::text::to_lower(text.substr(0, sep));
  auto rest = text.substr(sep + 3);

  const auto slash = rest.find_first_of("/?#");
  auto authority = rest.substr(0, slash);
  u.target = slash == std::string_view::npos ? std::string{"/"} : std::string{rest.substr(slash)};
  if (u.target.front() != '/') u.target.insert(u.target.begin(), '/');

  // strip userinfo
  if (auto at = authority.rfind('@'); at != std::string_view::npos)
    authority = authority.substr(at + 1);

  std::string_view port_text;
  if (!authority.empty() && authority.front() == '[')
  {
    const auto close = authority.find(']');
    if (close == std::string_view::npos) return std::nullopt;
    u.host = std::string{authority.substr(1, close - 1)};
    if (close + 1 < authority.size())
    {
      if (authority[close + 1] != ':') return std::nullopt;
      port_text = authority.substr(close + 2);
    }
  }
  else
  {
    const auto colon = authority.rfind(':');
    u.host = std::string{authority.substr(0, colon)};
    if (colon != std::string_view::npos) port_text = authority.substr(colon + 1);
  }
  if (u.host.empty()) return std::nullopt;

  if (!port_text.empty())
  {
    unsigned v = 0;
    auto [p, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), v);
    if (ec != std::errc{} || p != port_text.data() + port_text.size() || v == 0 || v > 65535)
      return std::nullopt;
    u.port = static_cast<uint16_t>(v);
  }
  else
  {
    u.port = default_port(u.scheme);
    if (u.port == 0) return std::nullopt;
  }
  return u;
}

}  // namespace streamscout::infrastructure::net
