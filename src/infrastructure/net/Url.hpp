#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace streamscout::infrastructure::net
{

struct Url
{
  std::string scheme;  // lower-case
  std::string host;
  uint16_t port{0};    // explicit or scheme default
  std::string target{"/"};

  bool secure() const noexcept { return scheme == "https" || scheme == "wss"; }

  // "host:port", the form HTTP Host headers and WebSocket handshakes use
  std::string authority() const;
  std::string str() const;

  static std::optional<Url> parse(std::string_view text);
  static uint16_t default_port(std::string_view scheme) noexcept;

  // "{scheme}://{host}:{port}/{path}" with a single separating slash
  static std::string compose(std::string_view scheme, std::string_view host, uint16_t port,
                             std::string_view path);
};

}  // namespace streamscout::infrastructure::net
