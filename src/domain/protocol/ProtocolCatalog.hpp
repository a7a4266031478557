#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "domain/ProtocolSpec.hpp"

namespace streamscout::domain::protocol
{

// Read-only table of streaming protocols: where to look and how long to wait.
// The catalog is the single extension point for new protocols and paths; strategies are
// selected by ProtocolSpec::strategy, never by name.
class ProtocolCatalog
{
 public:
  static constexpr std::chrono::milliseconds kUnknownTimeout{5000};

  ProtocolCatalog() = default;
  explicit ProtocolCatalog(std::vector<ProtocolSpec> specs);

  static std::vector<ProtocolSpec> default_specs();

  // Content-type substrings that identify streaming media
  static const std::vector<std::string>& video_content_types();
  static ProtocolCatalog defaults() { return ProtocolCatalog{default_specs()}; }

  const std::vector<ProtocolSpec>& specs() const noexcept { return specs_; }
  bool empty() const noexcept { return specs_.empty(); }

  // nullptr when the protocol is not in the catalog
  const ProtocolSpec* find(std::string_view name) const noexcept;

  std::vector<uint16_t> ports_for(std::string_view name) const;
  std::vector<std::string> paths_for(std::string_view name) const;
  std::chrono::milliseconds timeout_for(std::string_view name) const;

  // Union of every candidate port, ascending.
  std::vector<uint16_t> all_ports() const;

  // Drops port 0 and repeated ports while keeping the declared order.
  static void normalize(ProtocolSpec& spec);

 private:
  std::vector<ProtocolSpec> specs_;
};

}  // namespace streamscout::domain::protocol
