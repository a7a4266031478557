#pragma once

#include <string>
#include <vector>

#include "application/ports/ILogger.hpp"

namespace streamscout::infrastructure::net
{

// Expands scan targets into the host list.
struct NetworkRange
{
  // Smallest accepted prefix; wider ranges are rejected to keep scans local.
  static constexpr unsigned short kMinPrefix = 16;

  // Each target is "a.b.c.d/nn" or a single host. An empty list scans the /24 around the
  // local IPv4 address. Duplicates are dropped, first occurrence wins.
  static std::vector<std::string> enumerate(const std::vector<std::string>& targets,
                                            streamscout::application::ports::ILogger& log);

  static std::vector<std::string> expand_cidr(const std::string& cidr,
                                              streamscout::application::ports::ILogger& log);

  // Address of the interface holding the default route, "127.0.0.1" when there is none.
  static std::string local_ipv4(streamscout::application::ports::ILogger& log);
};

}  // namespace streamscout::infrastructure::net
