#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "domain/StreamRecord.hpp"

namespace streamscout::shared::time
{

domain::Timestamp now();

// "2024-05-01T12:30:45.123Z"
std::string to_iso8601(domain::Timestamp t);

// Accepts the form written by to_iso8601, with or without fraction (up to 9 digits) and with or
// without a trailing 'Z'. Values without zone designator are read as UTC.
std::optional<domain::Timestamp> from_iso8601(std::string_view s);

}  // namespace streamscout::shared::time
