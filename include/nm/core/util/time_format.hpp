// File: include/nm/core/util/time_format.hpp
#pragma once

#include <string>
#include <string_view>

#include "nm/core/status.hpp"
#include "nm/core/types.hpp"

namespace nm {

// Parses a UTC instant. Accepted forms:
//   YYYY-MM-DDTHH:MM:SS[.fff][Z|+HH:MM|-HH:MM]
//   YYYY-MM-DD HH:MM:SS[.fff]
//   YYYY-MM-DD
// Naive values are taken as UTC. Fractions beyond milliseconds are truncated.
Result<TimestampMs> parse_timestamp(std::string_view text);

// "2024-05-01T06:00:00.125Z"
std::string format_timestamp(TimestampMs t);

// "2024-05-01T06:00" (minute bucket key)
std::string format_minute(TimestampMs t);

}  // namespace nm
