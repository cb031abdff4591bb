// File: include/nm/core/proximity/severity.hpp
#pragma once

#include "nm/core/types.hpp"

namespace nm {

// Absolute tiers in metres. They do not scale with the caller's distance threshold:
// a threshold below 1.0 m can only ever produce HIGH.
inline constexpr double kHighSeverityBelowM = 1.0;
inline constexpr double kMediumSeverityBelowM = 1.5;

constexpr Severity classify_severity(double distance_m) noexcept {
  if (distance_m < kHighSeverityBelowM) return Severity::kHigh;
  if (distance_m < kMediumSeverityBelowM) return Severity::kMedium;
  return Severity::kLow;
}

}  // namespace nm
