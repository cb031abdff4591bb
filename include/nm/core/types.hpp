// include/nm/core/types.hpp
#pragma once

#include <array>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace nm {

// -----------------------------
// Basic identifiers
// -----------------------------

using SiteId = std::string;      // e.g. "site_001"
using TrackingId = std::string;  // e.g. "vehicle_007"; shared by all rows of one trajectory
using ZoneId = std::string;      // opaque, e.g. "12"

// -----------------------------
// Time
// -----------------------------
// Timestamps are integer milliseconds since the Unix epoch (UTC).
// The feed has millisecond resolution; integers keep window arithmetic exact.

struct TimestampMs {
  std::int64_t ms = 0;

  constexpr bool operator==(const TimestampMs& other) const noexcept { return ms == other.ms; }
  constexpr bool operator!=(const TimestampMs& other) const noexcept { return ms != other.ms; }
  constexpr bool operator<(const TimestampMs& other) const noexcept { return ms < other.ms; }
  constexpr bool operator<=(const TimestampMs& other) const noexcept { return ms <= other.ms; }
  constexpr bool operator>(const TimestampMs& other) const noexcept { return ms > other.ms; }
  constexpr bool operator>=(const TimestampMs& other) const noexcept { return ms >= other.ms; }
};

constexpr std::int64_t kMsPerMinute = 60'000;
constexpr std::int64_t kMsPerHour = 60 * kMsPerMinute;

// Start of the `bucket_ms` bucket containing t (floors toward negative infinity).
constexpr TimestampMs floor_to(TimestampMs t, std::int64_t bucket_ms) noexcept {
  std::int64_t q = t.ms / bucket_ms;
  if (t.ms % bucket_ms < 0) --q;
  return TimestampMs{q * bucket_ms};
}

constexpr TimestampMs floor_to_minute(TimestampMs t) noexcept { return floor_to(t, kMsPerMinute); }
constexpr TimestampMs floor_to_hour(TimestampMs t) noexcept { return floor_to(t, kMsPerHour); }

// a + b clamped to the int64 range. Window bounds use this so that a huge
// (but valid) time window cannot wrap.
constexpr std::int64_t saturating_add(std::int64_t a, std::int64_t b) noexcept {
  if (b > 0 && a > std::numeric_limits<std::int64_t>::max() - b) {
    return std::numeric_limits<std::int64_t>::max();
  }
  if (b < 0 && a < std::numeric_limits<std::int64_t>::min() - b) {
    return std::numeric_limits<std::int64_t>::min();
  }
  return a + b;
}

// -----------------------------
// Object classes
// -----------------------------

enum class ObjectClass {
  kHuman,
  kVehicle,
  kPalletTruck,
  kAgv,
};

inline constexpr std::array<ObjectClass, 3> kVehicleClasses = {
    ObjectClass::kVehicle, ObjectClass::kPalletTruck, ObjectClass::kAgv};

constexpr bool is_vehicle_class(ObjectClass c) noexcept { return c != ObjectClass::kHuman; }

const char* to_string(ObjectClass c) noexcept;
std::optional<ObjectClass> parse_object_class(std::string_view s);

// -----------------------------
// Observations
// -----------------------------

// One timestamped position reading from the tracking feed. Read-only input.
struct Observation {
  std::int64_t id = 0;
  TrackingId tracking_id;
  ObjectClass object_class = ObjectClass::kHuman;
  TimestampMs timestamp;

  // Local site frame, metres.
  double x = 0.0;
  double y = 0.0;

  std::optional<double> heading_deg;  // 0..360
  std::optional<double> speed_mps;
  std::optional<bool> vest;  // humans only
  std::optional<ZoneId> zone;
};

using Observations = std::vector<Observation>;

// -----------------------------
// Close calls
// -----------------------------

enum class Severity {
  kHigh,
  kMedium,
  kLow,
};

inline constexpr std::array<Severity, 3> kSeverities = {Severity::kHigh, Severity::kMedium,
                                                        Severity::kLow};

const char* to_string(Severity s) noexcept;

// A human and a vehicle-class observation that were close in both space and time.
struct CloseCall {
  Observation human;
  Observation vehicle;

  double distance_m = 0.0;
  double distance_threshold_m = 0.0;
  std::int64_t time_window_ms = 0;
  std::int64_t time_difference_ms = 0;  // |vehicle.ts - human.ts|
  Severity severity = Severity::kLow;

  // Zone the close call is attributed to: vehicle zone, else human zone.
  [[nodiscard]] std::optional<ZoneId> zone() const;
};

using CloseCalls = std::vector<CloseCall>;

}  // namespace nm
