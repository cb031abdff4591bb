// File: include/nm/core/kpi/safety_violations.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "nm/core/io/trajectory_source.hpp"
#include "nm/core/model/query_params.hpp"
#include "nm/core/status.hpp"
#include "nm/core/types.hpp"

namespace nm {

// Per-row safety rules over the same trajectory feed as the near-miss join:
//  - vest violation: a human row with vest == false
//  - overspeed: a mover row whose effective speed is strictly above the threshold
// Effective speed is the reported speed, or the track's derived speed when the
// reported value is missing or zero.

inline constexpr double kDefaultSpeedThresholdMps = 1.5;
inline constexpr std::int64_t kRepeatOffenderMinEvents = 2;
inline constexpr std::size_t kRepeatOffenderLimit = 10;
inline constexpr const char* kUnknownZone = "unknown";

struct SafetyParams {
  double speed_threshold_mps = kDefaultSpeedThresholdMps;
  bool include_humans_in_speed = false;
};

Status validate_safety_params(const SafetyParams& p);

enum class ViolationType {
  kVest,
  kOverspeed,
};

const char* to_string(ViolationType t) noexcept;

struct OverspeedEvent {
  Observation row;
  double speed_mps = 0.0;
  bool speed_derived = false;  // no usable reported speed on the row
  double excess_mps = 0.0;     // speed_mps - threshold
};

struct OverspeedClassCount {
  ObjectClass object_class = ObjectClass::kVehicle;
  std::int64_t count = 0;
};

struct SafetyZoneStats {
  ZoneId zone;  // kUnknownZone when the row has none
  std::int64_t vest_violations = 0;
  std::int64_t overspeed_events = 0;

  [[nodiscard]] std::int64_t total() const noexcept { return vest_violations + overspeed_events; }
};

struct SafetyHourPoint {
  TimestampMs hour;  // start of the hour bucket
  std::int64_t vest_violations = 0;
  std::int64_t overspeed_events = 0;
};

struct RepeatOffender {
  TrackingId tracking_id;
  ViolationType type = ViolationType::kVest;
  std::int64_t total_events = 0;
  double rate_per_hour = 0.0;   // events per hour of [from, to); raw count without both bounds
  double avg_excess_mps = 0.0;  // overspeed only
};

struct SafetyViolationSummary {
  SafetyParams params;

  Observations vest_violations;
  std::vector<OverspeedEvent> overspeed_events;

  std::int64_t human_detections = 0;
  std::int64_t unique_humans_with_vest_violations = 0;
  double vest_compliance_percentage = 100.0;

  std::int64_t unique_vehicles_overspeeding = 0;  // humans never counted here
  double avg_overspeed_excess_mps = 0.0;
  std::vector<OverspeedClassCount> overspeed_by_class;  // every mover class, fixed order

  // Busiest first; ties by zone id ascending.
  std::vector<SafetyZoneStats> by_zone;
  std::optional<ZoneId> worst_zone_vest;
  std::optional<ZoneId> worst_zone_speed;

  std::vector<SafetyHourPoint> time_series;  // sparse, ascending

  std::vector<RepeatOffender> vest_offenders;   // at most kRepeatOffenderLimit
  std::vector<RepeatOffender> speed_offenders;  // at most kRepeatOffenderLimit
};

// Pure reduction. `humans` are the human rows in range; `movers` are the rows eligible
// for the speed rule (vehicle classes, plus humans when include_humans_in_speed).
// Derived speeds are estimated over `movers`.
SafetyViolationSummary summarize_safety_violations(const Observations& humans,
                                                   const Observations& movers,
                                                   const SafetyParams& params,
                                                   std::optional<TimestampMs> from,
                                                   std::optional<TimestampMs> to);

// Fetches through the source and reduces. The query contributes its time range, zone
// and vehicle_class filter; distance and window settings do not apply here.
class SafetyViolationAnalyzer {
 public:
  explicit SafetyViolationAnalyzer(const ITrajectorySource& source);

  // Errors:
  //  - kInvalidArgument: bad query or safety parameters; no fetch has been issued
  //  - source errors: propagated unchanged
  Result<SafetyViolationSummary> compute(const QueryParams& q, const SafetyParams& p) const;

 private:
  const ITrajectorySource& source_;
};

}  // namespace nm
