// File: include/nm/core/kpi/kpi_aggregator.hpp
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "nm/core/types.hpp"

namespace nm {

// Reductions over a close-call list. Pure functions: no matching, no I/O, no shared state.
// Every function accepts an empty list and returns zero-valued, fully populated output.

inline constexpr std::size_t kTopOffenderLimit = 10;
inline constexpr double kDefaultObservationMinutes = 60.0;

struct TimeSeriesPoint {
  TimestampMs minute;  // start of the minute bucket
  std::int64_t count = 0;
};

struct TopOffender {
  TrackingId vehicle_id;
  ObjectClass vehicle_class = ObjectClass::kVehicle;  // from the first close call seen
  std::int64_t close_calls = 0;
  std::int64_t exposure_minutes = 0;  // distinct minute buckets
  double rate_per_minute = 0.0;
  double derived_speed_mps = 0.0;  // filled by NearMissEngine
};

struct ZoneStats {
  ZoneId zone;
  std::int64_t close_calls = 0;
  double avg_distance_m = 0.0;
  double min_distance_m = 0.0;
  double max_distance_m = 0.0;
};

struct ZoneAnalysis {
  // Highest count; ties go to the lexicographically smallest zone id.
  std::optional<ZoneId> worst_zone;
  std::vector<ZoneStats> by_zone;  // ordered by zone id
};

struct NearMissRate {
  double rate_per_100_minutes = 0.0;
  double total_vehicle_minutes = 0.0;
  std::int64_t unique_vehicles = 0;
  double observation_minutes = 0.0;
};

struct SeverityStats {
  Severity severity = Severity::kLow;
  std::int64_t count = 0;
  double percentage = 0.0;
  double avg_distance_m = 0.0;
};

// Always holds HIGH, MEDIUM, LOW in that order.
struct SeverityAnalysis {
  std::array<SeverityStats, 3> tiers{{{Severity::kHigh}, {Severity::kMedium}, {Severity::kLow}}};

  [[nodiscard]] const SeverityStats& operator[](Severity s) const {
    return tiers[static_cast<std::size_t>(s)];
  }
};

struct VehicleClassCount {
  ObjectClass vehicle_class = ObjectClass::kVehicle;
  std::int64_t count = 0;
};

// Always holds vehicle, pallet_truck, agv in that order.
using VehicleClassBreakdown = std::array<VehicleClassCount, 3>;

struct KpiAggregates {
  std::vector<TimeSeriesPoint> time_series;
  std::vector<TopOffender> top_offenders;
  ZoneAnalysis zone_analysis;
  NearMissRate near_miss_rate;
  SeverityAnalysis severity_analysis;
  VehicleClassBreakdown by_vehicle_class{
      {{ObjectClass::kVehicle}, {ObjectClass::kPalletTruck}, {ObjectClass::kAgv}}};
};

// Sparse per-minute counts keyed on the human timestamp, ascending.
std::vector<TimeSeriesPoint> compute_time_series(const CloseCalls& calls);

// Descending by close_calls, ties by ascending vehicle id; at most `limit` entries.
std::vector<TopOffender> compute_top_offenders(const CloseCalls& calls,
                                               std::size_t limit = kTopOffenderLimit);

ZoneAnalysis compute_zone_analysis(const CloseCalls& calls);

// Near-miss rate per 100 vehicle-minutes.
// Observation window: [from, to) when both are given, else the span of the matched human
// timestamps (possibly 0, which yields a rate of 0). kDefaultObservationMinutes applies only
// when there are no bounds and no matches.
NearMissRate compute_near_miss_rate(const CloseCalls& calls, std::optional<TimestampMs> from,
                                    std::optional<TimestampMs> to);

SeverityAnalysis compute_severity_analysis(const CloseCalls& calls);

VehicleClassBreakdown compute_vehicle_class_breakdown(const CloseCalls& calls);

KpiAggregates aggregate_kpis(const CloseCalls& calls, std::optional<TimestampMs> from,
                             std::optional<TimestampMs> to);

}  // namespace nm
