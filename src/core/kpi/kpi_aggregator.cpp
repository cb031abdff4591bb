// File: src/core/kpi/kpi_aggregator.cpp
#include "nm/core/kpi/kpi_aggregator.hpp"

#include <algorithm>
#include <array>
#include <limits>
#include <map>
#include <set>
#include <string>
#include <unordered_set>
#include <utility>

namespace nm {
namespace {

double safe_div(double num, double den) { return den > 0.0 ? num / den : 0.0; }

struct OffenderAcc {
  ObjectClass vehicle_class = ObjectClass::kVehicle;
  std::int64_t count = 0;
  std::set<std::int64_t> minutes;
};

struct ZoneAcc {
  std::int64_t count = 0;
  double sum = 0.0;
  double min = std::numeric_limits<double>::infinity();
  double max = 0.0;
};

}  // namespace

std::vector<TimeSeriesPoint> compute_time_series(const CloseCalls& calls) {
  std::map<std::int64_t, std::int64_t> buckets;
  for (const auto& cc : calls) {
    ++buckets[floor_to_minute(cc.human.timestamp).ms];
  }

  std::vector<TimeSeriesPoint> out;
  out.reserve(buckets.size());
  for (const auto& [minute, count] : buckets) {
    out.push_back(TimeSeriesPoint{TimestampMs{minute}, count});
  }
  return out;
}

std::vector<TopOffender> compute_top_offenders(const CloseCalls& calls, std::size_t limit) {
  // Ordered by vehicle id so the stable sort below breaks count ties by id.
  std::map<TrackingId, OffenderAcc> by_vehicle;
  for (const auto& cc : calls) {
    auto [it, inserted] = by_vehicle.try_emplace(cc.vehicle.tracking_id);
    if (inserted) it->second.vehicle_class = cc.vehicle.object_class;
    ++it->second.count;
    it->second.minutes.insert(floor_to_minute(cc.human.timestamp).ms);
  }

  std::vector<TopOffender> out;
  out.reserve(by_vehicle.size());
  for (const auto& [id, acc] : by_vehicle) {
    TopOffender o;
    o.vehicle_id = id;
    o.vehicle_class = acc.vehicle_class;
    o.close_calls = acc.count;
    o.exposure_minutes = static_cast<std::int64_t>(acc.minutes.size());
    o.rate_per_minute =
        safe_div(static_cast<double>(o.close_calls), static_cast<double>(o.exposure_minutes));
    out.push_back(std::move(o));
  }

  std::stable_sort(out.begin(), out.end(), [](const TopOffender& a, const TopOffender& b) {
    return a.close_calls > b.close_calls;
  });
  if (out.size() > limit) out.resize(limit);
  return out;
}

ZoneAnalysis compute_zone_analysis(const CloseCalls& calls) {
  std::map<ZoneId, ZoneAcc> by_zone;
  for (const auto& cc : calls) {
    const auto zone = cc.zone();
    if (!zone) continue;
    ZoneAcc& acc = by_zone[*zone];
    ++acc.count;
    acc.sum += cc.distance_m;
    acc.min = std::min(acc.min, cc.distance_m);
    acc.max = std::max(acc.max, cc.distance_m);
  }

  ZoneAnalysis out;
  out.by_zone.reserve(by_zone.size());
  std::int64_t best = 0;
  for (const auto& [zone, acc] : by_zone) {
    ZoneStats z;
    z.zone = zone;
    z.close_calls = acc.count;
    z.avg_distance_m = safe_div(acc.sum, static_cast<double>(acc.count));
    z.min_distance_m = acc.count > 0 ? acc.min : 0.0;
    z.max_distance_m = acc.max;
    out.by_zone.push_back(std::move(z));

    // Strictly greater: the first (smallest) zone id wins a tie.
    if (acc.count > best) {
      best = acc.count;
      out.worst_zone = zone;
    }
  }
  return out;
}

NearMissRate compute_near_miss_rate(const CloseCalls& calls, std::optional<TimestampMs> from,
                                    std::optional<TimestampMs> to) {
  NearMissRate out;

  if (from && to) {
    out.observation_minutes =
        static_cast<double>(to->ms - from->ms) / static_cast<double>(kMsPerMinute);
  } else if (!calls.empty()) {
    const auto [lo, hi] = std::minmax_element(
        calls.begin(), calls.end(),
        [](const CloseCall& a, const CloseCall& b) { return a.human.timestamp < b.human.timestamp; });
    // A zero span (every match in the same instant) is a zero window, not the default.
    out.observation_minutes =
        static_cast<double>(hi->human.timestamp.ms - lo->human.timestamp.ms) /
        static_cast<double>(kMsPerMinute);
  } else {
    out.observation_minutes = kDefaultObservationMinutes;
  }
  if (out.observation_minutes < 0.0) out.observation_minutes = 0.0;

  std::unordered_set<TrackingId> vehicles;
  for (const auto& cc : calls) vehicles.insert(cc.vehicle.tracking_id);
  out.unique_vehicles = static_cast<std::int64_t>(vehicles.size());

  out.total_vehicle_minutes = static_cast<double>(out.unique_vehicles) * out.observation_minutes;
  out.rate_per_100_minutes =
      safe_div(static_cast<double>(calls.size()), out.total_vehicle_minutes) * 100.0;
  return out;
}

SeverityAnalysis compute_severity_analysis(const CloseCalls& calls) {
  std::array<double, 3> sums{0.0, 0.0, 0.0};

  SeverityAnalysis out;
  for (const auto& cc : calls) {
    const auto i = static_cast<std::size_t>(cc.severity);
    ++out.tiers[i].count;
    sums[i] += cc.distance_m;
  }

  const double total = static_cast<double>(calls.size());
  for (std::size_t i = 0; i < out.tiers.size(); ++i) {
    SeverityStats& t = out.tiers[i];
    const double n = static_cast<double>(t.count);
    t.percentage = safe_div(n, total) * 100.0;
    t.avg_distance_m = safe_div(sums[i], n);
  }
  return out;
}

VehicleClassBreakdown compute_vehicle_class_breakdown(const CloseCalls& calls) {
  VehicleClassBreakdown out{
      {{ObjectClass::kVehicle}, {ObjectClass::kPalletTruck}, {ObjectClass::kAgv}}};
  for (const auto& cc : calls) {
    for (auto& slot : out) {
      if (slot.vehicle_class == cc.vehicle.object_class) {
        ++slot.count;
        break;
      }
    }
  }
  return out;
}

KpiAggregates aggregate_kpis(const CloseCalls& calls, std::optional<TimestampMs> from,
                             std::optional<TimestampMs> to) {
  KpiAggregates out;
  out.time_series = compute_time_series(calls);
  out.top_offenders = compute_top_offenders(calls);
  out.zone_analysis = compute_zone_analysis(calls);
  out.near_miss_rate = compute_near_miss_rate(calls, from, to);
  out.severity_analysis = compute_severity_analysis(calls);
  out.by_vehicle_class = compute_vehicle_class_breakdown(calls);
  return out;
}

}  // namespace nm
