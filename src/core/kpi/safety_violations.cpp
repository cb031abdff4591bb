// File: src/core/kpi/safety_violations.cpp
#include "nm/core/kpi/safety_violations.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <map>
#include <set>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "nm/core/kpi/speed_estimator.hpp"

namespace nm {
namespace {

ZoneId zone_or_unknown(const Observation& o) {
  if (o.zone && !o.zone->empty()) return *o.zone;
  return kUnknownZone;
}

struct OffenderAcc {
  std::int64_t count = 0;
  double excess_sum = 0.0;
};

double rate_per_hour(std::int64_t count, std::optional<TimestampMs> from,
                     std::optional<TimestampMs> to) {
  if (from && to && *from < *to) {
    const double hours = static_cast<double>(to->ms - from->ms) / static_cast<double>(kMsPerHour);
    return static_cast<double>(count) / hours;
  }
  return static_cast<double>(count);
}

std::vector<RepeatOffender> repeat_offenders(const std::map<TrackingId, OffenderAcc>& acc,
                                             ViolationType type, std::optional<TimestampMs> from,
                                             std::optional<TimestampMs> to) {
  std::vector<RepeatOffender> out;
  for (const auto& [id, a] : acc) {
    if (a.count < kRepeatOffenderMinEvents) continue;
    RepeatOffender o;
    o.tracking_id = id;
    o.type = type;
    o.total_events = a.count;
    o.rate_per_hour = rate_per_hour(a.count, from, to);
    if (type == ViolationType::kOverspeed) {
      o.avg_excess_mps = a.excess_sum / static_cast<double>(a.count);
    }
    out.push_back(std::move(o));
  }
  // Map order gives ascending ids among equal counts.
  std::stable_sort(out.begin(), out.end(), [](const RepeatOffender& a, const RepeatOffender& b) {
    return a.total_events > b.total_events;
  });
  if (out.size() > kRepeatOffenderLimit) out.resize(kRepeatOffenderLimit);
  return out;
}

// Strictly greater wins, so ties keep the smallest zone id.
template <typename Count>
std::optional<ZoneId> worst_zone(const std::map<ZoneId, SafetyZoneStats>& zones, Count count) {
  std::optional<ZoneId> worst;
  std::int64_t best = 0;
  for (const auto& [zone, z] : zones) {
    if (count(z) > best) {
      best = count(z);
      worst = zone;
    }
  }
  return worst;
}

}  // namespace

const char* to_string(ViolationType t) noexcept {
  switch (t) {
    case ViolationType::kVest:
      return "vest";
    case ViolationType::kOverspeed:
      return "overspeed";
  }
  return "vest";
}

Status validate_safety_params(const SafetyParams& p) {
  if (!std::isfinite(p.speed_threshold_mps) || p.speed_threshold_mps < 0.0) {
    return Status::invalid_argument("safety.speed_threshold_mps must be a finite value >= 0");
  }
  return Status::ok_status();
}

SafetyViolationSummary summarize_safety_violations(const Observations& humans,
                                                   const Observations& movers,
                                                   const SafetyParams& params,
                                                   std::optional<TimestampMs> from,
                                                   std::optional<TimestampMs> to) {
  SafetyViolationSummary out;
  out.params = params;
  out.human_detections = static_cast<std::int64_t>(humans.size());

  std::map<ZoneId, SafetyZoneStats> zones;
  std::map<std::int64_t, SafetyHourPoint> hours;
  auto zone_entry = [&](const Observation& o) -> SafetyZoneStats& {
    const ZoneId z = zone_or_unknown(o);
    auto& e = zones[z];
    e.zone = z;
    return e;
  };
  auto hour_entry = [&](const Observation& o) -> SafetyHourPoint& {
    const TimestampMs h = floor_to_hour(o.timestamp);
    auto& e = hours[h.ms];
    e.hour = h;
    return e;
  };

  // --- vest
  std::map<TrackingId, OffenderAcc> vest_acc;
  for (const auto& h : humans) {
    if (!h.vest || *h.vest) continue;
    out.vest_violations.push_back(h);
    ++vest_acc[h.tracking_id].count;
    ++zone_entry(h).vest_violations;
    ++hour_entry(h).vest_violations;
  }
  out.unique_humans_with_vest_violations = static_cast<std::int64_t>(vest_acc.size());
  if (!humans.empty()) {
    out.vest_compliance_percentage =
        (1.0 - static_cast<double>(out.vest_violations.size()) /
                   static_cast<double>(humans.size())) *
        100.0;
  }

  // --- overspeed
  Observations by_track = movers;
  sort_for_speed_estimation(by_track);
  const auto derived = estimate_speeds_bulk(by_track);

  out.overspeed_by_class = {{ObjectClass::kVehicle}, {ObjectClass::kPalletTruck}, {ObjectClass::kAgv}};
  if (params.include_humans_in_speed) out.overspeed_by_class.push_back({ObjectClass::kHuman});

  std::map<TrackingId, OffenderAcc> speed_acc;
  std::set<TrackingId> vehicles;
  double excess_sum = 0.0;
  for (const auto& row : movers) {
    const auto it = derived.find(row.tracking_id);
    const double speed = effective_speed(row, it != derived.end() ? it->second : 0.0);
    if (!(speed > params.speed_threshold_mps)) continue;

    OverspeedEvent e;
    e.row = row;
    e.speed_mps = speed;
    e.speed_derived = !row.speed_mps || *row.speed_mps == 0.0;
    e.excess_mps = speed - params.speed_threshold_mps;
    excess_sum += e.excess_mps;

    auto& acc = speed_acc[row.tracking_id];
    ++acc.count;
    acc.excess_sum += e.excess_mps;
    if (is_vehicle_class(row.object_class)) vehicles.insert(row.tracking_id);
    for (auto& c : out.overspeed_by_class) {
      if (c.object_class == row.object_class) ++c.count;
    }
    ++zone_entry(row).overspeed_events;
    ++hour_entry(row).overspeed_events;

    out.overspeed_events.push_back(std::move(e));
  }
  out.unique_vehicles_overspeeding = static_cast<std::int64_t>(vehicles.size());
  if (!out.overspeed_events.empty()) {
    out.avg_overspeed_excess_mps = excess_sum / static_cast<double>(out.overspeed_events.size());
  }

  // --- zones
  out.worst_zone_vest = worst_zone(zones, [](const SafetyZoneStats& z) { return z.vest_violations; });
  out.worst_zone_speed =
      worst_zone(zones, [](const SafetyZoneStats& z) { return z.overspeed_events; });
  for (auto& [zone, z] : zones) out.by_zone.push_back(std::move(z));
  std::stable_sort(out.by_zone.begin(), out.by_zone.end(),
                   [](const SafetyZoneStats& a, const SafetyZoneStats& b) {
                     return a.total() > b.total();
                   });

  // --- hours
  for (auto& [ms, p] : hours) out.time_series.push_back(p);

  out.vest_offenders = repeat_offenders(vest_acc, ViolationType::kVest, from, to);
  out.speed_offenders = repeat_offenders(speed_acc, ViolationType::kOverspeed, from, to);
  return out;
}

SafetyViolationAnalyzer::SafetyViolationAnalyzer(const ITrajectorySource& source)
    : source_(source) {}

Result<SafetyViolationSummary> SafetyViolationAnalyzer::compute(const QueryParams& q,
                                                                const SafetyParams& p) const {
  Status v = validate_query_params(q);
  if (v.ok()) v = validate_safety_params(p);
  if (!v.ok()) {
    spdlog::warn("safety query rejected: {}", v.message());
    return Result<SafetyViolationSummary>::err(v);
  }

  try {
    ObservationQuery hq;
    hq.classes = {ObjectClass::kHuman};
    hq.from = q.from_time;
    hq.to = q.to_time;
    hq.zone = q.zone;
    auto humans_r = source_.fetch(hq);
    if (!humans_r.ok()) return Result<SafetyViolationSummary>::err(humans_r.status());

    ObservationQuery mq = hq;
    if (q.vehicle_class) {
      mq.classes = {*q.vehicle_class};
    } else {
      mq.classes.assign(kVehicleClasses.begin(), kVehicleClasses.end());
    }
    if (p.include_humans_in_speed) mq.classes.push_back(ObjectClass::kHuman);
    auto movers_r = source_.fetch(mq);
    if (!movers_r.ok()) return Result<SafetyViolationSummary>::err(movers_r.status());

    SafetyViolationSummary s =
        summarize_safety_violations(*humans_r, *movers_r, p, q.from_time, q.to_time);
    spdlog::info("safety violations: {} vest, {} overspeed (threshold={} m/s)",
                 s.vest_violations.size(), s.overspeed_events.size(), p.speed_threshold_mps);
    return Result<SafetyViolationSummary>::ok(std::move(s));
  } catch (const std::exception& e) {
    spdlog::error("safety computation failed: {}", e.what());
    return Result<SafetyViolationSummary>::err(
        Status::internal(std::string("safety computation failed: ") + e.what()));
  }
}

}  // namespace nm
