// File: src/core/model/near_miss_engine.cpp
#include "nm/core/model/near_miss_engine.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "nm/core/index/time_window_index.hpp"
#include "nm/core/kpi/speed_estimator.hpp"
#include "nm/core/proximity/proximity_matcher.hpp"

namespace nm {

ObservationQuery vehicle_query_for(const Observations& humans, const QueryParams& q) {
  ObservationQuery vq;
  if (q.vehicle_class) {
    vq.classes = {*q.vehicle_class};
  } else {
    vq.classes.assign(kVehicleClasses.begin(), kVehicleClasses.end());
  }
  vq.zone = q.zone;

  if (!humans.empty()) {
    // [first - w, last + w] as a half-open range. Clamped: w may be as large as int64 allows.
    vq.from = TimestampMs{saturating_add(humans.front().timestamp.ms, -q.time_window_ms)};
    vq.to = TimestampMs{
        saturating_add(saturating_add(humans.back().timestamp.ms, q.time_window_ms), 1)};
  }
  return vq;
}

NearMissEngine::NearMissEngine(const ITrajectorySource& source) : source_(source) {}

Result<KpiResult> NearMissEngine::compute(const QueryParams& q) const {
  const Status v = validate_query_params(q);
  if (!v.ok()) {
    spdlog::warn("near-miss query rejected: {}", v.message());
    return Result<KpiResult>::err(v);
  }

  try {
    return compute_(q);
  } catch (const std::exception& e) {
    spdlog::error("near-miss computation failed: {}", e.what());
    return Result<KpiResult>::err(Status::internal(std::string("computation failed: ") + e.what()));
  }
}

Result<KpiResult> NearMissEngine::compute_(const QueryParams& q) const {
  const auto t0 = std::chrono::steady_clock::now();

  KpiResult result;
  result.parameters_used = q;

  auto finish = [&](KpiResult& r) {
    r.stats.close_calls_detected = r.close_calls_count();
    r.stats.computation_time_ms =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
  };

  // --- humans
  ObservationQuery hq;
  hq.classes = {ObjectClass::kHuman};
  hq.from = q.from_time;
  hq.to = q.to_time;
  hq.zone = q.zone;

  auto humans_r = source_.fetch(hq);
  if (!humans_r.ok()) return Result<KpiResult>::err(humans_r.status());
  Observations humans = humans_r.take_value();
  result.stats.human_detections_processed = static_cast<std::int64_t>(humans.size());

  if (humans.empty()) {
    spdlog::debug("no human observations in range; nothing to match");
    result.kpis = aggregate_kpis(result.close_calls, q.from_time, q.to_time);
    finish(result);
    return Result<KpiResult>::ok(std::move(result));
  }

  // Sources promise time order; do not rely on it.
  std::stable_sort(humans.begin(), humans.end(), [](const Observation& a, const Observation& b) {
    return a.timestamp < b.timestamp;
  });

  // --- vehicles
  auto vehicles_r = source_.fetch(vehicle_query_for(humans, q));
  if (!vehicles_r.ok()) return Result<KpiResult>::err(vehicles_r.status());
  const TimeWindowIndex index(vehicles_r.take_value());
  result.stats.vehicle_detections_processed = static_cast<std::int64_t>(index.size());

  spdlog::debug("matching {} human rows against {} vehicle rows (threshold={} m, window={} ms)",
                humans.size(), index.size(), q.distance_threshold_m, q.time_window_ms);

  // --- match + aggregate
  const ProximityMatcher matcher(MatcherParams{q.distance_threshold_m, q.time_window_ms, q.batch_size});
  result.close_calls = matcher.match(humans, index);
  result.kpis = aggregate_kpis(result.close_calls, q.from_time, q.to_time);

  // --- derived offender speeds
  if (!result.kpis.top_offenders.empty()) {
    Observations by_track = index.rows();
    sort_for_speed_estimation(by_track);
    const auto speeds = estimate_speeds_bulk(by_track);
    for (auto& o : result.kpis.top_offenders) {
      const auto it = speeds.find(o.vehicle_id);
      o.derived_speed_mps = it != speeds.end() ? it->second : 0.0;
    }
  }

  finish(result);
  spdlog::info("near-miss computation: {} close calls from {} humans x {} vehicles in {:.2f} ms",
               result.stats.close_calls_detected, result.stats.human_detections_processed,
               result.stats.vehicle_detections_processed, result.stats.computation_time_ms);
  return Result<KpiResult>::ok(std::move(result));
}

}  // namespace nm
