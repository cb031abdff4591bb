// File: src/core/kpi/speed_estimator.cpp
#include "nm/core/kpi/speed_estimator.hpp"

#include <algorithm>
#include <cmath>

namespace nm {
namespace {

// Running mean of pairwise speeds for one trajectory.
struct SpeedAcc {
  const Observation* prev = nullptr;
  double sum = 0.0;
  std::int64_t n = 0;

  void add(const Observation& cur) {
    if (prev) {
      const double dt_s = static_cast<double>(cur.timestamp.ms - prev->timestamp.ms) / 1000.0;
      if (dt_s > 0.0) {
        sum += std::hypot(cur.x - prev->x, cur.y - prev->y) / dt_s;
        ++n;
      }
    }
    prev = &cur;
  }

  [[nodiscard]] double mean() const { return n > 0 ? sum / static_cast<double>(n) : 0.0; }
};

}  // namespace

double estimate_track_speed(const Observations& rows) {
  SpeedAcc acc;
  for (const auto& r : rows) acc.add(r);
  return acc.mean();
}

void sort_for_speed_estimation(Observations& rows) {
  std::stable_sort(rows.begin(), rows.end(), [](const Observation& a, const Observation& b) {
    if (a.tracking_id != b.tracking_id) return a.tracking_id < b.tracking_id;
    return a.timestamp < b.timestamp;
  });
}

std::map<TrackingId, double> estimate_speeds_bulk(const Observations& rows) {
  std::map<TrackingId, double> out;
  if (rows.empty()) return out;

  SpeedAcc acc;
  const TrackingId* current = &rows.front().tracking_id;
  for (const auto& r : rows) {
    if (r.tracking_id != *current) {
      out[*current] = acc.mean();
      acc = SpeedAcc{};
      current = &r.tracking_id;
    }
    acc.add(r);
  }
  out[*current] = acc.mean();
  return out;
}

double effective_speed(const Observation& row, double derived_mps) {
  if (row.speed_mps && *row.speed_mps != 0.0) return *row.speed_mps;
  return derived_mps;
}

}  // namespace nm
