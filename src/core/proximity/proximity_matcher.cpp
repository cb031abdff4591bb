// File: src/core/proximity/proximity_matcher.cpp
#include "nm/core/proximity/proximity_matcher.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <utility>

#include "nm/core/proximity/severity.hpp"

namespace nm {

Status validate_matcher_params(const MatcherParams& p) {
  if (!std::isfinite(p.distance_threshold_m) || p.distance_threshold_m <= 0.0) {
    return Status::invalid_argument("distance_threshold_m must be a finite value > 0");
  }
  if (p.time_window_ms < 0) {
    return Status::invalid_argument("time_window_ms must be >= 0");
  }
  if (p.batch_size == 0) {
    return Status::invalid_argument("batch_size must be > 0");
  }
  return Status::ok_status();
}

ProximityMatcher::ProximityMatcher(MatcherParams params) : params_(params) {
  threshold_sq_ = params_.distance_threshold_m * params_.distance_threshold_m;
}

CloseCalls ProximityMatcher::match(const Observations& humans,
                                   const TimeWindowIndex& vehicles) const {
  CloseCalls out;
  if (humans.empty() || vehicles.empty()) return out;

  const std::size_t batch = std::max<std::size_t>(1, params_.batch_size);
  const Observation* base = humans.data();
  for (std::size_t i = 0; i < humans.size(); i += batch) {
    const std::size_t end = std::min(humans.size(), i + batch);
    match_batch_(base + i, base + end, vehicles, out);
  }
  return out;
}

void ProximityMatcher::match_batch_(const Observation* first, const Observation* last,
                                    const TimeWindowIndex& vehicles, CloseCalls& out) const {
  const Observations& vrows = vehicles.rows();

  for (const Observation* h = first; h != last; ++h) {
    const IndexRange r = vehicles.query(h->timestamp.ms, params_.time_window_ms);
    if (r.empty()) continue;

    for (std::size_t j = r.lo; j < r.hi; ++j) {
      const Observation& v = vrows[j];
      const double dx = v.x - h->x;
      const double dy = v.y - h->y;
      const double d_sq = dx * dx + dy * dy;
      if (d_sq > threshold_sq_) continue;

      CloseCall cc;
      cc.human = *h;
      cc.vehicle = v;
      cc.distance_m = std::sqrt(d_sq);
      cc.distance_threshold_m = params_.distance_threshold_m;
      cc.time_window_ms = params_.time_window_ms;
      cc.time_difference_ms = std::abs(v.timestamp.ms - h->timestamp.ms);
      cc.severity = classify_severity(cc.distance_m);
      out.push_back(std::move(cc));
    }
  }
}

}  // namespace nm
