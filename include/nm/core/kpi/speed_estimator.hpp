// File: include/nm/core/kpi/speed_estimator.hpp
#pragma once

#include <map>

#include "nm/core/types.hpp"

namespace nm {

// Finite-difference speed for trajectories whose rows carry no usable speed.

// Mean of the pairwise speeds dist(p[i-1], p[i]) / dt over one trajectory.
// `rows` must be a single tracking id sorted by timestamp. Pairs with dt <= 0 are skipped.
// Returns 0.0 when fewer than two usable points exist.
double estimate_track_speed(const Observations& rows);

// Sorts rows into (tracking_id, timestamp) order, the layout estimate_speeds_bulk expects.
void sort_for_speed_estimation(Observations& rows);

// One pass over rows grouped by tracking id and time-sorted within each id.
// Equivalent to estimate_track_speed() once per id.
std::map<TrackingId, double> estimate_speeds_bulk(const Observations& rows);

// Reported speed when present and non-zero, otherwise `derived_mps`.
double effective_speed(const Observation& row, double derived_mps);

}  // namespace nm
