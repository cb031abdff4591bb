// File: include/nm/core/proximity/proximity_matcher.hpp
#pragma once

#include <cstddef>
#include <cstdint>

#include "nm/core/index/time_window_index.hpp"
#include "nm/core/status.hpp"
#include "nm/core/types.hpp"

namespace nm {

struct MatcherParams {
  double distance_threshold_m = 2.0;  // > 0, inclusive
  std::int64_t time_window_ms = 250;  // >= 0, inclusive
  std::size_t batch_size = 200;       // > 0; locality only, never changes the output
};

Status validate_matcher_params(const MatcherParams& p);

// Windowed spatio-temporal join of humans against an indexed vehicle stream.
//
// A pair (h, v) matches iff |h.ts - v.ts| <= time_window_ms and
// dist(h, v) <= distance_threshold_m. Output order is human order, then index order.
class ProximityMatcher {
 public:
  explicit ProximityMatcher(MatcherParams params);

  // `humans` must be sorted by timestamp. Params must already be valid.
  [[nodiscard]] CloseCalls match(const Observations& humans, const TimeWindowIndex& vehicles) const;

  [[nodiscard]] const MatcherParams& params() const noexcept { return params_; }

 private:
  void match_batch_(const Observation* first, const Observation* last,
                    const TimeWindowIndex& vehicles, CloseCalls& out) const;

  MatcherParams params_;
  double threshold_sq_ = 0.0;
};

}  // namespace nm
