// File: include/nm/core/model/near_miss_engine.hpp
#pragma once

#include <cstdint>
#include <optional>

#include "nm/core/io/trajectory_source.hpp"
#include "nm/core/kpi/kpi_aggregator.hpp"
#include "nm/core/kpi/safety_violations.hpp"
#include "nm/core/model/query_params.hpp"
#include "nm/core/status.hpp"
#include "nm/core/types.hpp"

namespace nm {

struct ComputationStats {
  std::int64_t human_detections_processed = 0;
  std::int64_t vehicle_detections_processed = 0;
  std::int64_t close_calls_detected = 0;
  double computation_time_ms = 0.0;
};

// Everything one computation produces. Always fully populated; zero-valued when empty.
struct KpiResult {
  CloseCalls close_calls;
  KpiAggregates kpis;
  ComputationStats stats;
  QueryParams parameters_used;

  // Set by KpiRunner when safety rules are enabled; the engine leaves it empty.
  std::optional<SafetyViolationSummary> safety;

  [[nodiscard]] std::int64_t close_calls_count() const noexcept {
    return static_cast<std::int64_t>(close_calls.size());
  }
};

// Near-miss computation entry point.
//
// Stateless between calls: it only borrows the source. Concurrent compute() calls are
// safe as long as the source's fetch() is.
class NearMissEngine {
 public:
  explicit NearMissEngine(const ITrajectorySource& source);

  // Errors:
  //  - kInvalidArgument: bad parameters; no fetch has been issued
  //  - source errors: propagated unchanged
  //  - kInternal: unexpected failure during computation (no partial result)
  Result<KpiResult> compute(const QueryParams& q) const;

 private:
  Result<KpiResult> compute_(const QueryParams& q) const;

  const ITrajectorySource& source_;
};

// Vehicle-side fetch for a set of time-sorted humans: the humans' span widened by the
// time window on both sides (inclusive), restricted by zone and vehicle class.
ObservationQuery vehicle_query_for(const Observations& humans, const QueryParams& q);

}  // namespace nm
