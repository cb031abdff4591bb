// File: include/nm/core/model/query_params.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include "nm/core/status.hpp"
#include "nm/core/types.hpp"

namespace nm {

// Input of one near-miss computation.
struct QueryParams {
  double distance_threshold_m = 2.0;
  std::int64_t time_window_ms = 250;

  // Human observations are taken from [from_time, to_time).
  std::optional<TimestampMs> from_time;
  std::optional<TimestampMs> to_time;

  std::optional<ZoneId> zone;
  std::optional<ObjectClass> vehicle_class;  // restricts the vehicle side only

  std::size_t batch_size = 200;
};

// Rejects bad parameters before any work happens (kInvalidArgument).
Status validate_query_params(const QueryParams& q);

}  // namespace nm
