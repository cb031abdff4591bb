// File: src/core/model/query_params.cpp
#include "nm/core/model/query_params.hpp"

#include <cmath>
#include <string>

namespace nm {

Status validate_query_params(const QueryParams& q) {
  if (!std::isfinite(q.distance_threshold_m) || q.distance_threshold_m <= 0.0) {
    return Status::invalid_argument("query.distance_threshold_m must be a finite value > 0");
  }
  if (q.time_window_ms < 0) {
    return Status::invalid_argument("query.time_window_ms must be >= 0");
  }
  if (q.batch_size == 0) {
    return Status::invalid_argument("query.batch_size must be > 0");
  }
  if (q.from_time && q.to_time && *q.from_time >= *q.to_time) {
    return Status::invalid_argument("query.from_time must be before query.to_time");
  }
  if (q.vehicle_class && !is_vehicle_class(*q.vehicle_class)) {
    return Status::invalid_argument(std::string("query.vehicle_class must be a vehicle class, got '") +
                                    to_string(*q.vehicle_class) + "'");
  }
  return Status::ok_status();
}

}  // namespace nm
