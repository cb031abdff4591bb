// File: src/adapters/memory/memory_trajectory_source.cpp
#include "nm/adapters/memory/memory_trajectory_source.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace nm {

MemoryTrajectorySource::MemoryTrajectorySource(Observations rows) : rows_(std::move(rows)) {}

void MemoryTrajectorySource::add(Observation row) { rows_.push_back(std::move(row)); }

Result<Observations> MemoryTrajectorySource::fetch(const ObservationQuery& query) const {
  if (query.from && query.to && *query.to < *query.from) {
    return Result<Observations>::err(
        Status::invalid_argument("MemoryTrajectorySource::fetch: to < from"));
  }

  Observations out;
  for (const auto& row : rows_) {
    if (!query.matches(row)) continue;
    if (!std::isfinite(row.x) || !std::isfinite(row.y)) {
      return Result<Observations>::err(Status::corrupt_data(
          "MemoryTrajectorySource: non-finite position for observation id=" +
          std::to_string(row.id)));
    }
    out.push_back(row);
  }

  std::stable_sort(out.begin(), out.end(), [](const Observation& a, const Observation& b) {
    return a.timestamp < b.timestamp;
  });
  return Result<Observations>::ok(std::move(out));
}

}  // namespace nm
