// File: include/nm/core/io/trajectory_source.hpp
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "nm/core/status.hpp"
#include "nm/core/types.hpp"

namespace nm {

// Typed predicate set for one fetch. Unset fields widen the query.
struct ObservationQuery {
  // Empty means "any class".
  std::vector<ObjectClass> classes;

  // Half-open [from, to).
  std::optional<TimestampMs> from;
  std::optional<TimestampMs> to;

  std::optional<ZoneId> zone;

  [[nodiscard]] bool matches(const Observation& o) const;
};

class ITrajectorySource {
 public:
  virtual ~ITrajectorySource() = default;

  // Returns every observation satisfying `query`, ordered ascending by timestamp.
  // An empty result is OK, not an error.
  virtual Result<Observations> fetch(const ObservationQuery& query) const = 0;

  virtual std::string name() const = 0;
};

}  // namespace nm
