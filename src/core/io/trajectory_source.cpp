// File: src/core/io/trajectory_source.cpp
#include "nm/core/io/trajectory_source.hpp"

#include <algorithm>

namespace nm {

bool ObservationQuery::matches(const Observation& o) const {
  if (!classes.empty() &&
      std::find(classes.begin(), classes.end(), o.object_class) == classes.end()) {
    return false;
  }
  if (from && o.timestamp < *from) return false;
  if (to && o.timestamp >= *to) return false;
  if (zone) {
    if (!o.zone || *o.zone != *zone) return false;
  }
  return true;
}

}  // namespace nm
