// File: include/nm/adapters/memory/memory_trajectory_source.hpp
#pragma once

#include <string>

#include "nm/core/io/trajectory_source.hpp"

namespace nm {

// Holds a detection snapshot in memory and answers queries by scanning it.
// Rows may be added in any order; fetch() always returns them time-ordered.
class MemoryTrajectorySource final : public ITrajectorySource {
 public:
  MemoryTrajectorySource() = default;
  explicit MemoryTrajectorySource(Observations rows);

  void add(Observation row);
  void clear() { rows_.clear(); }

  [[nodiscard]] std::size_t size() const noexcept { return rows_.size(); }
  [[nodiscard]] const Observations& rows() const noexcept { return rows_; }

  Result<Observations> fetch(const ObservationQuery& query) const override;

  std::string name() const override { return "memory"; }

 private:
  Observations rows_;
};

}  // namespace nm
