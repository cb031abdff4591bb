// File: include/nm/adapters/synth/synth_trajectory_source.hpp
#pragma once

#include <cstdint>
#include <string>

#include "nm/adapters/memory/memory_trajectory_source.hpp"
#include "nm/core/io/trajectory_source.hpp"

namespace nm {

struct SynthSourceConfig {
  std::uint32_t seed{1};

  // Total rows, including both halves of every guaranteed close call.
  int num_observations{1000};

  // Rows are spread over [start_time, start_time + duration_s).
  TimestampMs start_time{1'714'543'200'000};  // 2024-05-01T06:00:00Z
  double duration_s{3600.0};

  // Human/vehicle pairs placed 0.5..1.2 m and 50..200 ms apart in hotspot zones.
  int guaranteed_close_calls{100};
};

// Deterministic synthetic warehouse feed: 20 humans, 15 vehicles, 10 pallet trucks and
// 5 AGVs moving through seven zones, with a few interaction hotspots.
class SynthTrajectorySource final : public ITrajectorySource {
 public:
  explicit SynthTrajectorySource(SynthSourceConfig cfg);

  // Call once after construction. Keeps ctor simple (no throwing / no generation work).
  Status open();

  Result<Observations> fetch(const ObservationQuery& query) const override;

  std::string name() const override { return "synth"; }

  [[nodiscard]] std::size_t size() const noexcept { return store_.size(); }

 private:
  SynthSourceConfig cfg_;
  bool opened_{false};
  MemoryTrajectorySource store_;
};

}  // namespace nm
