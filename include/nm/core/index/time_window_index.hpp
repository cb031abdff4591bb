// File: include/nm/core/index/time_window_index.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "nm/core/types.hpp"

namespace nm {

// Half-open row range [lo, hi) into TimeWindowIndex::rows().
struct IndexRange {
  std::size_t lo = 0;
  std::size_t hi = 0;

  [[nodiscard]] bool empty() const noexcept { return lo >= hi; }
  [[nodiscard]] std::size_t size() const noexcept { return empty() ? 0 : hi - lo; }
};

// Sorted timestamp index over one observation stream.
// Built once per computation; immutable afterwards.
class TimeWindowIndex {
 public:
  // Accepts rows in any order. Rows are stable-sorted by timestamp.
  explicit TimeWindowIndex(Observations rows);

  // Every row with t_ms - w_ms <= ts <= t_ms + w_ms, and nothing else. O(log n).
  [[nodiscard]] IndexRange query(std::int64_t t_ms, std::int64_t w_ms) const;

  [[nodiscard]] const Observations& rows() const noexcept { return rows_; }
  [[nodiscard]] const std::vector<std::int64_t>& timestamps_ms() const noexcept { return ts_ms_; }

  [[nodiscard]] std::size_t size() const noexcept { return rows_.size(); }
  [[nodiscard]] bool empty() const noexcept { return rows_.empty(); }

 private:
  Observations rows_;
  std::vector<std::int64_t> ts_ms_;  // parallel to rows_, ascending
};

}  // namespace nm
