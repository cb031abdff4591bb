// File: src/core/index/time_window_index.cpp
#include "nm/core/index/time_window_index.hpp"

#include <algorithm>
#include <utility>

namespace nm {

TimeWindowIndex::TimeWindowIndex(Observations rows) : rows_(std::move(rows)) {
  std::stable_sort(rows_.begin(), rows_.end(), [](const Observation& a, const Observation& b) {
    return a.timestamp < b.timestamp;
  });

  ts_ms_.reserve(rows_.size());
  for (const auto& r : rows_) ts_ms_.push_back(r.timestamp.ms);
}

IndexRange TimeWindowIndex::query(std::int64_t t_ms, std::int64_t w_ms) const {
  if (w_ms < 0) return IndexRange{};

  const std::int64_t lo_ts = saturating_add(t_ms, -w_ms);
  const std::int64_t hi_ts = saturating_add(t_ms, w_ms);

  const auto lo = std::lower_bound(ts_ms_.begin(), ts_ms_.end(), lo_ts);
  const auto hi = std::upper_bound(lo, ts_ms_.end(), hi_ts);

  return IndexRange{static_cast<std::size_t>(lo - ts_ms_.begin()),
                    static_cast<std::size_t>(hi - ts_ms_.begin())};
}

}  // namespace nm
