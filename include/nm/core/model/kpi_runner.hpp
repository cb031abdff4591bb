// File: include/nm/core/model/kpi_runner.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "nm/core/config.hpp"
#include "nm/core/events/event_sink.hpp"
#include "nm/core/io/trajectory_source.hpp"
#include "nm/core/model/near_miss_engine.hpp"
#include "nm/core/status.hpp"

namespace nm {

// KpiRunner owns the run lifecycle around one near-miss computation.
// Time contract:
//  - t_ns      = relative since run start (starts at 0) using steady clock
//  - t_wall_ns = absolute epoch ns
class KpiRunner {
 public:
  KpiRunner(Config cfg, std::string config_path);

  // Prunes old run files, then opens the sink with the run header.
  Status start(EventSink& sink);

  // Runs cfg.query against the source, plus the safety rules when cfg.safety.enabled,
  // and streams the outcome to the sink: close_call events (when enabled) and one
  // kpi_summary, or a single run_failed. The first computation error is returned unchanged.
  Result<KpiResult> run(EventSink& sink, const ITrajectorySource& source);

  void stop(EventSink& sink);

  [[nodiscard]] const Config& config() const noexcept { return cfg_; }

  // Keeps the newest `keep_last` events_<digits>.jsonl files in out_dir.
  // events_latest.jsonl is never touched.
  static void prune_out_dir(const std::string& out_dir, std::size_t keep_last);

 private:
  static std::int64_t wall_now_epoch_ns();
  std::int64_t since_start_ns() const;

  Status emit_(EventSink& sink, const std::string& type, const std::string& message,
               std::string payload);
  void record_failure_(EventSink& sink, const Status& st);

  Config cfg_;
  std::string config_path_;

  std::chrono::steady_clock::time_point t0_steady_{};
  bool started_{false};
};

}  // namespace nm
