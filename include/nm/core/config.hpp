// include/nm/core/config.hpp
#pragma once

#include <cstdint>
#include <string>

#include "nm/core/kpi/safety_violations.hpp"
#include "nm/core/model/query_params.hpp"
#include "nm/core/status.hpp"
#include "nm/core/types.hpp"

namespace nm {

// Units policy:
// - Distances in metres
// - Speeds in m/s
// - Instants and durations in integer milliseconds

// -----------------------------
// Input source
// -----------------------------
struct InputSynthConfig {
  std::uint32_t seed = 1;
  int num_observations = 1000;
  double duration_s = 3600.0;
  TimestampMs start_time{1'714'543'200'000};  // 2024-05-01T06:00:00Z
  int guaranteed_close_calls = 100;
};

struct InputConfig {
  std::string type = "synth";  // synth (only source bundled with the node)
  InputSynthConfig synth;
};

// -----------------------------
// Output (events)
// -----------------------------
struct OutputConfig {
  // Where to write event JSONL.
  std::string out_dir = "out";

  // One close_call event per match. The kpi_summary event is always written.
  bool emit_close_calls = true;

  // Older events_<ns>.jsonl files beyond this count are pruned at start.
  int keep_last_runs = 50;
};

// -----------------------------
// Safety rules (vest, overspeed)
// -----------------------------
struct SafetyConfig {
  // Adds a safety_violations block to the kpi_summary event, over the same query range.
  bool enabled = true;
  SafetyParams params;
};

// -----------------------------
// Logging (spdlog)
// -----------------------------
struct LoggingConfig {
  std::string level = "info";  // trace|debug|info|warn|error|critical|off
  std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
};

// -----------------------------
// Root config
// -----------------------------
struct Config {
  SiteId site_id = "site_001";

  QueryParams query;
  InputConfig input;
  OutputConfig output;
  SafetyConfig safety;
  LoggingConfig logging;
};

// Minimal validation (keep it strict; fail early).
inline Status validate_config(const Config& cfg) {
  if (cfg.site_id.empty()) {
    return Status::invalid_argument("site_id must not be empty");
  }
  NM_RETURN_IF_ERROR(validate_query_params(cfg.query));
  if (cfg.input.type != "synth") {
    return Status::invalid_argument("input.type must be 'synth'");
  }
  if (cfg.input.synth.num_observations < 0) {
    return Status::invalid_argument("input.synth.num_observations must be >= 0");
  }
  if (cfg.input.synth.duration_s <= 0.0) {
    return Status::invalid_argument("input.synth.duration_s must be > 0");
  }
  if (cfg.input.synth.guaranteed_close_calls < 0) {
    return Status::invalid_argument("input.synth.guaranteed_close_calls must be >= 0");
  }
  if (cfg.output.out_dir.empty()) {
    return Status::invalid_argument("output.out_dir must not be empty");
  }
  if (cfg.output.keep_last_runs < 0) {
    return Status::invalid_argument("output.keep_last_runs must be >= 0");
  }
  NM_RETURN_IF_ERROR(validate_safety_params(cfg.safety.params));
  const std::string& lvl = cfg.logging.level;
  if (lvl != "trace" && lvl != "debug" && lvl != "info" && lvl != "warn" && lvl != "error" &&
      lvl != "critical" && lvl != "off") {
    return Status::invalid_argument("logging.level must be one of trace|debug|info|warn|error|critical|off");
  }
  return Status::ok_status();
}

}  // namespace nm
