// File: src/apps/nm_node/main.cpp
#include <iostream>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "nm/adapters/synth/synth_trajectory_source.hpp"
#include "nm/core/events/jsonl_event_sink.hpp"
#include "nm/core/io/trajectory_source.hpp"
#include "nm/core/model/kpi_runner.hpp"
#include "nm/core/util/config_loader.hpp"
#include "nm/core/util/logging.hpp"

namespace {

struct Args {
  std::string config_path;
  bool help{false};
};

Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string s = argv[i];
    if (s == "--help" || s == "-h") {
      a.help = true;
      return a;
    }
    if (s == "--config" && i + 1 < argc) {
      a.config_path = argv[++i];
      continue;
    }
    a.help = true;
    return a;
  }
  return a;
}

void print_usage() {
  std::cout << "nm_node\n"
            << "  --config <path>\n";
}

std::unique_ptr<nm::SynthTrajectorySource> make_source_from_config(const nm::Config& cfg) {
  if (cfg.input.type == "synth") {
    nm::SynthSourceConfig sc;
    sc.seed = cfg.input.synth.seed;
    sc.num_observations = cfg.input.synth.num_observations;
    sc.start_time = cfg.input.synth.start_time;
    sc.duration_s = cfg.input.synth.duration_s;
    sc.guaranteed_close_calls = cfg.input.synth.guaranteed_close_calls;
    return std::make_unique<nm::SynthTrajectorySource>(sc);
  }
  return nullptr;
}

}  // namespace

int main(int argc, char** argv) {
  const Args args = parse_args(argc, argv);
  if (args.help || args.config_path.empty()) {
    print_usage();
    return args.help ? 0 : 1;
  }

  auto cfg_r = nm::load_config(args.config_path);
  if (!cfg_r.ok()) {
    std::cerr << cfg_r.status().message() << "\n";
    return 1;
  }
  nm::Config cfg = cfg_r.take_value();

  const nm::Status st_log = nm::configure_logging(cfg.logging);
  if (!st_log.ok()) {
    std::cerr << st_log.message() << "\n";
    return 1;
  }

  auto source = make_source_from_config(cfg);
  if (!source) {
    spdlog::error("unknown input.type: {}", cfg.input.type);
    return 1;
  }

  const nm::Status st_open = source->open();
  if (!st_open.ok()) {
    spdlog::error("input open failed: {}", st_open.message());
    return 2;
  }
  spdlog::info("input: {} ({} rows)", source->name(), source->size());

  nm::KpiRunner runner(cfg, args.config_path);
  nm::JsonlEventSink sink;

  const nm::Status st_start = runner.start(sink);
  if (!st_start.ok()) {
    spdlog::error("{}", st_start.message());
    return 2;
  }

  // Ensure we always close/flush cleanly.
  struct Guard {
    nm::KpiRunner& r;
    nm::JsonlEventSink& s;
    ~Guard() { r.stop(s); }
  } guard{runner, sink};

  std::cout << "Events: " << sink.path() << " (latest: " << sink.latest_path() << ")\n";

  auto result_r = runner.run(sink, *source);
  if (!result_r.ok()) {
    std::cerr << nm::status_code_name(result_r.status().code()) << ": "
              << result_r.status().message() << "\n";
    return 2;
  }

  const nm::KpiResult& r = *result_r;
  const auto& worst = r.kpis.zone_analysis.worst_zone;
  std::cout << "close_calls=" << r.close_calls_count()
            << " humans=" << r.stats.human_detections_processed
            << " vehicles=" << r.stats.vehicle_detections_processed
            << " rate_per_100_min=" << r.kpis.near_miss_rate.rate_per_100_minutes
            << " worst_zone=" << (worst ? *worst : std::string("-"))
            << " time_ms=" << r.stats.computation_time_ms << "\n";
  if (r.safety) {
    std::cout << "vest_violations=" << r.safety->vest_violations.size()
              << " vest_compliance_pct=" << r.safety->vest_compliance_percentage
              << " overspeed_events=" << r.safety->overspeed_events.size() << "\n";
  }
  return 0;
}
