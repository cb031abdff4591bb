// File: src/core/model/kpi_runner.cpp
#include "nm/core/model/kpi_runner.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "nm/core/events/event_json.hpp"
#include "nm/core/util/repro_hash.hpp"

namespace nm {
namespace {

constexpr std::string_view kRunFilePrefix = "events_";
constexpr std::string_view kRunFileSuffix = ".jsonl";

// Wall-clock stamp of a per-run file "events_<ns>.jsonl"; nullopt for anything else,
// events_latest.jsonl included.
std::optional<std::int64_t> run_file_stamp(std::string_view name) {
  if (!name.starts_with(kRunFilePrefix) || !name.ends_with(kRunFileSuffix)) return std::nullopt;
  name.remove_prefix(kRunFilePrefix.size());
  name.remove_suffix(kRunFileSuffix.size());
  if (name.empty() || name.front() < '0' || name.front() > '9') return std::nullopt;

  std::int64_t ns = 0;
  const auto [ptr, ec] = std::from_chars(name.data(), name.data() + name.size(), ns);
  if (ec != std::errc{} || ptr != name.data() + name.size()) return std::nullopt;
  return ns;
}

}  // namespace

KpiRunner::KpiRunner(Config cfg, std::string config_path)
    : cfg_(std::move(cfg)), config_path_(std::move(config_path)) {}

std::int64_t KpiRunner::wall_now_epoch_ns() {
  using clock = std::chrono::system_clock;
  const auto now = clock::now().time_since_epoch();
  return static_cast<std::int64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
}

std::int64_t KpiRunner::since_start_ns() const {
  if (!started_) return 0;
  const auto now = std::chrono::steady_clock::now();
  return static_cast<std::int64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(now - t0_steady_).count());
}

void KpiRunner::prune_out_dir(const std::string& out_dir, std::size_t keep_last) {
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::exists(out_dir, ec)) return;

  std::vector<std::pair<std::int64_t, fs::path>> runs;
  for (const auto& it : fs::directory_iterator(out_dir, ec)) {
    if (ec) return;
    if (!it.is_regular_file(ec)) continue;
    if (const auto stamp = run_file_stamp(it.path().filename().string())) {
      runs.emplace_back(*stamp, it.path());
    }
  }
  if (runs.size() <= keep_last) return;

  std::sort(runs.begin(), runs.end(),
            [](const auto& a, const auto& b) { return a.first > b.first; });

  for (std::size_t i = keep_last; i < runs.size(); ++i) {
    fs::remove(runs[i].second, ec);
    if (ec) {
      spdlog::warn("could not prune '{}': {}", runs[i].second.string(), ec.message());
      ec.clear();
    }
  }
}

Status KpiRunner::start(EventSink& sink) {
  prune_out_dir(cfg_.output.out_dir, static_cast<std::size_t>(cfg_.output.keep_last_runs));

  t0_steady_ = std::chrono::steady_clock::now();
  started_ = true;

  RunInfo run;
  run.site_id = cfg_.site_id;
  run.config_path = config_path_;
  run.out_dir = cfg_.output.out_dir;
  run.config_hash = compute_config_hash(cfg_);
  run.query_hash = compute_query_hash(cfg_.query);
  run.wall_start_time_ns = wall_now_epoch_ns();

  spdlog::info("run started: site={} config_hash={} query_hash={}", run.site_id,
               run.config_hash, run.query_hash);
  return sink.open(run);
}

Status KpiRunner::emit_(EventSink& sink, const std::string& type, const std::string& message,
                        std::string payload) {
  Event e;
  e.type = type;
  e.t_ns = since_start_ns();
  e.t_wall_ns = wall_now_epoch_ns();
  e.message = message;
  e.payload = std::move(payload);
  return sink.emit(e);
}

void KpiRunner::record_failure_(EventSink& sink, const Status& st) {
  spdlog::error("computation failed ({}): {}", status_code_name(st.code()), st.message());
  const std::string payload = std::string("{\"code\":\"") + status_code_name(st.code()) + "\"}";
  const Status st_emit = emit_(sink, "run_failed", st.message(), payload);
  if (!st_emit.ok()) spdlog::error("could not record run_failed: {}", st_emit.message());
  const Status st_flush = sink.flush();
  if (!st_flush.ok()) spdlog::error("could not flush events: {}", st_flush.message());
}

Result<KpiResult> KpiRunner::run(EventSink& sink, const ITrajectorySource& source) {
  if (!started_) return Result<KpiResult>::err(Status::invalid_argument("KpiRunner::run before start"));

  const NearMissEngine engine(source);
  auto r = engine.compute(cfg_.query);

  if (r.ok() && cfg_.safety.enabled) {
    auto safety = SafetyViolationAnalyzer(source).compute(cfg_.query, cfg_.safety.params);
    if (safety.ok()) {
      r->safety = safety.take_value();
    } else {
      r = Result<KpiResult>::err(safety.status());
    }
  }

  if (!r.ok()) {
    record_failure_(sink, r.status());
    return r;
  }

  const KpiResult& result = *r;

  if (cfg_.output.emit_close_calls) {
    for (const CloseCall& c : result.close_calls) {
      const Status st = emit_(sink, "close_call", "", close_call_json(c));
      if (!st.ok()) return Result<KpiResult>::err(st);
    }
  }

  const Status st_sum = emit_(sink, "kpi_summary",
                              "close_calls=" + std::to_string(result.close_calls_count()),
                              kpi_summary_json(result));
  if (!st_sum.ok()) return Result<KpiResult>::err(st_sum);

  const Status st_flush = sink.flush();
  if (!st_flush.ok()) return Result<KpiResult>::err(st_flush);

  return r;
}

void KpiRunner::stop(EventSink& sink) {
  const Status st = sink.flush();
  if (!st.ok()) spdlog::warn("final flush failed: {}", st.message());
  sink.close();
  started_ = false;
}

}  // namespace nm
