// File: src/core/events/jsonl_event_sink.cpp
#include "nm/core/events/jsonl_event_sink.hpp"

#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>
#include <system_error>

#include "nm/core/events/event_json.hpp"

namespace nm {
namespace {

double ns_to_s(std::int64_t ns) { return static_cast<double>(ns) * 1e-9; }

std::string join_path(const std::string& a, const std::string& b) {
  namespace fs = std::filesystem;
  return (fs::path(a) / fs::path(b)).string();
}

}  // namespace

JsonlEventSink::~JsonlEventSink() { close(); }

Status JsonlEventSink::open(const RunInfo& run) {
  close();

  std::error_code ec;
  std::filesystem::create_directories(run.out_dir, ec);
  if (ec) {
    return Status::io_error("failed creating out_dir '" + run.out_dir + "': " + ec.message());
  }

  const std::int64_t wall0 = run.wall_start_time_ns;

  path_ = join_path(run.out_dir, "events_" + std::to_string(wall0) + ".jsonl");
  latest_path_ = join_path(run.out_dir, "events_latest.jsonl");

  f_.open(path_, std::ios::out | std::ios::trunc);
  if (!f_.is_open()) return Status::io_error("failed opening '" + path_ + "'");

  latest_.open(latest_path_, std::ios::out | std::ios::trunc);
  if (!latest_.is_open()) return Status::io_error("failed opening '" + latest_path_ + "'");

  open_ = true;

  // Run header line (written to BOTH files).
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(6);
  ss << "{"
     << "\"type\":\"run_started\","
     << "\"t_ns\":0,"
     << "\"t_s\":" << 0.0 << ","
     << "\"t_wall_ns\":" << wall0 << ","
     << "\"t_wall_s\":" << ns_to_s(wall0) << ","
     << "\"site_id\":\"" << json_escape(run.site_id) << "\","
     << "\"config_path\":\"" << json_escape(run.config_path) << "\","
     << "\"config_hash\":\"" << run.config_hash << "\","
     << "\"query_hash\":\"" << run.query_hash << "\""
     << "}";

  NM_RETURN_IF_ERROR(write_line_(ss.str()));
  return flush();
}

Status JsonlEventSink::emit(const Event& e) {
  if (!open_) return Status::invalid_argument("JsonlEventSink::emit called while not open");

  std::ostringstream ss;
  ss << std::fixed << std::setprecision(6);

  ss << "{"
     << "\"type\":\"" << json_escape(e.type) << "\","
     << "\"t_ns\":" << e.t_ns << ","
     << "\"t_s\":" << ns_to_s(e.t_ns) << ","
     << "\"t_wall_ns\":" << e.t_wall_ns << ","
     << "\"t_wall_s\":" << ns_to_s(e.t_wall_ns);

  if (!e.message.empty()) {
    ss << ",\"message\":\"" << json_escape(e.message) << "\"";
  }
  if (!e.payload.empty()) {
    ss << ",\"payload\":" << e.payload;
  }

  ss << "}";

  return write_line_(ss.str());
}

Status JsonlEventSink::write_line_(const std::string& line) {
  f_ << line << "\n";
  latest_ << line << "\n";

  if (!f_.good()) return Status::io_error("failed writing to '" + path_ + "'");
  if (!latest_.good()) return Status::io_error("failed writing to '" + latest_path_ + "'");

  return Status{};
}

Status JsonlEventSink::flush() {
  if (!open_) return Status{};

  f_.flush();
  latest_.flush();

  if (!f_.good()) return Status::io_error("failed flushing '" + path_ + "'");
  if (!latest_.good()) return Status::io_error("failed flushing '" + latest_path_ + "'");

  return Status{};
}

void JsonlEventSink::close() {
  if (f_.is_open()) f_.close();
  if (latest_.is_open()) latest_.close();
  open_ = false;
}

}  // namespace nm
