// File: include/nm/core/events/event_sink.hpp
#pragma once

#include <cstdint>
#include <string>

#include "nm/core/status.hpp"
#include "nm/core/types.hpp"

namespace nm {

// Keep output stable and boring; evolve by adding fields (not breaking existing ones).

struct RunInfo {
  SiteId site_id;
  std::string config_path;
  std::string out_dir;

  std::string config_hash;
  std::string query_hash;

  std::int64_t wall_start_time_ns = 0;
};

struct Event {
  std::string type;  // "close_call", "kpi_summary", "run_failed"

  std::int64_t t_ns = 0;       // since run start (steady clock)
  std::int64_t t_wall_ns = 0;  // epoch

  std::string message;  // optional human-readable hint

  // Optional JSON object text (including braces), written verbatim as "payload".
  std::string payload;
};

class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual Status open(const RunInfo& run) = 0;
  virtual Status emit(const Event& e) = 0;
  virtual Status flush() = 0;
  virtual void close() = 0;
};

}  // namespace nm
