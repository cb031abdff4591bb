// File: include/nm/core/events/event_json.hpp
#pragma once

#include <string>
#include <string_view>

#include "nm/core/model/near_miss_engine.hpp"
#include "nm/core/types.hpp"

namespace nm {

// Escapes quotes, backslashes and control characters for a JSON string body.
std::string json_escape(std::string_view s);

// Payload builders for the event stream. Each returns one JSON object.
std::string close_call_json(const CloseCall& c);
std::string kpi_summary_json(const KpiResult& r);

}  // namespace nm
