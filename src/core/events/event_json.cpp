// File: src/core/events/event_json.cpp
#include "nm/core/events/event_json.hpp"

#include <cmath>
#include <cstdio>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "nm/core/util/time_format.hpp"

namespace nm {
namespace {

// JSON has no NaN/Infinity; aggregates never produce them, but keep the output parseable.
void put_num(std::ostringstream& ss, double v) {
  if (!std::isfinite(v)) v = 0.0;
  ss << v;
}

void put_str(std::ostringstream& ss, std::string_view s) { ss << '"' << json_escape(s) << '"'; }

void put_opt_str(std::ostringstream& ss, const std::optional<std::string>& s) {
  if (s) {
    put_str(ss, *s);
  } else {
    ss << "null";
  }
}

void put_opt_num(std::ostringstream& ss, const std::optional<double>& v) {
  if (v) {
    put_num(ss, *v);
  } else {
    ss << "null";
  }
}

void put_observation(std::ostringstream& ss, const Observation& o) {
  ss << "{\"id\":" << o.id << ",\"tracking_id\":";
  put_str(ss, o.tracking_id);
  ss << ",\"class\":\"" << to_string(o.object_class) << "\""
     << ",\"timestamp\":\"" << format_timestamp(o.timestamp) << "\""
     << ",\"x\":";
  put_num(ss, o.x);
  ss << ",\"y\":";
  put_num(ss, o.y);
  ss << ",\"heading_deg\":";
  put_opt_num(ss, o.heading_deg);
  ss << ",\"speed_mps\":";
  put_opt_num(ss, o.speed_mps);
  if (o.vest) ss << ",\"vest\":" << (*o.vest ? "true" : "false");
  ss << ",\"zone\":";
  put_opt_str(ss, o.zone);
  ss << "}";
}

void put_repeat_offenders(std::ostringstream& ss, const std::vector<RepeatOffender>& list) {
  ss << "[";
  for (std::size_t i = 0; i < list.size(); ++i) {
    const RepeatOffender& o = list[i];
    if (i) ss << ",";
    ss << "{\"tracking_id\":";
    put_str(ss, o.tracking_id);
    ss << ",\"type\":\"" << to_string(o.type) << "\",\"total_events\":" << o.total_events
       << ",\"rate_per_hour\":";
    put_num(ss, o.rate_per_hour);
    if (o.type == ViolationType::kOverspeed) {
      ss << ",\"avg_excess_mps\":";
      put_num(ss, o.avg_excess_mps);
    }
    ss << "}";
  }
  ss << "]";
}

// Counts and breakdowns only; the individual rows are not repeated in the summary.
void put_safety(std::ostringstream& ss, const SafetyViolationSummary& s) {
  ss << "{\"speed_threshold_mps\":";
  put_num(ss, s.params.speed_threshold_mps);
  ss << ",\"include_humans_in_speed\":" << (s.params.include_humans_in_speed ? "true" : "false")
     << ",\"vest_violations_count\":" << s.vest_violations.size()
     << ",\"vest_violations_unique_humans\":" << s.unique_humans_with_vest_violations
     << ",\"human_detections\":" << s.human_detections << ",\"vest_compliance_percentage\":";
  put_num(ss, s.vest_compliance_percentage);
  ss << ",\"overspeed_events_count\":" << s.overspeed_events.size()
     << ",\"overspeed_events_unique_vehicles\":" << s.unique_vehicles_overspeeding
     << ",\"avg_overspeed_excess_mps\":";
  put_num(ss, s.avg_overspeed_excess_mps);

  ss << ",\"overspeed_by_class\":{";
  for (std::size_t i = 0; i < s.overspeed_by_class.size(); ++i) {
    if (i) ss << ",";
    ss << "\"" << to_string(s.overspeed_by_class[i].object_class) << "\":"
       << s.overspeed_by_class[i].count;
  }
  ss << "}";

  ss << ",\"zone_analysis\":{\"worst_zone_vest\":";
  put_opt_str(ss, s.worst_zone_vest);
  ss << ",\"worst_zone_speed\":";
  put_opt_str(ss, s.worst_zone_speed);
  ss << ",\"by_zone\":[";
  for (std::size_t i = 0; i < s.by_zone.size(); ++i) {
    const SafetyZoneStats& z = s.by_zone[i];
    if (i) ss << ",";
    ss << "{\"zone\":";
    put_str(ss, z.zone);
    ss << ",\"vest_violations\":" << z.vest_violations
       << ",\"overspeed_events\":" << z.overspeed_events
       << ",\"total_violations\":" << z.total() << "}";
  }
  ss << "]}";

  ss << ",\"time_series\":[";
  for (std::size_t i = 0; i < s.time_series.size(); ++i) {
    const SafetyHourPoint& p = s.time_series[i];
    if (i) ss << ",";
    ss << "{\"hour\":\"" << format_minute(p.hour) << "\",\"vest_violations\":"
       << p.vest_violations << ",\"overspeed_events\":" << p.overspeed_events << "}";
  }
  ss << "]";

  ss << ",\"repeat_offenders\":{\"vest\":";
  put_repeat_offenders(ss, s.vest_offenders);
  ss << ",\"speed\":";
  put_repeat_offenders(ss, s.speed_offenders);
  ss << "}}";
}

}  // namespace

std::string json_escape(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (const char ch : s) {
    switch (ch) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(ch)));
          out += buf;
        } else {
          out += ch;
        }
    }
  }
  return out;
}

std::string close_call_json(const CloseCall& c) {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(3);

  ss << "{\"human\":";
  put_observation(ss, c.human);
  ss << ",\"vehicle\":";
  put_observation(ss, c.vehicle);
  ss << ",\"distance_m\":";
  put_num(ss, c.distance_m);
  ss << ",\"distance_threshold_m\":";
  put_num(ss, c.distance_threshold_m);
  ss << ",\"time_window_ms\":" << c.time_window_ms
     << ",\"time_difference_ms\":" << c.time_difference_ms
     << ",\"severity\":\"" << to_string(c.severity) << "\""
     << ",\"zone\":";
  put_opt_str(ss, c.zone());
  ss << "}";
  return ss.str();
}

std::string kpi_summary_json(const KpiResult& r) {
  const KpiAggregates& k = r.kpis;

  std::ostringstream ss;
  ss << std::fixed << std::setprecision(3);

  ss << "{\"close_calls_count\":" << r.close_calls_count();

  // time series
  ss << ",\"time_series\":[";
  for (std::size_t i = 0; i < k.time_series.size(); ++i) {
    if (i) ss << ",";
    ss << "{\"minute\":\"" << format_minute(k.time_series[i].minute) << "\",\"count\":"
       << k.time_series[i].count << "}";
  }
  ss << "]";

  // top offenders
  ss << ",\"top_offenders\":[";
  for (std::size_t i = 0; i < k.top_offenders.size(); ++i) {
    const TopOffender& o = k.top_offenders[i];
    if (i) ss << ",";
    ss << "{\"vehicle_id\":";
    put_str(ss, o.vehicle_id);
    ss << ",\"vehicle_class\":\"" << to_string(o.vehicle_class) << "\""
       << ",\"close_calls\":" << o.close_calls << ",\"exposure_minutes\":" << o.exposure_minutes
       << ",\"rate_per_minute\":";
    put_num(ss, o.rate_per_minute);
    ss << ",\"derived_speed_mps\":";
    put_num(ss, o.derived_speed_mps);
    ss << "}";
  }
  ss << "]";

  // zones
  ss << ",\"zone_analysis\":{\"worst_zone\":";
  put_opt_str(ss, k.zone_analysis.worst_zone);
  ss << ",\"by_zone\":[";
  for (std::size_t i = 0; i < k.zone_analysis.by_zone.size(); ++i) {
    const ZoneStats& z = k.zone_analysis.by_zone[i];
    if (i) ss << ",";
    ss << "{\"zone\":";
    put_str(ss, z.zone);
    ss << ",\"close_calls\":" << z.close_calls << ",\"avg_distance_m\":";
    put_num(ss, z.avg_distance_m);
    ss << ",\"min_distance_m\":";
    put_num(ss, z.min_distance_m);
    ss << ",\"max_distance_m\":";
    put_num(ss, z.max_distance_m);
    ss << "}";
  }
  ss << "]}";

  // rate
  const NearMissRate& nr = k.near_miss_rate;
  ss << ",\"near_miss_rate\":{\"rate_per_100_minutes\":";
  put_num(ss, nr.rate_per_100_minutes);
  ss << ",\"total_vehicle_minutes\":";
  put_num(ss, nr.total_vehicle_minutes);
  ss << ",\"unique_vehicles\":" << nr.unique_vehicles << ",\"observation_minutes\":";
  put_num(ss, nr.observation_minutes);
  ss << "}";

  // severity
  ss << ",\"severity_analysis\":{";
  for (std::size_t i = 0; i < k.severity_analysis.tiers.size(); ++i) {
    const SeverityStats& s = k.severity_analysis.tiers[i];
    if (i) ss << ",";
    ss << "\"" << to_string(s.severity) << "\":{\"count\":" << s.count << ",\"percentage\":";
    put_num(ss, s.percentage);
    ss << ",\"avg_distance_m\":";
    put_num(ss, s.avg_distance_m);
    ss << "}";
  }
  ss << "}";

  // vehicle classes
  ss << ",\"by_vehicle_class\":{";
  for (std::size_t i = 0; i < k.by_vehicle_class.size(); ++i) {
    if (i) ss << ",";
    ss << "\"" << to_string(k.by_vehicle_class[i].vehicle_class) << "\":"
       << k.by_vehicle_class[i].count;
  }
  ss << "}";

  // stats
  const ComputationStats& st = r.stats;
  ss << ",\"computation_stats\":{\"human_detections_processed\":" << st.human_detections_processed
     << ",\"vehicle_detections_processed\":" << st.vehicle_detections_processed
     << ",\"close_calls_detected\":" << st.close_calls_detected << ",\"computation_time_ms\":";
  put_num(ss, st.computation_time_ms);
  ss << "}";

  // parameters echo
  const QueryParams& q = r.parameters_used;
  ss << ",\"parameters_used\":{\"distance_threshold_m\":";
  put_num(ss, q.distance_threshold_m);
  ss << ",\"time_window_ms\":" << q.time_window_ms << ",\"from_time\":";
  if (q.from_time) {
    put_str(ss, format_timestamp(*q.from_time));
  } else {
    ss << "null";
  }
  ss << ",\"to_time\":";
  if (q.to_time) {
    put_str(ss, format_timestamp(*q.to_time));
  } else {
    ss << "null";
  }
  ss << ",\"zone\":";
  put_opt_str(ss, q.zone);
  ss << ",\"vehicle_class\":";
  if (q.vehicle_class) {
    put_str(ss, to_string(*q.vehicle_class));
  } else {
    ss << "null";
  }
  ss << ",\"batch_size\":" << q.batch_size << "}";

  ss << ",\"safety_violations\":";
  if (r.safety) {
    put_safety(ss, *r.safety);
  } else {
    ss << "null";
  }

  ss << "}";
  return ss.str();
}

}  // namespace nm
