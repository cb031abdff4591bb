// src/core/util/config_loader.cpp
#include "nm/core/util/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <optional>
#include <set>
#include <string>

#include <yaml-cpp/yaml.h>

#include "nm/core/util/time_format.hpp"

namespace nm {
namespace fs = std::filesystem;

static std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

static bool is_map(const YAML::Node& n) { return n && n.IsMap(); }
static bool is_set(const YAML::Node& n) { return n && !n.IsNull(); }

// Recursive merge: maps merge keys; scalars/sequences override.
static YAML::Node merge_yaml(const YAML::Node& base, const YAML::Node& override_) {
  if (!base) return override_;
  if (!override_) return base;

  if (base.IsMap() && override_.IsMap()) {
    YAML::Node out = YAML::Clone(base);
    for (auto it : override_) {
      const auto key = it.first.as<std::string>();
      const auto val = it.second;
      if (out[key]) out[key] = merge_yaml(out[key], val);
      else out[key] = val;
    }
    return out;
  }

  // For scalars, sequences, etc., override completely.
  return override_;
}

template <typename T>
static void maybe_set(const YAML::Node& n, const char* key, T& out) {
  if (!n || !is_set(n[key])) return;
  out = n[key].as<T>();
}

// Optional timestamp: absent or null leaves `out` untouched.
static Status maybe_set_time(const YAML::Node& n, const char* key, std::optional<TimestampMs>& out) {
  if (!n || !is_set(n[key])) return Status::ok_status();
  auto t = parse_timestamp(n[key].as<std::string>());
  if (!t.ok()) return Status::invalid_argument(std::string(key) + ": " + t.status().message());
  out = t.take_value();
  return Status::ok_status();
}

static Result<YAML::Node> load_yaml_file(const fs::path& path) {
  try {
    if (!fs::exists(path)) {
      return Result<YAML::Node>::err(Status::not_found("config not found: " + path.string()));
    }
    return Result<YAML::Node>::ok(YAML::LoadFile(path.string()));
  } catch (const YAML::Exception& e) {
    return Result<YAML::Node>::err(Status::parse_error("YAML parse error in " + path.string() + ": " + e.what()));
  } catch (const std::exception& e) {
    return Result<YAML::Node>::err(Status::io_error("failed to load " + path.string() + ": " + e.what()));
  }
}

static Result<YAML::Node> resolve_includes(YAML::Node root, const fs::path& dir,
                                           std::set<std::string>& visiting);

static Result<YAML::Node> load_with_includes(const fs::path& path, std::set<std::string>& visiting) {
  std::error_code ec;
  const fs::path canon = fs::weakly_canonical(path, ec);
  const std::string key = ec ? path.string() : canon.string();
  if (visiting.count(key) != 0) {
    return Result<YAML::Node>::err(Status::invalid_argument("include cycle at " + path.string()));
  }

  auto root_r = load_yaml_file(path);
  if (!root_r.ok()) return Result<YAML::Node>::err(root_r.status());

  visiting.insert(key);
  auto out = resolve_includes(root_r.take_value(), path.parent_path(), visiting);
  visiting.erase(key);
  return out;
}

static Result<YAML::Node> resolve_includes(YAML::Node root, const fs::path& dir,
                                           std::set<std::string>& visiting) {
  YAML::Node merged;  // empty

  // Optional top-level includes: ["a.yaml", "b.yaml"]
  if (root.IsMap() && root["includes"]) {
    const YAML::Node inc = root["includes"];
    if (!inc.IsSequence()) {
      return Result<YAML::Node>::err(Status::invalid_argument("includes must be a YAML sequence"));
    }

    for (std::size_t i = 0; i < inc.size(); ++i) {
      const auto rel = inc[i].as<std::string>();
      const fs::path child = fs::path(rel).is_absolute() ? fs::path(rel) : (dir / rel);
      auto child_r = load_with_includes(child, visiting);  // recursive
      if (!child_r.ok()) return Result<YAML::Node>::err(child_r.status());
      merged = merge_yaml(merged, child_r.take_value());
    }
    root.remove("includes");
  }

  // Finally override with this file's contents (excluding includes itself).
  merged = merge_yaml(merged, root);
  return Result<YAML::Node>::ok(merged);
}

static Status populate(const YAML::Node& y, Config& cfg) {
  maybe_set(y, "site_id", cfg.site_id);

  // --- query
  if (is_map(y["query"])) {
    const auto q = y["query"];
    maybe_set(q, "distance_threshold_m", cfg.query.distance_threshold_m);
    maybe_set(q, "time_window_ms", cfg.query.time_window_ms);
    NM_RETURN_IF_ERROR(maybe_set_time(q, "from_time", cfg.query.from_time));
    NM_RETURN_IF_ERROR(maybe_set_time(q, "to_time", cfg.query.to_time));

    if (is_set(q["zone"])) cfg.query.zone = q["zone"].as<std::string>();

    if (is_set(q["vehicle_class"])) {
      const auto s = to_lower(q["vehicle_class"].as<std::string>());
      const auto c = parse_object_class(s);
      if (!c) return Status::invalid_argument("unknown query.vehicle_class: " + s);
      cfg.query.vehicle_class = *c;
    }

    if (is_set(q["batch_size"])) {
      const auto b = q["batch_size"].as<long long>();
      if (b <= 0) return Status::invalid_argument("query.batch_size must be > 0");
      cfg.query.batch_size = static_cast<std::size_t>(b);
    }
  }

  // --- input
  if (is_map(y["input"])) {
    const auto in = y["input"];
    if (is_set(in["type"])) cfg.input.type = to_lower(in["type"].as<std::string>());

    if (is_map(in["synth"])) {
      const auto s = in["synth"];
      maybe_set(s, "seed", cfg.input.synth.seed);
      maybe_set(s, "num_observations", cfg.input.synth.num_observations);
      maybe_set(s, "duration_s", cfg.input.synth.duration_s);
      maybe_set(s, "guaranteed_close_calls", cfg.input.synth.guaranteed_close_calls);

      std::optional<TimestampMs> start;
      NM_RETURN_IF_ERROR(maybe_set_time(s, "start_time", start));
      if (start) cfg.input.synth.start_time = *start;
    }
  }

  // --- output
  if (is_map(y["output"])) {
    const auto o = y["output"];
    maybe_set(o, "out_dir", cfg.output.out_dir);
    maybe_set(o, "emit_close_calls", cfg.output.emit_close_calls);
    maybe_set(o, "keep_last_runs", cfg.output.keep_last_runs);
  }

  // --- safety
  if (is_map(y["safety"])) {
    const auto sf = y["safety"];
    maybe_set(sf, "enabled", cfg.safety.enabled);
    maybe_set(sf, "speed_threshold_mps", cfg.safety.params.speed_threshold_mps);
    maybe_set(sf, "include_humans_in_speed", cfg.safety.params.include_humans_in_speed);
  }

  // --- logging
  if (is_map(y["logging"])) {
    const auto l = y["logging"];
    if (is_set(l["level"])) cfg.logging.level = to_lower(l["level"].as<std::string>());
    maybe_set(l, "pattern", cfg.logging.pattern);
  }

  return Status::ok_status();
}

static Result<Config> build_config(const YAML::Node& y) {
  Config cfg;  // defaults

  try {
    const Status s = populate(y, cfg);
    if (!s.ok()) return Result<Config>::err(s);
  } catch (const YAML::Exception& e) {
    return Result<Config>::err(Status::parse_error(std::string("config value error: ") + e.what()));
  }

  // Final validation (fail early).
  const Status s = validate_config(cfg);
  if (!s.ok()) return Result<Config>::err(s);

  return Result<Config>::ok(cfg);
}

Result<Config> load_config(const std::string& path_str) {
  std::set<std::string> visiting;
  try {
    auto yaml_r = load_with_includes(fs::path(path_str), visiting);
    if (!yaml_r.ok()) return Result<Config>::err(yaml_r.status());
    return build_config(yaml_r.take_value());
  } catch (const YAML::Exception& e) {
    return Result<Config>::err(Status::parse_error("YAML include error in " + path_str + ": " + e.what()));
  }
}

Result<Config> load_config_from_string(const std::string& yaml, const std::string& base_dir) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml);
  } catch (const YAML::Exception& e) {
    return Result<Config>::err(Status::parse_error(std::string("YAML parse error: ") + e.what()));
  }

  std::set<std::string> visiting;
  try {
    auto merged_r = resolve_includes(root, fs::path(base_dir), visiting);
    if (!merged_r.ok()) return Result<Config>::err(merged_r.status());
    return build_config(merged_r.take_value());
  } catch (const YAML::Exception& e) {
    return Result<Config>::err(Status::parse_error(std::string("YAML include error: ") + e.what()));
  }
}

}  // namespace nm
