// File: src/core/util/repro_hash.cpp
#include "nm/core/util/repro_hash.hpp"

#include <bit>
#include <cstdint>
#include <optional>
#include <string>

namespace nm {
namespace {

// FNV-1a 64-bit over the raw bytes of each field. Fingerprint only, not cryptographic.
struct Fnv1a64 {
  std::uint64_t h = 1469598103934665603ull;

  void add_bytes(const void* data, std::size_t n) {
    const auto* p = static_cast<const std::uint8_t*>(data);
    for (std::size_t i = 0; i < n; ++i) {
      h ^= static_cast<std::uint64_t>(p[i]);
      h *= 1099511628211ull;
    }
  }

  void add_u64(std::uint64_t v) { add_bytes(&v, sizeof(v)); }
  void add_i64(std::int64_t v)  { add_bytes(&v, sizeof(v)); }

  void add_bool(bool v) {
    const std::uint8_t b = v ? 1u : 0u;
    add_bytes(&b, sizeof(b));
  }

  void add_string(const std::string& s) {
    // Include length so ("ab","c") != ("a","bc") in concatenations.
    add_u64(static_cast<std::uint64_t>(s.size()));
    add_bytes(s.data(), s.size());
  }

  void add_double(double v) {
    const std::uint64_t bits = std::bit_cast<std::uint64_t>(v);
    add_u64(bits);
  }

  // Presence flag first, so "absent" never collides with any value.
  void add_opt_time(const std::optional<TimestampMs>& t) {
    add_bool(t.has_value());
    if (t) add_i64(t->ms);
  }

  void add_opt_string(const std::optional<std::string>& s) {
    add_bool(s.has_value());
    if (s) add_string(*s);
  }
};

std::string to_hex(std::uint64_t v) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out(16, '0');
  for (int i = 15; i >= 0; --i) {
    out[static_cast<std::size_t>(i)] = kHex[v & 0xF];
    v >>= 4;
  }
  return out;
}

void add_query(Fnv1a64& h, const QueryParams& q) {
  h.add_double(q.distance_threshold_m);
  h.add_i64(q.time_window_ms);
  h.add_opt_time(q.from_time);
  h.add_opt_time(q.to_time);
  h.add_opt_string(q.zone);
  h.add_bool(q.vehicle_class.has_value());
  if (q.vehicle_class) h.add_i64(static_cast<std::int64_t>(*q.vehicle_class));
  h.add_u64(static_cast<std::uint64_t>(q.batch_size));
}

}  // namespace

std::string compute_query_hash(const QueryParams& q) {
  Fnv1a64 h;
  add_query(h, q);
  return to_hex(h.h);
}

std::string compute_config_hash(const Config& cfg) {
  Fnv1a64 h;

  h.add_string(cfg.site_id);

  // Query.
  add_query(h, cfg.query);

  // Input.
  h.add_string(cfg.input.type);
  h.add_u64(cfg.input.synth.seed);
  h.add_i64(cfg.input.synth.num_observations);
  h.add_double(cfg.input.synth.duration_s);
  h.add_i64(cfg.input.synth.start_time.ms);
  h.add_i64(cfg.input.synth.guaranteed_close_calls);

  // Output.
  h.add_string(cfg.output.out_dir);
  h.add_bool(cfg.output.emit_close_calls);
  h.add_i64(cfg.output.keep_last_runs);

  // Safety.
  h.add_bool(cfg.safety.enabled);
  h.add_double(cfg.safety.params.speed_threshold_mps);
  h.add_bool(cfg.safety.params.include_humans_in_speed);

  // Logging.
  h.add_string(cfg.logging.level);
  h.add_string(cfg.logging.pattern);

  return to_hex(h.h);
}

}  // namespace nm
