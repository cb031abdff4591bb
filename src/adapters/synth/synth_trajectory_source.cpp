// File: src/adapters/synth/synth_trajectory_source.cpp
#include "nm/adapters/synth/synth_trajectory_source.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdio>
#include <optional>
#include <random>
#include <utility>
#include <vector>

namespace nm {
namespace {

struct Hotspot {
  const char* zone;
  double x0, x1;
  double y0, y1;
};

constexpr std::array<Hotspot, 4> kHotspots = {{
    {"12", 2.0, 8.0, 17.0, 23.0},
    {"12", 10.0, 15.0, 18.0, 22.0},
    {"9", 12.0, 18.0, 16.0, 24.0},
    {"1", 12.0, 14.0, 145.0, 148.0},
}};

constexpr std::array<const char*, 4> kQuietZones = {"2", "15", "20", "25"};

// (zone, human x range, human y range, vehicle offset)
struct Scenario {
  const char* zone;
  double hx0, hx1;
  double hy0, hy1;
  double dx, dy;
};

constexpr std::array<Scenario, 4> kScenarios = {{
    {"12", 3.0, 7.0, 18.0, 20.0, 0.5, 0.0},     // parallel, 0.5 m
    {"12", 4.0, 8.0, 19.0, 21.0, 1.2, 0.0},     // parallel, 1.2 m
    {"9", 13.0, 16.0, 17.0, 19.0, 0.0, 0.8},    // perpendicular, 0.8 m
    {"1", 12.5, 13.5, 146.0, 147.0, 0.7, 0.7},  // diagonal, ~1.0 m
}};

std::string make_id(const char* prefix, int n) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%s_%03d", prefix, n);
  return buf;
}

double round2(double v) { return std::round(v * 100.0) / 100.0; }

class Generator {
 public:
  explicit Generator(const SynthSourceConfig& cfg) : cfg_(cfg), rng_(cfg.seed) {
    span_ms_ = std::max<std::int64_t>(1, static_cast<std::int64_t>(cfg.duration_s * 1000.0));
  }

  double uniform(double lo, double hi) { return std::uniform_real_distribution<double>(lo, hi)(rng_); }
  int pick(int n) { return std::uniform_int_distribution<int>(0, n - 1)(rng_); }
  bool chance(double p) { return uniform(0.0, 1.0) < p; }

  TimestampMs random_time() {
    const std::int64_t off = std::uniform_int_distribution<std::int64_t>(0, span_ms_ - 1)(rng_);
    return TimestampMs{cfg_.start_time.ms + off};
  }

  std::optional<double> maybe_heading(double p_present) {
    const double h = round2(uniform(0.0, 360.0));
    return chance(p_present) ? std::optional<double>(h) : std::nullopt;
  }

  void guaranteed_pair(Observations& rows, std::int64_t& next_id) {
    const Scenario& s = kScenarios[static_cast<std::size_t>(pick(static_cast<int>(kScenarios.size())))];
    const double hx = round2(uniform(s.hx0, s.hx1));
    const double hy = round2(uniform(s.hy0, s.hy1));

    // Keep the vehicle inside the window: the human must start early enough.
    TimestampMs ht = random_time();
    ht.ms = std::min(ht.ms, cfg_.start_time.ms + span_ms_ - 201);
    ht.ms = std::max(ht.ms, cfg_.start_time.ms);
    const TimestampMs vt{ht.ms + std::uniform_int_distribution<int>(50, 200)(rng_)};

    Observation h;
    h.id = next_id++;
    h.tracking_id = make_id("human", 1 + pick(10));
    h.object_class = ObjectClass::kHuman;
    h.timestamp = ht;
    h.x = hx;
    h.y = hy;
    h.vest = pick(4) != 0;
    h.speed_mps = round2(uniform(0.5, 1.5));
    h.zone = s.zone;
    h.heading_deg = maybe_heading(0.7);
    rows.push_back(std::move(h));

    Observation v;
    v.id = next_id++;
    const double roll = uniform(0.0, 1.0);
    if (roll < 0.5) {
      v.object_class = ObjectClass::kVehicle;
      v.tracking_id = make_id("vehicle", 1 + pick(7));
    } else if (roll < 0.8) {
      v.object_class = ObjectClass::kPalletTruck;
      v.tracking_id = make_id("pallet", 1 + pick(5));
    } else {
      v.object_class = ObjectClass::kAgv;
      v.tracking_id = make_id("agv", 1 + pick(3));
    }
    v.timestamp = vt;
    v.x = hx + s.dx;
    v.y = hy + s.dy;
    v.speed_mps = round2(uniform(0.3, 1.2));
    v.zone = s.zone;
    v.heading_deg = maybe_heading(0.7);
    rows.push_back(std::move(v));
  }

  Observation background(std::int64_t id) {
    Observation o;
    o.id = id;

    const double roll = uniform(0.0, 1.0);
    if (roll < 0.4) {
      o.object_class = ObjectClass::kHuman;
      o.tracking_id = make_id("human", 1 + pick(20));
      o.vest = pick(4) != 0;
      o.speed_mps = round2(uniform(0.0, 2.5));
    } else if (roll < 0.7) {
      o.object_class = ObjectClass::kVehicle;
      o.tracking_id = make_id("vehicle", 1 + pick(15));
      o.speed_mps = round2(uniform(0.0, 1.5));
    } else if (roll < 0.9) {
      o.object_class = ObjectClass::kPalletTruck;
      o.tracking_id = make_id("pallet", 1 + pick(10));
      o.speed_mps = round2(uniform(0.0, 1.2));
    } else {
      o.object_class = ObjectClass::kAgv;
      o.tracking_id = make_id("agv", 1 + pick(5));
      o.speed_mps = round2(uniform(0.5, 2.0));
    }

    // Bias towards the hotspots.
    if (chance(0.7)) {
      const Hotspot& h = kHotspots[static_cast<std::size_t>(pick(static_cast<int>(kHotspots.size())))];
      o.zone = h.zone;
      o.x = round2(uniform(h.x0, h.x1));
      o.y = round2(uniform(h.y0, h.y1));
    } else {
      o.zone = kQuietZones[static_cast<std::size_t>(pick(static_cast<int>(kQuietZones.size())))];
      o.x = round2(uniform(0.0, 30.0));
      o.y = round2(uniform(0.0, 160.0));
    }

    o.timestamp = random_time();
    // Temporal clustering: some rows land within +-1 s of a random instant.
    if (chance(0.3)) {
      const TimestampMs base = random_time();
      const std::int64_t jitter = std::uniform_int_distribution<std::int64_t>(-1000, 1000)(rng_);
      o.timestamp.ms = std::clamp(base.ms + jitter, cfg_.start_time.ms,
                                  cfg_.start_time.ms + span_ms_ - 1);
    }

    o.heading_deg = maybe_heading(0.8);
    return o;
  }

 private:
  const SynthSourceConfig& cfg_;
  std::mt19937 rng_;
  std::int64_t span_ms_{1};
};

}  // namespace

SynthTrajectorySource::SynthTrajectorySource(SynthSourceConfig cfg) : cfg_(std::move(cfg)) {}

Status SynthTrajectorySource::open() {
  if (cfg_.num_observations < 0) {
    return Status::invalid_argument("SynthTrajectorySource: num_observations must be >= 0");
  }
  if (cfg_.guaranteed_close_calls < 0) {
    return Status::invalid_argument("SynthTrajectorySource: guaranteed_close_calls must be >= 0");
  }
  if (!(cfg_.duration_s > 0.0)) {
    return Status::invalid_argument("SynthTrajectorySource: duration_s must be > 0");
  }

  Generator gen(cfg_);
  Observations rows;
  rows.reserve(static_cast<std::size_t>(cfg_.num_observations));

  // Each guaranteed close call costs two rows.
  const int pairs = std::min(cfg_.guaranteed_close_calls, cfg_.num_observations / 2);
  std::int64_t next_id = 1;
  for (int i = 0; i < pairs; ++i) gen.guaranteed_pair(rows, next_id);

  while (static_cast<int>(rows.size()) < cfg_.num_observations) {
    rows.push_back(gen.background(next_id++));
  }

  store_ = MemoryTrajectorySource(std::move(rows));
  opened_ = true;
  return Status::ok_status();
}

Result<Observations> SynthTrajectorySource::fetch(const ObservationQuery& query) const {
  if (!opened_) {
    return Result<Observations>::err(
        Status::invalid_argument("SynthTrajectorySource::fetch: not opened"));
  }
  return store_.fetch(query);
}

}  // namespace nm
