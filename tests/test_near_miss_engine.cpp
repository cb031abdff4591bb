// File: tests/test_near_miss_engine.cpp
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include "nm/adapters/memory/memory_trajectory_source.hpp"
#include "nm/adapters/synth/synth_trajectory_source.hpp"
#include "nm/core/model/near_miss_engine.hpp"
#include "test_util.hpp"

namespace {

using nm::ObjectClass;
using nm::Status;
using nm::TimestampMs;
using nm_test::expect_code;
using nm_test::expect_near;
using nm_test::expect_true;
using nm_test::kT0;

// Wraps a source and records every query it is asked.
class RecordingSource final : public nm::ITrajectorySource {
 public:
  explicit RecordingSource(const nm::ITrajectorySource& inner) : inner_(inner) {}

  nm::Result<nm::Observations> fetch(const nm::ObservationQuery& q) const override {
    queries.push_back(q);
    return inner_.fetch(q);
  }
  std::string name() const override { return "recording"; }

  mutable std::vector<nm::ObservationQuery> queries;

 private:
  const nm::ITrajectorySource& inner_;
};

class FailingSource final : public nm::ITrajectorySource {
 public:
  nm::Result<nm::Observations> fetch(const nm::ObservationQuery&) const override {
    return nm::Result<nm::Observations>::err(Status::io_error("feed unavailable"));
  }
  std::string name() const override { return "failing"; }
};

class ThrowingSource final : public nm::ITrajectorySource {
 public:
  nm::Result<nm::Observations> fetch(const nm::ObservationQuery&) const override {
    throw std::runtime_error("boom");
  }
  std::string name() const override { return "throwing"; }
};

nm::MemoryTrajectorySource scenario_store() {
  nm::MemoryTrajectorySource src;
  src.add(nm_test::obs(1, "human_001", ObjectClass::kHuman, kT0, 0.0, 0.0, std::string("12")));
  src.add(nm_test::obs(2, "vehicle_001", ObjectClass::kVehicle, kT0 + 100, 1.0, 0.0, std::string("12")));
  src.add(nm_test::obs(3, "agv_001", ObjectClass::kAgv, kT0 + 50, 0.0, 0.5, std::string("12")));
  src.add(nm_test::obs(4, "vehicle_002", ObjectClass::kVehicle, kT0 + 400, 0.2, 0.0, std::string("12")));
  src.add(nm_test::obs(5, "human_002", ObjectClass::kHuman, kT0 + 60'000, 10.0, 10.0, std::string("9")));
  src.add(nm_test::obs(6, "pallet_001", ObjectClass::kPalletTruck, kT0 + 60'000, 10.0, 11.5, std::string("9")));
  return src;
}

void test_end_to_end() {
  const auto store = scenario_store();
  const nm::NearMissEngine engine(store);

  auto r = engine.compute({});
  expect_true(r.ok(), "compute ok");
  if (!r.ok()) return;

  expect_true(r->close_calls_count() == 3, "three close calls");
  expect_true(r->stats.human_detections_processed == 2, "two humans");
  expect_true(r->stats.vehicle_detections_processed == 4, "four vehicle-class rows in range");
  expect_true(r->stats.close_calls_detected == 3, "stats count");
  expect_true(r->stats.computation_time_ms >= 0.0, "timing recorded");

  const auto& k = r->kpis;
  expect_true(k.zone_analysis.worst_zone && *k.zone_analysis.worst_zone == "12", "worst zone");
  expect_true(k.by_vehicle_class[0].count == 1 && k.by_vehicle_class[1].count == 1 &&
                  k.by_vehicle_class[2].count == 1,
              "one per class");
  expect_true(k.severity_analysis[nm::Severity::kHigh].count == 1, "agv at 0.5 m is HIGH");
  expect_true(k.severity_analysis[nm::Severity::kMedium].count == 1, "vehicle at 1.0 m is MEDIUM");
  expect_true(k.severity_analysis[nm::Severity::kLow].count == 1, "pallet truck at 1.5 m is LOW");
  expect_near(k.near_miss_rate.observation_minutes, 1.0, 1e-12, "span of the matched humans");
  expect_true(k.time_series.size() == 2, "two minute buckets");
  expect_near(r->parameters_used.distance_threshold_m, 2.0, 0.0, "parameters echoed");
}

void test_vehicle_fetch_window() {
  const auto store = scenario_store();
  const RecordingSource rec(store);
  const nm::NearMissEngine engine(rec);

  nm::QueryParams q;
  q.time_window_ms = 250;
  q.zone = "12";
  auto r = engine.compute(q);
  expect_true(r.ok(), "compute ok");
  expect_true(rec.queries.size() == 2, "humans then vehicles");
  if (rec.queries.size() != 2) return;

  const auto& hq = rec.queries[0];
  expect_true(hq.classes.size() == 1 && hq.classes[0] == ObjectClass::kHuman, "human fetch");
  expect_true(hq.zone && *hq.zone == "12", "zone forwarded to human fetch");

  const auto& vq = rec.queries[1];
  expect_true(vq.classes.size() == 3, "all vehicle classes");
  expect_true(vq.from && vq.from->ms == kT0 - 250, "vehicle fetch starts at first human - w");
  expect_true(vq.to && vq.to->ms == kT0 + 251, "vehicle fetch covers last human + w inclusive");
  expect_true(vq.zone && *vq.zone == "12", "zone forwarded to vehicle fetch");

  if (r.ok()) expect_true(r->close_calls_count() == 2, "zone 12 only");
}

void test_vehicle_class_filter() {
  const auto store = scenario_store();
  const nm::NearMissEngine engine(store);

  nm::QueryParams q;
  q.vehicle_class = ObjectClass::kAgv;
  auto r = engine.compute(q);
  expect_true(r.ok() && r->close_calls_count() == 1, "only the agv");
  if (r.ok() && !r->close_calls.empty()) {
    expect_true(r->close_calls[0].vehicle.object_class == ObjectClass::kAgv, "agv call");
  }
}

void test_validation_before_fetch() {
  const auto store = scenario_store();
  const RecordingSource rec(store);
  const nm::NearMissEngine engine(rec);

  nm::QueryParams q;
  q.distance_threshold_m = 0.0;
  expect_code(engine.compute(q).status(), Status::Code::kInvalidArgument, "zero threshold");

  q = {};
  q.time_window_ms = -1;
  expect_code(engine.compute(q).status(), Status::Code::kInvalidArgument, "negative window");

  q = {};
  q.from_time = TimestampMs{kT0};
  q.to_time = TimestampMs{kT0};
  expect_code(engine.compute(q).status(), Status::Code::kInvalidArgument, "from == to");

  q = {};
  q.batch_size = 0;
  expect_code(engine.compute(q).status(), Status::Code::kInvalidArgument, "zero batch");

  q = {};
  q.vehicle_class = ObjectClass::kHuman;
  expect_code(engine.compute(q).status(), Status::Code::kInvalidArgument, "human is not a vehicle class");

  expect_true(rec.queries.empty(), "no fetch issued for invalid parameters");
}

void test_empty_sides() {
  nm::MemoryTrajectorySource only_vehicles;
  only_vehicles.add(nm_test::obs(1, "vehicle_001", ObjectClass::kVehicle, kT0, 0, 0));
  const RecordingSource rec(only_vehicles);
  auto a = nm::NearMissEngine(rec).compute({});
  expect_true(a.ok() && a->close_calls_count() == 0, "no humans, no calls");
  expect_true(rec.queries.size() == 1, "vehicle fetch skipped without humans");
  if (a.ok()) {
    expect_near(a->kpis.near_miss_rate.observation_minutes, 60.0, 0.0, "default observation window");
    expect_true(a->kpis.by_vehicle_class.size() == 3, "classes present");
  }

  nm::MemoryTrajectorySource only_humans;
  only_humans.add(nm_test::human(1, kT0, 0, 0));
  auto b = nm::NearMissEngine(only_humans).compute({});
  expect_true(b.ok() && b->close_calls_count() == 0, "no vehicles, no calls");
  if (b.ok()) expect_true(b->stats.human_detections_processed == 1, "human counted");
}

void test_error_mapping() {
  const FailingSource failing;
  expect_code(nm::NearMissEngine(failing).compute({}).status(), Status::Code::kIoError,
              "source error propagated unchanged");

  const ThrowingSource throwing;
  const auto st = nm::NearMissEngine(throwing).compute({}).status();
  expect_code(st, Status::Code::kInternal, "exception mapped to internal");
  expect_true(st.message().find("boom") != std::string::npos, "exception text kept");
}

void test_derived_offender_speed() {
  nm::MemoryTrajectorySource src;
  src.add(nm_test::human(1, kT0 + 1000, 0.0, 0.0));
  src.add(nm_test::obs(2, "vehicle_001", ObjectClass::kVehicle, kT0 + 900, 0.0, 1.0));
  src.add(nm_test::obs(3, "vehicle_001", ObjectClass::kVehicle, kT0 + 1100, 1.0, 1.0));

  auto r = nm::NearMissEngine(src).compute({});
  expect_true(r.ok() && r->kpis.top_offenders.size() == 1, "one offender");
  if (r.ok() && !r->kpis.top_offenders.empty()) {
    expect_true(r->kpis.top_offenders[0].close_calls == 2, "both vehicle rows match");
    expect_near(r->kpis.top_offenders[0].derived_speed_mps, 5.0, 1e-9, "1 m over 200 ms");
  }
}

void test_large_time_window() {
  nm::MemoryTrajectorySource src;
  src.add(nm_test::human(1, kT0, 0.0, 0.0));
  src.add(nm_test::obs(2, "vehicle_001", ObjectClass::kVehicle, kT0 + 100, 1.0, 0.0));
  const RecordingSource rec(src);

  nm::QueryParams q;
  q.time_window_ms = std::numeric_limits<std::int64_t>::max() - 1000;
  auto r = nm::NearMissEngine(rec).compute(q);
  expect_true(r.ok(), "huge window computes");
  if (r.ok()) expect_true(r->close_calls_count() == 1, "huge window still finds the vehicle");

  expect_true(rec.queries.size() == 2, "humans then vehicles");
  if (rec.queries.size() != 2) return;
  const auto& vq = rec.queries[1];
  expect_true(vq.from && vq.to && *vq.from < *vq.to, "vehicle range clamped, not wrapped");
  expect_true(vq.to && vq.to->ms == std::numeric_limits<std::int64_t>::max(),
              "upper bound saturates");
}

void test_synth_guaranteed_calls() {
  nm::SynthSourceConfig c;
  c.seed = 3;
  c.num_observations = 600;
  c.duration_s = 900.0;
  c.guaranteed_close_calls = 60;

  nm::SynthTrajectorySource src(c);
  expect_true(src.open().ok(), "synth open");

  const nm::NearMissEngine engine(src);
  auto a = engine.compute({});
  auto b = engine.compute({});
  expect_true(a.ok() && b.ok(), "synth compute ok");
  if (!a.ok() || !b.ok()) return;

  expect_true(a->close_calls_count() >= 60, "every guaranteed pair is found");
  expect_true(a->close_calls_count() == b->close_calls_count(), "repeatable");
  expect_true(a->kpis.zone_analysis.worst_zone.has_value(), "hotspot zones counted");

  bool batch_invariant = true;
  for (const std::size_t batch : {std::size_t{1}, std::size_t{7}, std::size_t{100'000}}) {
    nm::QueryParams q;
    q.batch_size = batch;
    auto r = engine.compute(q);
    if (!r.ok() || r->close_calls_count() != a->close_calls_count()) batch_invariant = false;
  }
  expect_true(batch_invariant, "batch size does not change results");
}

}  // namespace

int main() {
  test_end_to_end();
  test_vehicle_fetch_window();
  test_vehicle_class_filter();
  test_validation_before_fetch();
  test_empty_sides();
  test_error_mapping();
  test_derived_offender_speed();
  test_large_time_window();
  test_synth_guaranteed_calls();
  return nm_test::finish("near_miss_engine");
}
