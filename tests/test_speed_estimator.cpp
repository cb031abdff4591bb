// File: tests/test_speed_estimator.cpp
#include <algorithm>
#include <random>
#include <string>

#include "nm/core/kpi/speed_estimator.hpp"
#include "test_util.hpp"

namespace {

using nm::ObjectClass;
using nm_test::expect_near;
using nm_test::expect_true;
using nm_test::kT0;

nm::Observation at(const std::string& track, std::int64_t ts, double x, double y) {
  return nm_test::obs(0, track, ObjectClass::kVehicle, ts, x, y);
}

void test_single_track() {
  // 3 m in 1 s, then 4 m in 1 s.
  const nm::Observations rows = {at("v", kT0, 0, 0), at("v", kT0 + 1000, 3, 0),
                                 at("v", kT0 + 2000, 3, 4)};
  expect_near(nm::estimate_track_speed(rows), 3.5, 1e-12, "mean of pairwise speeds");
}

void test_degenerate_inputs() {
  expect_near(nm::estimate_track_speed({}), 0.0, 0.0, "no rows");
  expect_near(nm::estimate_track_speed({at("v", kT0, 1, 1)}), 0.0, 0.0, "one row");

  const nm::Observations same_ts = {at("v", kT0, 0, 0), at("v", kT0, 5, 0)};
  expect_near(nm::estimate_track_speed(same_ts), 0.0, 0.0, "dt = 0 skipped, no Infinity");

  const nm::Observations mixed = {at("v", kT0, 0, 0), at("v", kT0, 9, 9), at("v", kT0 + 2000, 9, 13)};
  expect_near(nm::estimate_track_speed(mixed), 2.0, 1e-12, "only the usable pair counts");
}

void test_bulk_matches_single() {
  std::mt19937 rng(7);
  std::uniform_real_distribution<double> pos(0.0, 50.0);
  std::uniform_int_distribution<int> dt(0, 400);

  nm::Observations rows;
  for (const std::string id : {"agv_1", "forklift_3", "truck_2", "z_single"}) {
    std::int64_t t = kT0;
    const int n = id == "z_single" ? 1 : 25;
    for (int i = 0; i < n; ++i) {
      rows.push_back(at(id, t, pos(rng), pos(rng)));
      t += dt(rng);
    }
  }
  std::shuffle(rows.begin(), rows.end(), rng);
  nm::sort_for_speed_estimation(rows);

  const auto bulk = nm::estimate_speeds_bulk(rows);
  expect_true(bulk.size() == 4, "one entry per tracking id");

  for (const auto& [id, speed] : bulk) {
    nm::Observations track;
    for (const auto& r : rows) {
      if (r.tracking_id == id) track.push_back(r);
    }
    expect_near(speed, nm::estimate_track_speed(track), 1e-12, "bulk == single for " + id);
  }
  expect_near(bulk.at("z_single"), 0.0, 0.0, "single-point track is 0");
}

void test_sort_order() {
  nm::Observations rows = {at("b", kT0 + 5, 0, 0), at("a", kT0 + 9, 0, 0), at("a", kT0 + 1, 0, 0)};
  nm::sort_for_speed_estimation(rows);
  expect_true(rows[0].tracking_id == "a" && rows[0].timestamp.ms == kT0 + 1, "a first, by time");
  expect_true(rows[2].tracking_id == "b", "b last");
}

void test_effective_speed() {
  nm::Observation o = at("v", kT0, 0, 0);
  expect_near(nm::effective_speed(o, 1.25), 1.25, 0.0, "no reported speed");
  o.speed_mps = 0.0;
  expect_near(nm::effective_speed(o, 1.25), 1.25, 0.0, "zero reported speed");
  o.speed_mps = 2.5;
  expect_near(nm::effective_speed(o, 1.25), 2.5, 0.0, "reported speed wins");
}

}  // namespace

int main() {
  test_single_track();
  test_degenerate_inputs();
  test_bulk_matches_single();
  test_sort_order();
  test_effective_speed();
  return nm_test::finish("speed_estimator");
}
