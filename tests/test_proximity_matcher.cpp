// File: tests/test_proximity_matcher.cpp
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "nm/core/index/time_window_index.hpp"
#include "nm/core/proximity/proximity_matcher.hpp"
#include "nm/core/proximity/severity.hpp"
#include "test_util.hpp"

namespace {

using nm::ObjectClass;
using nm_test::expect_near;
using nm_test::expect_true;
using nm_test::kT0;

nm::Observation vehicle(std::int64_t id, std::int64_t ts, double x, double y) {
  return nm_test::obs(id, "vehicle_" + std::to_string(id), ObjectClass::kVehicle, ts, x, y);
}

nm::CloseCalls run(const nm::Observations& humans, nm::Observations vehicles,
                   nm::MatcherParams p = {}) {
  const nm::TimeWindowIndex idx(std::move(vehicles));
  return nm::ProximityMatcher(p).match(humans, idx);
}

void test_single_match() {
  const auto calls = run({nm_test::human(1, kT0, 0.0, 0.0)}, {vehicle(10, kT0 + 100, 1.0, 0.0)});
  expect_true(calls.size() == 1, "one close call");
  if (calls.size() != 1) return;
  expect_near(calls[0].distance_m, 1.0, 1e-12, "distance 1.0");
  expect_true(calls[0].severity == nm::Severity::kMedium, "1.0 m is MEDIUM");
  expect_true(calls[0].time_difference_ms == 100, "time difference 100 ms");
  expect_near(calls[0].distance_threshold_m, 2.0, 0.0, "threshold echoed");
  expect_true(calls[0].time_window_ms == 250, "window echoed");
  expect_true(calls[0].vehicle.id == 10 && calls[0].human.id == 1, "rows carried through");
}

void test_too_far() {
  const auto calls = run({nm_test::human(1, kT0, 0.0, 0.0)}, {vehicle(10, kT0 + 100, 3.0, 0.0)});
  expect_true(calls.empty(), "3.0 m is beyond a 2.0 m threshold");
}

void test_outside_window() {
  const auto calls = run({nm_test::human(1, kT0, 0.0, 0.0)},
                         {vehicle(10, kT0 + 100, 0.5, 0.0), vehicle(11, kT0 + 400, 0.5, 0.0)});
  expect_true(calls.size() == 1, "only the in-window vehicle matches");
  if (!calls.empty()) expect_true(calls[0].vehicle.id == 10, "the +100 ms vehicle");
}

void test_boundaries_inclusive() {
  const auto calls = run({nm_test::human(1, kT0, 0.0, 0.0)},
                         {vehicle(10, kT0 - 250, 2.0, 0.0), vehicle(11, kT0 + 250, 0.0, -2.0),
                          vehicle(12, kT0 + 251, 0.0, 0.0)});
  expect_true(calls.size() == 2, "threshold and window edges are inclusive");
  if (calls.size() == 2) {
    expect_true(calls[0].severity == nm::Severity::kLow, "2.0 m is LOW");
    expect_true(calls[0].time_difference_ms == 250, "absolute time difference for earlier vehicle");
  }
}

void test_zero_time_difference() {
  const auto calls = run({nm_test::human(1, kT0, 0.0, 0.0)}, {vehicle(10, kT0, 0.0, 0.0)});
  expect_true(calls.size() == 1, "zero time difference and zero distance match");
  if (!calls.empty()) {
    expect_true(calls[0].time_difference_ms == 0, "zero diff");
    expect_true(calls[0].severity == nm::Severity::kHigh, "0 m is HIGH");
  }
}

void test_empty_sides() {
  expect_true(run({}, {vehicle(10, kT0, 0.0, 0.0)}).empty(), "no humans");
  expect_true(run({nm_test::human(1, kT0, 0.0, 0.0)}, {}).empty(), "no vehicles");
}

void test_one_human_many_vehicles() {
  const auto calls = run({nm_test::human(1, kT0, 0.0, 0.0)},
                         {vehicle(12, kT0 + 10, 0.1, 0.0), vehicle(10, kT0 - 10, 0.2, 0.0),
                          vehicle(11, kT0, 0.3, 0.0)});
  expect_true(calls.size() == 3, "every qualifying vehicle is reported");
  if (calls.size() == 3) {
    expect_true(calls[0].vehicle.id == 10 && calls[1].vehicle.id == 11 && calls[2].vehicle.id == 12,
                "vehicles in index (time) order");
  }
}

void test_severity_boundaries() {
  expect_true(nm::classify_severity(0.0) == nm::Severity::kHigh, "0.0 HIGH");
  expect_true(nm::classify_severity(0.999) == nm::Severity::kHigh, "0.999 HIGH");
  expect_true(nm::classify_severity(1.0) == nm::Severity::kMedium, "1.0 MEDIUM");
  expect_true(nm::classify_severity(1.499) == nm::Severity::kMedium, "1.499 MEDIUM");
  expect_true(nm::classify_severity(1.5) == nm::Severity::kLow, "1.5 LOW");
  expect_true(nm::classify_severity(7.0) == nm::Severity::kLow, "7.0 LOW regardless of threshold");
}

void test_params_validation() {
  expect_true(nm::validate_matcher_params({}).ok(), "defaults valid");
  expect_true(!nm::validate_matcher_params({0.0, 250, 200}).ok(), "zero threshold");
  expect_true(!nm::validate_matcher_params({-1.0, 250, 200}).ok(), "negative threshold");
  expect_true(!nm::validate_matcher_params({NAN, 250, 200}).ok(), "NaN threshold");
  expect_true(!nm::validate_matcher_params({2.0, -1, 200}).ok(), "negative window");
  expect_true(!nm::validate_matcher_params({2.0, 250, 0}).ok(), "zero batch");
  expect_true(nm::validate_matcher_params({2.0, 0, 1}).ok(), "zero window allowed");
}

struct RandomCase {
  nm::Observations humans;
  nm::Observations vehicles;
};

RandomCase random_case(std::uint32_t seed) {
  std::mt19937 rng(seed);
  std::uniform_int_distribution<std::int64_t> ts(0, 20'000);
  std::uniform_real_distribution<double> pos(0.0, 15.0);

  RandomCase c;
  for (int i = 0; i < 300; ++i) c.humans.push_back(nm_test::human(i, kT0 + ts(rng), pos(rng), pos(rng)));
  for (int i = 0; i < 250; ++i) c.vehicles.push_back(vehicle(1000 + i, kT0 + ts(rng), pos(rng), pos(rng)));

  std::stable_sort(c.humans.begin(), c.humans.end(),
                   [](const nm::Observation& a, const nm::Observation& b) { return a.timestamp < b.timestamp; });
  return c;
}

using IdPair = std::pair<std::int64_t, std::int64_t>;

// Every (human id, vehicle id) pair within both limits, by exhaustive scan.
std::vector<IdPair> brute_force_pairs(const RandomCase& c, double threshold, std::int64_t window) {
  std::vector<IdPair> out;
  for (const auto& h : c.humans) {
    for (const auto& v : c.vehicles) {
      if (std::llabs(v.timestamp.ms - h.timestamp.ms) > window) continue;
      const double dx = v.x - h.x;
      const double dy = v.y - h.y;
      if (dx * dx + dy * dy <= threshold * threshold) out.emplace_back(h.id, v.id);
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::vector<IdPair> id_pairs(const nm::CloseCalls& calls) {
  std::vector<IdPair> out;
  out.reserve(calls.size());
  for (const auto& cc : calls) out.emplace_back(cc.human.id, cc.vehicle.id);
  std::sort(out.begin(), out.end());
  return out;
}

void test_matches_brute_force() {
  for (std::uint32_t seed = 1; seed <= 5; ++seed) {
    const RandomCase c = random_case(seed);
    const auto calls = run(c.humans, c.vehicles, {2.0, 250, 200});
    const auto expected = brute_force_pairs(c, 2.0, 250);
    expect_true(!expected.empty(), "random case has matches, seed " + std::to_string(seed));
    expect_true(id_pairs(calls) == expected,
                "indexed join reports the brute-force pairs, seed " + std::to_string(seed));

    bool all_valid = true;
    for (const auto& cc : calls) {
      if (cc.distance_m > 2.0 || cc.time_difference_ms > 250 ||
          cc.severity != nm::classify_severity(cc.distance_m)) {
        all_valid = false;
      }
    }
    expect_true(all_valid, "every reported pair satisfies both constraints, seed " + std::to_string(seed));
  }
}

void test_batch_size_does_not_change_output() {
  const RandomCase c = random_case(42);
  const auto ref = run(c.humans, c.vehicles, {2.0, 250, 200});
  for (const std::size_t batch : {std::size_t{1}, std::size_t{10}, std::size_t{10'000}}) {
    const auto got = run(c.humans, c.vehicles, {2.0, 250, batch});
    bool same = got.size() == ref.size();
    for (std::size_t i = 0; same && i < got.size(); ++i) {
      same = got[i].human.id == ref[i].human.id && got[i].vehicle.id == ref[i].vehicle.id &&
             got[i].distance_m == ref[i].distance_m;
    }
    expect_true(same, "batch_size " + std::to_string(batch) + " gives identical output");
  }
}

}  // namespace

int main() {
  test_single_match();
  test_too_far();
  test_outside_window();
  test_boundaries_inclusive();
  test_zero_time_difference();
  test_empty_sides();
  test_one_human_many_vehicles();
  test_severity_boundaries();
  test_params_validation();
  test_matches_brute_force();
  test_batch_size_does_not_change_output();
  return nm_test::finish("proximity_matcher");
}
