#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <string>
#include <vector>

#include <pitwall/errors.hpp>
#include <pitwall/strategy.hpp>
#include "support.hpp"

using namespace pitwall;
using Catch::Approx;

namespace {

OutcomeRecord on_time(const Sample& s) {
  OutcomeRecord o{};
  o.car = s.car;
  o.seq = s.seq;
  o.priority = s.priority;
  o.met_deadline = true;
  return o;
}

// derive + update, the way the processor drives it.
std::size_t feed(Strategy& st, const Sample& s, bool met = true) {
  const Derived d = st.derive(s);
  OutcomeRecord o = on_time(s);
  o.met_deadline = met;
  return st.update(s, d, o);
}

std::vector<Decision> all(const Strategy& st) {
  std::vector<Decision> out;
  st.recent(1000, out);
  return out;
}

} // namespace

TEST_CASE("derive computes time step and deceleration from the previous reading") {
  Strategy st;
  auto a = test::make_sample(1, 1);
  a.ch.speed_kmh = 300;
  REQUIRE(st.derive(a).dt_s == 0.0);
  feed(st, a);

  auto b = test::make_sample(1, 2);   // 10 ms later
  b.ch.speed_kmh = 264;               // -36 km/h = -10 m/s
  const Derived d = st.derive(b);
  REQUIRE_FALSE(d.reordered);
  REQUIRE(d.dt_s == Approx(0.010));
  REQUIRE(d.decel_mps2 == Approx(1000.0));
  REQUIRE(d.tyre_mean_c == Approx(94.0));
}

TEST_CASE("derive rejects a zero time step and flags older readings") {
  Strategy st;
  feed(st, test::make_sample(1, 5));

  auto same_ts = test::make_sample(1, 6);
  same_ts.source_ts_ms = test::make_sample(1, 5).source_ts_ms;
  REQUIRE_THROWS_AS(st.derive(same_ts), ProcessingError);

  const auto older = test::make_sample(1, 3);
  const Derived d = st.derive(older);
  REQUIRE(d.reordered);
  REQUIRE(st.update(older, d, on_time(older)) == 0);
}

TEST_CASE("heavy braking needs a sustained run and a real speed drop") {
  Strategy st;
  std::uint32_t seq = 1;
  auto brake_at = [&](std::uint16_t speed, float brake) {
    auto s = test::make_sample(44, seq++);
    s.ch.speed_kmh = speed;
    s.ch.brake = brake;
    s.ch.throttle = 0.0f;
    return feed(st, s);
  };

  // Four braking samples: not yet sustained.
  REQUIRE(brake_at(310, 0.9f) == 0);
  REQUIRE(brake_at(295, 0.9f) == 0);
  REQUIRE(brake_at(280, 0.9f) == 0);
  REQUIRE(brake_at(265, 0.9f) == 0);
  // Fifth: run of 5 with a 60 km/h drop.
  REQUIRE(brake_at(250, 0.9f) == 1);
  // Still braking: no repeat while the condition holds.
  REQUIRE(brake_at(230, 0.9f) == 0);

  const auto log = all(st);
  REQUIRE(log.size() == 1);
  REQUIRE(log[0].advisory == Advisory::HeavyBraking);
  REQUIRE(log[0].car == 44);
  REQUIRE(log[0].seq == 5);
  REQUIRE(log[0].value == Approx(60.0));

  // Release re-arms.
  REQUIRE(brake_at(230, 0.0f) == 0);
  for (int i = 0; i < 4; ++i) brake_at(static_cast<std::uint16_t>(220 - i * 10), 0.95f);
  REQUIRE(brake_at(170, 0.95f) == 1);
}

TEST_CASE("braking without a speed drop does not trigger") {
  Strategy st;
  for (std::uint32_t i = 1; i <= 10; ++i) {
    auto s = test::make_sample(3, i);
    s.ch.brake = 0.9f;
    s.ch.speed_kmh = 120;
    REQUIRE(feed(st, s) == 0);
  }
}

TEST_CASE("instant advisories fire on their edge") {
  Strategy st;
  auto s = test::make_sample(16, 1);
  s.ch.water_temp_c = 135;
  s.ch.drs = true;
  REQUIRE(feed(st, s) == 2);

  s = test::make_sample(16, 2);
  s.ch.water_temp_c = 136;
  s.ch.drs = true;
  REQUIRE(feed(st, s) == 0);

  s = test::make_sample(16, 3);
  s.ch.oil_pressure_bar = 1.2f;
  s.ch.rpm = 9000;
  REQUIRE(feed(st, s) == 1);

  const auto log = all(st);
  REQUIRE(log.size() == 3);
  REQUIRE(log[2].advisory == Advisory::LowOilPressure);
  REQUIRE(log[2].value == Approx(1.2));
}

TEST_CASE("low oil pressure at idle rpm is not an advisory") {
  Strategy st;
  auto s = test::make_sample(16, 1);
  s.ch.oil_pressure_bar = 1.2f;
  s.ch.rpm = 3000;
  REQUIRE(feed(st, s) == 0);
}

TEST_CASE("pit window opens once the tyre window runs hot") {
  StrategyConfig cfg{};
  cfg.pit_window_min_readings = 8;
  Strategy st(cfg);
  std::size_t fired = 0;
  for (std::uint32_t i = 1; i <= 8; ++i) {
    auto s = test::make_sample(5, i);
    s.ch.tyre_temp_c = {118, 118, 116, 116};
    fired += feed(st, s);
  }
  REQUIRE(fired == 1);
  const auto log = all(st);
  REQUIRE(log.back().advisory == Advisory::PitWindow);
  REQUIRE(log.back().seq == 8);
  REQUIRE(log.back().value == Approx(117.0));
}

TEST_CASE("a car missing most deadlines is flagged as lagging") {
  StrategyConfig cfg{};
  cfg.lagging_min_readings = 4;
  Strategy st(cfg);
  std::size_t fired = 0;
  for (std::uint32_t i = 1; i <= 4; ++i) fired += feed(st, test::make_sample(9, i), false);
  REQUIRE(fired == 1);
  REQUIRE(all(st).back().advisory == Advisory::TelemetryLagging);
}

TEST_CASE("decision log is append-only with increasing ids and bounded retention") {
  StrategyConfig cfg{};
  cfg.decision_log = 4;
  Strategy st(cfg);

  // Toggle DRS: each opening is one decision.
  std::uint32_t seq = 1;
  for (int i = 0; i < 6; ++i) {
    auto open = test::make_sample(1, seq++);
    open.ch.drs = true;
    feed(st, open);
    feed(st, test::make_sample(1, seq++));
  }
  REQUIRE(st.total_decisions() == 6);

  const auto log = all(st);
  REQUIRE(log.size() == 4);
  for (std::size_t i = 1; i < log.size(); ++i) {
    REQUIRE(log[i].id == log[i - 1].id + 1);
    REQUIRE(log[i].source_ts_ms > log[i - 1].source_ts_ms);
  }
  REQUIRE(log.back().id == 6);

  std::vector<Decision> two;
  st.recent(2, two);
  REQUIRE(two.size() == 2);
  REQUIRE(two[0].id == 5);

  st.reset();
  REQUIRE(st.total_decisions() == 0);
  REQUIRE(st.cars() == 0);
}

TEST_CASE("car pool is fixed: cars beyond the cap are counted and ignored") {
  StrategyConfig cfg{};
  cfg.max_cars = 4;
  Strategy st(cfg);

  for (CarId car = 1; car <= 10; ++car) {
    auto s = test::make_sample(car, 1);
    s.ch.drs = true;
    feed(st, s);
  }
  REQUIRE(st.cars() == 4);
  REQUIRE(st.untracked() == 6);
  REQUIRE(st.total_decisions() == 4);

  // Untracked cars have no history to relate to: no error, no time step.
  const auto late_car = test::make_sample(10, 2);
  REQUIRE(st.derive(late_car).dt_s == 0.0);
  REQUIRE(feed(st, late_car) == 0);

  // Tracked cars keep working.
  auto again = test::make_sample(2, 2);
  REQUIRE(st.derive(again).dt_s == Approx(0.01));
}

TEST_CASE("walking the whole car id range stays within the pool") {
  Strategy st;
  for (std::uint32_t car = 1; car <= 65535; ++car) {
    feed(st, test::make_sample(static_cast<CarId>(car), 1));
  }
  REQUIRE(st.cars() == 64);
  REQUIRE(st.untracked() == 65535 - 64);

  st.reset();
  REQUIRE(st.cars() == 0);
  REQUIRE(st.untracked() == 0);
  feed(st, test::make_sample(40000, 1));
  REQUIRE(st.cars() == 1);
}

TEST_CASE("advisory names") {
  REQUIRE(std::string(advisory_name(Advisory::PitWindow)) == "PIT_WINDOW");
  REQUIRE(std::string(advisory_name(Advisory::HeavyBraking)) == "HEAVY_BRAKING");
}
