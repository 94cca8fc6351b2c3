#include <catch2/catch_test_macros.hpp>
#include <chrono>

#include <pitwall/load_model.hpp>
#include "support.hpp"

using namespace pitwall;
using namespace std::chrono;

TEST_CASE("load model is off by default") {
  LoadModel m;
  REQUIRE_FALSE(m.active());
  REQUIRE(m.next_delay(test::make_sample(1, 1)) == microseconds(0));
}

TEST_CASE("fixed work is applied to every sample") {
  LoadConfig cfg{};
  cfg.fixed = microseconds(300);
  LoadModel m(cfg);
  REQUIRE(m.active());
  REQUIRE(m.next_delay(test::make_sample(1, 1, Priority::Critical)) == microseconds(300));

  const auto t0 = steady_clock::now();
  m.run(test::make_sample(1, 1));
  REQUIRE(steady_clock::now() - t0 >= microseconds(300));
}

TEST_CASE("simulated load stays within the per-class envelope") {
  LoadConfig cfg{};
  cfg.simulate = true;
  LoadModel m(cfg);

  auto crit = test::make_sample(1, 1, Priority::Critical);
  crit.ch.speed_kmh = 200;
  auto low = test::make_sample(1, 2, Priority::Low);
  low.ch.speed_kmh = 320;   // fast: doubled

  for (int i = 0; i < 500; ++i) {
    const auto c = m.next_delay(crit).count();
    REQUIRE(c >= 50);
    REQUIRE(c < 200 * 10);

    const auto l = m.next_delay(low).count();
    REQUIRE(l >= 400);
    REQUIRE(l < 800 * 2 * 10);
  }
}

TEST_CASE("simulated load is deterministic for a seed") {
  LoadConfig cfg{};
  cfg.simulate = true;
  cfg.seed = 99;
  LoadModel a(cfg), b(cfg);
  const auto s = test::make_sample(1, 1, Priority::High);
  for (int i = 0; i < 100; ++i) {
    REQUIRE(a.next_delay(s) == b.next_delay(s));
  }
}
