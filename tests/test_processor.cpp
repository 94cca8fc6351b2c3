#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <ostream>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>

#include <pitwall/processor.hpp>
#include "support.hpp"

using namespace pitwall;
using namespace std::chrono;
using Clock = PriorityRing::Clock;

namespace {

struct Rig {
  explicit Rig(ProcessorConfig cfg = {}, std::size_t capacity = 64)
    : ring(capacity), proc(ring, metrics, strategy, snaps, cfg) {}

  PriorityRing ring;
  Metrics metrics;
  Strategy strategy;
  SnapshotBuffer snaps;
  Processor proc;
};

} // namespace

TEST_CASE("processor empties the ring in priority order and records outcomes") {
  Rig rig;
  rig.ring.admit(test::make_sample(1, 1, Priority::Low), Clock::now());
  rig.ring.admit(test::make_sample(2, 1, Priority::Critical), Clock::now());

  auto first = rig.proc.process_next();
  REQUIRE(first);
  REQUIRE(first->car == 2);
  REQUIRE(first->status == OutcomeStatus::Processed);
  REQUIRE(first->met_deadline);

  REQUIRE(rig.proc.drain() == 1);
  REQUIRE_FALSE(rig.proc.process_next());
  REQUIRE(rig.proc.processed() == 2);

  const auto m = rig.metrics.snapshot(Clock::now());
  REQUIRE(m.processed == 2);
  REQUIRE(m.late == 0);
}

TEST_CASE("late samples are still processed and flagged") {
  ProcessorConfig cfg{};
  cfg.budget = milliseconds(5);
  Rig rig(cfg);
  // Arrived 20 ms ago: already past the budget when dequeued.
  rig.ring.admit(test::make_sample(1, 1, Priority::High), Clock::now() - milliseconds(20));

  auto o = rig.proc.process_next();
  REQUIRE(o);
  REQUIRE(o->status == OutcomeStatus::Processed);
  REQUIRE_FALSE(o->met_deadline);
  REQUIRE(o->latency >= milliseconds(20));
  REQUIRE(rig.metrics.snapshot(Clock::now()).late == 1);
}

TEST_CASE("a processing error is recorded and the next sample still runs") {
  Rig rig;
  auto a = test::make_sample(1, 1);
  auto b = test::make_sample(1, 2);
  b.source_ts_ms = a.source_ts_ms;   // zero time step
  auto c = test::make_sample(1, 3);
  rig.ring.admit(a, Clock::now());
  rig.ring.admit(b, Clock::now());
  rig.ring.admit(c, Clock::now());

  REQUIRE(rig.proc.process_next()->status == OutcomeStatus::Processed);
  REQUIRE(rig.proc.process_next()->status == OutcomeStatus::ProcessingError);
  REQUIRE(rig.proc.process_next()->status == OutcomeStatus::Processed);

  const auto m = rig.metrics.snapshot(Clock::now());
  REQUIRE(m.processed == 2);
  REQUIRE(m.processing_errors == 1);
  REQUIRE(m.outcomes() == 3);
}

TEST_CASE("any exception from per-sample work is recorded, not propagated") {
  ProcessorConfig cfg{};
  cfg.load.work = [](const Sample& s) {
    if (s.seq == 2) throw std::runtime_error("sensor table lookup failed");
  };
  Rig rig(cfg);
  for (std::uint32_t i = 1; i <= 3; ++i) rig.ring.admit(test::make_sample(1, i), Clock::now());

  REQUIRE(rig.proc.process_next()->status == OutcomeStatus::Processed);
  REQUIRE(rig.proc.process_next()->status == OutcomeStatus::ProcessingError);
  REQUIRE(rig.proc.process_next()->status == OutcomeStatus::Processed);

  rig.proc.publish_snapshot(Clock::now());
  std::uint64_t cursor = 0;
  PipelineSnapshot out{};
  REQUIRE(rig.snaps.try_consume_latest(cursor, out));
  REQUIRE(out.metrics.processing_errors == 1);
  REQUIRE(out.last_error == "sensor table lookup failed");
}

TEST_CASE("late samples and errors never wait on the log output") {
  test::StallingBuf stalled(milliseconds(300));
  std::ostream out(&stalled);
  test::ScopedLogOutput capture(out, log::Level::Trace);

  ProcessorConfig cfg{};
  cfg.budget = milliseconds(1);
  Rig rig(cfg);
  auto a = test::make_sample(1, 1);
  auto b = test::make_sample(1, 2);
  b.source_ts_ms = a.source_ts_ms;   // zero time step
  rig.ring.admit(a, Clock::now() - milliseconds(20));
  rig.ring.admit(b, Clock::now() - milliseconds(20));

  const auto t0 = steady_clock::now();
  REQUIRE(rig.proc.drain() == 2);
  REQUIRE(steady_clock::now() - t0 < milliseconds(50));
  REQUIRE(stalled.flushes() == 0);

  const auto m = rig.metrics.snapshot(Clock::now());
  REQUIRE(m.late == 2);
  REQUIRE(m.processing_errors == 1);
}

TEST_CASE("1000 samples with 2 ms of work each stay inside a 10 ms budget") {
  ProcessorConfig cfg{};
  cfg.budget = milliseconds(10);
  cfg.load.fixed = milliseconds(2);
  Rig rig(cfg, 1024);

  std::mt19937 rng(2024);
  std::uniform_int_distribution<int> cls(0, 3);
  constexpr std::uint32_t kN = 1000;
  for (std::uint32_t i = 0; i < kN; ++i) {
    const auto p = static_cast<Priority>(cls(rng));
    REQUIRE(rig.ring.admit(test::make_sample(static_cast<CarId>(1 + i % 20), i, p), Clock::now()).status
            == PriorityRing::AdmitStatus::Admitted);
    auto o = rig.proc.process_next();
    REQUIRE(o);
    REQUIRE(o->latency >= milliseconds(2));
  }

  const auto m = rig.metrics.snapshot(Clock::now());
  REQUIRE(m.processed + m.processing_errors == kN);
  REQUIRE(m.latency.count == kN);
  REQUIRE(m.latency.p99_ms <= 12.0);
  REQUIRE(rig.ring.stats().taken == kN);
}

TEST_CASE("snapshots reach the latest-value buffer") {
  Rig rig;
  auto s = test::make_sample(7, 1);
  s.ch.drs = true;
  rig.ring.admit(s, Clock::now());
  rig.proc.drain();
  rig.proc.publish_snapshot(Clock::now());

  std::uint64_t cursor = 0;
  PipelineSnapshot out{};
  REQUIRE(rig.snaps.try_consume_latest(cursor, out));
  REQUIRE(out.metrics.processed == 1);
  REQUIRE(out.has_latest);
  REQUIRE(out.latest.car == 7);
  REQUIRE(out.recent_outcomes.size() == 1);
  REQUIRE(out.recent_decisions.size() == 1);
  REQUIRE(out.recent_decisions[0].advisory == Advisory::DrsOpen);
  REQUIRE(out.buffer_capacity == 64);
}

TEST_CASE("recent outcomes keep the newest entries in order") {
  ProcessorConfig cfg{};
  cfg.recent_outcomes = 3;
  Rig rig(cfg);
  for (std::uint32_t i = 1; i <= 5; ++i) rig.ring.admit(test::make_sample(1, i), Clock::now());
  rig.proc.drain();
  rig.proc.publish_snapshot(Clock::now());

  std::uint64_t cursor = 0;
  PipelineSnapshot out{};
  REQUIRE(rig.snaps.try_consume_latest(cursor, out));
  REQUIRE(out.recent_outcomes.size() == 3);
  REQUIRE(out.recent_outcomes[0].seq == 3);
  REQUIRE(out.recent_outcomes[2].seq == 5);
}

TEST_CASE("processor thread drains the ring after close") {
  Rig rig;
  std::thread th(&Processor::run, &rig.proc);
  for (std::uint32_t i = 1; i <= 40; ++i) {
    rig.ring.admit(test::make_sample(static_cast<CarId>(i % 4 + 1), i), Clock::now());
  }
  rig.ring.close();
  th.join();

  REQUIRE(rig.ring.empty());
  const auto st = rig.ring.stats();
  REQUIRE(rig.proc.processed() == st.taken);
  REQUIRE(st.taken + st.evicted == st.admitted);

  std::uint64_t cursor = 0;
  PipelineSnapshot out{};
  REQUIRE(rig.snaps.try_consume_latest(cursor, out));
  REQUIRE(out.metrics.outcomes() == rig.proc.processed());
}
