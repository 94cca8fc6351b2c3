#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <chrono>

#include <pitwall/metrics.hpp>

using namespace pitwall;
using namespace std::chrono;
using Catch::Approx;

static OutcomeRecord processed(microseconds lat, bool met = true) {
  OutcomeRecord o{};
  o.car = 1;
  o.status = OutcomeStatus::Processed;
  o.latency = lat;
  o.met_deadline = met;
  return o;
}

TEST_CASE("latency window percentiles over 1..100 ms") {
  LatencyWindow w(1024);
  for (int i = 100; i >= 1; --i) w.add(milliseconds(i));
  const auto s = w.summarize();
  REQUIRE(s.count == 100);
  // index = min(n * q, n - 1) on the sorted window
  REQUIRE(s.p50_ms == Approx(51.0));
  REQUIRE(s.p95_ms == Approx(96.0));
  REQUIRE(s.p99_ms == Approx(100.0));
  REQUIRE(s.max_ms == Approx(100.0));
  REQUIRE(s.mean_ms == Approx(50.5));
}

TEST_CASE("latency window keeps only the most recent entries") {
  LatencyWindow w(4);
  for (int i = 0; i < 4; ++i) w.add(milliseconds(100));
  for (int i = 0; i < 4; ++i) w.add(milliseconds(1));
  const auto s = w.summarize();
  REQUIRE(s.count == 4);
  REQUIRE(s.max_ms == Approx(1.0));

  w.clear();
  REQUIRE(w.size() == 0);
  REQUIRE(w.summarize().count == 0);
}

TEST_CASE("throughput window reports rates over elapsed time") {
  ThroughputWindow tw(5);
  const auto t0 = steady_clock::now();
  tw.start(t0);
  for (int i = 0; i < 20; ++i) {
    tw.add(t0 + milliseconds(i * 100), 10, 970);
  }
  double sps = 0.0, bps = 0.0;
  tw.rates(t0 + seconds(2), sps, bps);
  REQUIRE(sps == Approx(100.0));
  REQUIRE(bps == Approx(9700.0));

  // Older buckets fall out of the window.
  tw.rates(t0 + seconds(30), sps, bps);
  REQUIRE(sps == Approx(0.0));
}

TEST_CASE("drop rate counts decode failures, stale, evicted and rejected") {
  Metrics m;
  const auto t0 = steady_clock::now();
  m.start(t0);

  for (int i = 0; i < 1000; ++i) m.on_received(97);
  m.on_decode_failure(DecodeError::MalformedPacket);
  m.on_decode_failure(DecodeError::ChecksumFailure);
  m.on_duplicate();
  m.on_filtered();
  for (int i = 0; i < 996; ++i) m.on_admitted();

  OutcomeRecord ev{};
  ev.status = OutcomeStatus::Evicted;
  m.on_dropped(ev);
  OutcomeRecord rj{};
  rj.status = OutcomeStatus::Rejected;
  m.on_dropped(rj);

  const auto s = m.snapshot(t0 + seconds(1));
  REQUIRE(s.received == 1000);
  REQUIRE(s.decode_failures() == 2);
  REQUIRE(s.stale() == 1);
  REQUIRE(s.filtered == 1);
  REQUIRE(s.dropped() == 5);
  REQUIRE(s.drop_rate_pct == Approx(0.5));
  REQUIRE(s.avg_pps == Approx(1000.0));
}

TEST_CASE("processor-side counters") {
  Metrics m(16, 5);
  const auto t0 = steady_clock::now();
  m.start(t0);

  m.record(processed(milliseconds(2)), 97, t0 + milliseconds(10));
  m.record(processed(milliseconds(12), false), 97, t0 + milliseconds(20));
  OutcomeRecord err = processed(milliseconds(1));
  err.status = OutcomeStatus::ProcessingError;
  m.record(err, 97, t0 + milliseconds(30));

  const auto s = m.snapshot(t0 + seconds(1));
  REQUIRE(s.processed == 2);
  REQUIRE(s.processing_errors == 1);
  REQUIRE(s.late == 1);
  REQUIRE(s.bytes_processed == 3 * 97);
  REQUIRE(s.latency.count == 3);
  REQUIRE(s.latency.max_ms == Approx(12.0));
  REQUIRE(s.throughput_sps == Approx(3.0));
  REQUIRE(s.outcomes() == 3);

  m.reset(t0 + seconds(2));
  const auto z = m.snapshot(t0 + seconds(3));
  REQUIRE(z.processed == 0);
  REQUIRE(z.received == 0);
  REQUIRE(z.latency.count == 0);
}

TEST_CASE("empty metrics report zero rates") {
  Metrics m;
  const auto t0 = steady_clock::now();
  m.start(t0);
  const auto s = m.snapshot(t0);
  REQUIRE(s.drop_rate_pct == 0.0);
  REQUIRE(s.throughput_sps == 0.0);
  REQUIRE(s.latency.p99_ms == 0.0);
}
