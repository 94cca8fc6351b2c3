#include <catch2/catch_test_macros.hpp>
#include <cerrno>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include <pitwall/errors.hpp>
#include <pitwall/pipeline.hpp>
#include "support.hpp"

using namespace pitwall;
using namespace std::chrono;

namespace {

PipelineConfig quick_config() {
  PipelineConfig c{};
  c.idle_timeout = milliseconds(200);
  c.publish_interval = milliseconds(10);
  c.processor.snapshot_interval = milliseconds(5);
  c.live_view = false;
  c.retry.attempts = 2;
  c.retry.initial = milliseconds(1);
  c.retry.max = milliseconds(2);
  c.log_level = log::Level::Off;
  return c;
}

} // namespace

TEST_CASE("pipeline shuts down after the idle timeout when nothing arrives") {
  Pipeline p(quick_config());
  test::MemorySource src;
  const auto t0 = steady_clock::now();
  REQUIRE(p.run(src) == ShutdownReason::IdleTimeout);
  REQUIRE(steady_clock::now() - t0 >= milliseconds(200));
  REQUIRE_FALSE(p.running());
  REQUIRE(p.report().metrics.received == 0);
}

TEST_CASE("a malformed datagram is counted and later packets still flow") {
  Pipeline p(quick_config());
  test::MemorySource src;
  src.push(std::vector<std::uint8_t>{0x50, 0x57, 0x01});
  for (std::uint32_t i = 1; i <= 20; ++i) src.push(test::make_sample(5, i));

  REQUIRE(p.run(src) == ShutdownReason::IdleTimeout);
  const auto& m = p.report().metrics;
  REQUIRE(m.received == 21);
  REQUIRE(m.malformed == 1);
  REQUIRE(m.admitted == 20);
  REQUIRE(m.processed == 20);
  REQUIRE(p.ring().empty());
}

TEST_CASE("every received datagram is accounted for after drain") {
  auto cfg = quick_config();
  cfg.capacity = 8;
  cfg.processor.load.fixed = microseconds(200);
  Pipeline p(cfg);

  test::MemorySource src;
  for (std::uint32_t i = 1; i <= 400; ++i) {
    auto s = test::make_sample(static_cast<CarId>(1 + i % 3), i);
    if (i % 9 == 0) s.ch.brake = 0.99f;
    src.push(s);
    if (i % 50 == 0) src.push(std::vector<std::uint8_t>(12, 0xAB));
    if (i % 40 == 0) src.push(s);   // duplicate
  }

  REQUIRE(p.run(src) == ShutdownReason::IdleTimeout);
  const auto& m = p.report().metrics;
  REQUIRE(m.received == src.delivered());
  REQUIRE(m.received == m.decode_failures() + m.filtered + m.stale() + m.admitted + m.rejected);
  REQUIRE(m.processed + m.processing_errors + m.evicted == m.admitted);
  REQUIRE(m.outcomes() == m.admitted + m.rejected);
  REQUIRE(m.duplicates == 10);
  REQUIRE(m.malformed == 8);
}

TEST_CASE("request_stop ends the run") {
  auto cfg = quick_config();
  cfg.idle_timeout = milliseconds(60'000);
  Pipeline p(cfg);
  test::MemorySource src;
  for (std::uint32_t i = 1; i <= 5; ++i) src.push(test::make_sample(1, i));

  std::thread stopper([&] {
    std::this_thread::sleep_for(milliseconds(100));
    p.request_stop();
  });
  const auto reason = p.run(src);
  stopper.join();

  REQUIRE(reason == ShutdownReason::StopRequested);
  REQUIRE(p.report().metrics.processed == 5);
  REQUIRE(p.report().reason == ShutdownReason::StopRequested);
}

TEST_CASE("repeated receive errors end the run as a transport failure") {
  Pipeline p(quick_config());
  test::MemorySource src;
  src.push(test::make_sample(1, 1));
  for (int i = 0; i < 5; ++i) src.push_error(ECONNREFUSED);

  REQUIRE(p.run(src) == ShutdownReason::TransportFailed);
  REQUIRE(p.report().metrics.processed == 1);
}

TEST_CASE("a receive error followed by data resets the error count") {
  Pipeline p(quick_config());
  test::MemorySource src;
  for (std::uint32_t i = 1; i <= 4; ++i) {
    src.push_error(EIO);
    src.push_error(EIO);
    src.push(test::make_sample(1, i));
  }
  REQUIRE(p.run(src) == ShutdownReason::IdleTimeout);
  REQUIRE(p.report().metrics.processed == 4);
}

TEST_CASE("sinks receive snapshot lines while the pipeline runs") {
  Pipeline p(quick_config());
  auto owned = std::make_unique<test::RecordingSink>();
  auto* sink = owned.get();
  p.add_sink(std::move(owned));

  test::MemorySource src;
  for (std::uint32_t i = 1; i <= 10; ++i) src.push(test::make_sample(3, i));
  p.run(src);

  const auto lines = sink->lines();
  REQUIRE_FALSE(lines.empty());
  REQUIRE(lines.back().find("\"processed\":10") != std::string::npos);

  std::uint64_t cursor = 0;
  PipelineSnapshot seen{};
  REQUIRE(p.view().try_consume_latest(cursor, seen));
  REQUIRE(seen.metrics.processed == 10);
}

TEST_CASE("final report applies the latency and loss thresholds") {
  Pipeline p(quick_config());
  test::MemorySource src;
  for (std::uint32_t i = 1; i <= 50; ++i) src.push(test::make_sample(1, i));
  p.run(src);

  const auto& r = p.report();
  REQUIRE(r.metrics.drop_rate_pct == 0.0);
  REQUIRE(r.drop_rate_ok);
  REQUIRE(r.latency_ok);
  REQUIRE(r.passed());

  FinalReport lossy = r;
  lossy.drop_rate_ok = false;
  REQUIRE_FALSE(lossy.passed());
}

TEST_CASE("pipeline rejects invalid configuration and second runs") {
  auto bad = quick_config();
  bad.capacity = 0;
  REQUIRE_THROWS_AS(Pipeline(bad), ConfigError);

  auto cfg = quick_config();
  cfg.idle_timeout = milliseconds(20);
  Pipeline p(cfg);
  test::MemorySource src;
  p.run(src);
  REQUIRE_THROWS_AS(p.run(src), std::logic_error);
}

TEST_CASE("shutdown reason names") {
  REQUIRE(std::string(to_string(ShutdownReason::IdleTimeout)) == "IdleTimeout");
  REQUIRE(std::string(to_string(ShutdownReason::TransportFailed)) == "TransportFailed");
}
