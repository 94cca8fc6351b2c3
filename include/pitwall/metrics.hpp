#pragma once
#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <vector>
#include <pitwall/errors.hpp>
#include <pitwall/outcome.hpp>

namespace pitwall {

struct LatencySummary {
  std::size_t count = 0;
  double mean_ms = 0.0;
  double p50_ms = 0.0;
  double p95_ms = 0.0;
  double p99_ms = 0.0;
  double max_ms = 0.0;
};

// Most recent N latencies in a fixed ring; percentiles are computed on a
// preallocated scratch copy so reads never allocate.
class LatencyWindow {
public:
  explicit LatencyWindow(std::size_t cap = 1024);

  void add(std::chrono::microseconds v);
  LatencySummary summarize() const;
  std::size_t size() const { return count_; }
  void clear() { head_ = 0; count_ = 0; }

private:
  std::vector<std::int64_t> ring_;
  mutable std::vector<std::int64_t> scratch_;
  std::size_t head_ = 0;
  std::size_t count_ = 0;
};

// Samples/s and bytes/s over a sliding window of one-second buckets.
class ThroughputWindow {
public:
  using Clock = std::chrono::steady_clock;
  static constexpr std::size_t kMaxWindowS = 60;

  explicit ThroughputWindow(std::size_t window_s = 5);

  void start(Clock::time_point t0);
  void add(Clock::time_point now, std::uint64_t samples, std::uint64_t bytes);
  // Rates over min(window, time since start). Zero until time has passed.
  void rates(Clock::time_point now, double& samples_per_s, double& bytes_per_s) const;

private:
  struct Bucket {
    std::int64_t second = -1;
    std::uint64_t samples = 0;
    std::uint64_t bytes = 0;
  };
  std::int64_t second_of_(Clock::time_point t) const;

  std::size_t window_s_;
  Clock::time_point t0_{};
  std::array<Bucket, kMaxWindowS> buckets_{};
};

struct MetricsSnapshot {
  // Ingestion side
  std::uint64_t received = 0;
  std::uint64_t bytes_received = 0;
  std::uint64_t malformed = 0;
  std::uint64_t version_mismatch = 0;
  std::uint64_t checksum_failures = 0;
  std::uint64_t filtered = 0;
  std::uint64_t duplicates = 0;
  std::uint64_t out_of_order = 0;
  std::uint64_t admitted = 0;
  std::uint64_t evicted = 0;
  std::uint64_t rejected = 0;
  // Processing side
  std::uint64_t processed = 0;
  std::uint64_t late = 0;
  std::uint64_t processing_errors = 0;
  std::uint64_t bytes_processed = 0;

  LatencySummary latency{};
  double throughput_sps = 0.0;
  double bytes_per_sec = 0.0;
  double avg_pps = 0.0;      // received packets over uptime
  double drop_rate_pct = 0.0;
  double uptime_s = 0.0;

  std::uint64_t decode_failures() const { return malformed + version_mismatch + checksum_failures; }
  std::uint64_t stale() const { return duplicates + out_of_order; }
  std::uint64_t dropped() const { return decode_failures() + stale() + evicted + rejected; }
  std::uint64_t outcomes() const { return processed + processing_errors + evicted + rejected; }
};

// Pipeline-wide counters and rolling windows.
//
// Two writers, disjoint fields: the ingestion thread owns the atomic
// counters (on_* ingestion hooks), the processor thread owns everything
// else (record). snapshot() is called from the processor thread; the
// publisher only ever sees the copies it produces.
class Metrics {
public:
  using Clock = std::chrono::steady_clock;

  explicit Metrics(std::size_t latency_window = 1024, std::size_t throughput_window_s = 5);

  // Ingestion thread
  void on_received(std::size_t bytes);
  void on_decode_failure(DecodeError e);
  void on_filtered();
  void on_duplicate();
  void on_out_of_order();
  void on_admitted();
  void on_dropped(const OutcomeRecord& o);   // Evicted or Rejected

  // Processor thread
  void start(Clock::time_point t0);
  void record(const OutcomeRecord& o, std::size_t bytes, Clock::time_point now);
  MetricsSnapshot snapshot(Clock::time_point now) const;

  // Explicit restart only; no stage may be running.
  void reset(Clock::time_point t0);

private:
  struct Ingest {
    std::atomic<std::uint64_t> received{0};
    std::atomic<std::uint64_t> bytes_received{0};
    std::atomic<std::uint64_t> malformed{0};
    std::atomic<std::uint64_t> version_mismatch{0};
    std::atomic<std::uint64_t> checksum_failures{0};
    std::atomic<std::uint64_t> filtered{0};
    std::atomic<std::uint64_t> duplicates{0};
    std::atomic<std::uint64_t> out_of_order{0};
    std::atomic<std::uint64_t> admitted{0};
    std::atomic<std::uint64_t> evicted{0};
    std::atomic<std::uint64_t> rejected{0};
  };

  static void bump_(std::atomic<std::uint64_t>& c, std::uint64_t n = 1) {
    c.fetch_add(n, std::memory_order_relaxed);
  }

  Ingest in_;

  std::uint64_t processed_ = 0;
  std::uint64_t late_ = 0;
  std::uint64_t processing_errors_ = 0;
  std::uint64_t bytes_processed_ = 0;
  LatencyWindow latency_;
  ThroughputWindow throughput_;
  Clock::time_point t0_{};
};

} // namespace pitwall
