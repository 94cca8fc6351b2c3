#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <pitwall/metrics.hpp>
#include <pitwall/outcome.hpp>
#include <pitwall/sample.hpp>
#include <pitwall/snap_buffer.hpp>
#include <pitwall/strategy.hpp>

namespace pitwall {

// Immutable copy of pipeline state handed from the processor to the publisher.
struct PipelineSnapshot {
  std::uint64_t tick = 0;             // processor snapshot counter
  std::uint64_t wall_ts_ms = 0;       // system clock at capture
  std::chrono::milliseconds budget{0};

  MetricsSnapshot metrics{};

  std::size_t buffer_size = 0;
  std::size_t buffer_capacity = 0;
  std::size_t buffer_high_water = 0;

  std::vector<OutcomeRecord> recent_outcomes;   // oldest first
  std::vector<Decision> recent_decisions;       // oldest first
  std::uint64_t total_decisions = 0;
  std::uint64_t untracked_readings = 0; // cars beyond the strategy pool
  std::string last_error;               // most recent processing error, if any

  bool has_latest = false;
  Sample latest{};                    // most recently processed sample
};

using SnapshotBuffer = LatestBuffer<PipelineSnapshot>;

// Live-view wire form, one line, no trailing newline:
// {"timestamp":..,"throughput":..,"bytes_per_sec":..,"latency_p50":..,
//  "latency_p99":..,"drop_rate":..,"counters":{..},"buffer":{..},
//  "recent_outcomes":[..],"recent_decisions":[..],"latest":{..}}
std::string to_json(const PipelineSnapshot& s);

std::uint64_t wall_clock_ms();

} // namespace pitwall
