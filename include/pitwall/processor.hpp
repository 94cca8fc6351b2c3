#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <pitwall/load_model.hpp>
#include <pitwall/metrics.hpp>
#include <pitwall/outcome.hpp>
#include <pitwall/priority_ring.hpp>
#include <pitwall/snapshot.hpp>
#include <pitwall/strategy.hpp>

namespace pitwall {

// Where latency is measured from. Source requires producers to stamp
// samples with wall-clock epoch milliseconds.
enum class LatencyReference : std::uint8_t {
  Arrival,
  Source,
};

struct ProcessorConfig {
  std::chrono::milliseconds budget{10};
  LatencyReference reference = LatencyReference::Arrival;
  std::chrono::milliseconds snapshot_interval{50};
  std::size_t recent_outcomes = 16;
  std::size_t recent_decisions = 8;
  LoadConfig load{};
};

// Single consumer of the ring. Every dequeued sample is fully processed,
// late or not; lateness is recorded in the outcome. The outcome goes to
// Metrics and Strategy in the same step, then snapshots are handed to the
// publisher through a latest-value buffer at most once per interval.
class Processor {
public:
  using Clock = std::chrono::steady_clock;

  Processor(PriorityRing& ring, Metrics& metrics, Strategy& strategy,
            SnapshotBuffer& out, ProcessorConfig cfg = {});

  Processor(const Processor&) = delete;
  Processor& operator=(const Processor&) = delete;

  // Takes and processes one sample; nullopt when the ring is empty.
  std::optional<OutcomeRecord> process_next();

  // Processes until the ring is empty. Returns the number processed.
  std::size_t drain();

  // Thread body: runs until the ring is closed and drained, then publishes
  // a final snapshot.
  void run();

  // Builds a snapshot from current state and hands it to the publisher.
  void publish_snapshot(Clock::time_point now);

  std::uint64_t processed() const { return processed_; }
  const ProcessorConfig& config() const { return cfg_; }

private:
  OutcomeRecord process_(const PriorityRing::Entry& e);
  std::chrono::microseconds latency_(const PriorityRing::Entry& e, Clock::time_point now) const;
  void remember_(const OutcomeRecord& o);
  void maybe_snapshot_(Clock::time_point now);

  PriorityRing& ring_;
  Metrics& metrics_;
  Strategy& strategy_;
  SnapshotBuffer& out_;
  ProcessorConfig cfg_;
  LoadModel load_;

  std::vector<OutcomeRecord> recent_;   // ring of the last cfg_.recent_outcomes
  std::size_t recent_head_ = 0;
  std::size_t recent_count_ = 0;

  bool has_latest_ = false;
  Sample latest_{};

  PipelineSnapshot scratch_{};
  Clock::time_point last_snapshot_{};
  std::uint64_t snapshots_ = 0;
  std::uint64_t processed_ = 0;
  std::string last_error_;              // what() of the most recent failure
};

} // namespace pitwall
