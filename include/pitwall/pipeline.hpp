#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>
#include <pitwall/config.hpp>
#include <pitwall/ingest.hpp>
#include <pitwall/metrics.hpp>
#include <pitwall/priority_ring.hpp>
#include <pitwall/processor.hpp>
#include <pitwall/publisher.hpp>
#include <pitwall/snapshot.hpp>
#include <pitwall/strategy.hpp>
#include <pitwall/transport.hpp>

namespace pitwall {

enum class ShutdownReason : std::uint8_t {
  IdleTimeout,
  StopRequested,
  TransportFailed,
};

const char* to_string(ShutdownReason r);

struct FinalReport {
  ShutdownReason reason = ShutdownReason::StopRequested;
  MetricsSnapshot metrics{};
  std::uint64_t total_decisions = 0;
  bool latency_ok = false;     // p99 < budget
  bool drop_rate_ok = false;   // drop rate < 0.1 %

  bool passed() const { return latency_ok && drop_rate_ok; }
};

// Owns every stage and its thread. run() drives ingestion on the calling
// thread with the processor and publisher on their own threads, and returns
// once the pipeline has shut down and drained.
class Pipeline {
public:
  static constexpr double kMaxDropRatePct = 0.1;

  // Throws ConfigError if cfg is invalid.
  explicit Pipeline(PipelineConfig cfg);
  ~Pipeline();
  Pipeline(const Pipeline&) = delete;
  Pipeline& operator=(const Pipeline&) = delete;

  // Call before run().
  void add_sink(std::unique_ptr<LiveViewSink> sink);

  // Blocks until idle timeout, request_stop() or an unrecoverable receive
  // failure. Single use.
  ShutdownReason run(DatagramSource& source);

  // Safe from any thread and from a signal handler.
  void request_stop() { stop_.store(true, std::memory_order_relaxed); }
  bool running() const { return running_.load(std::memory_order_acquire); }

  // Valid after run() returns.
  const FinalReport& report() const { return report_; }

  // Latest published snapshot, for in-process viewers.
  SnapshotBuffer& view() { return publisher_.view(); }

  const PipelineConfig& config() const { return cfg_; }
  const PriorityRing& ring() const { return ring_; }

private:
  ShutdownReason ingest_loop_(DatagramSource& source);
  void build_report_(ShutdownReason reason);

  PipelineConfig cfg_;
  PriorityRing ring_;
  Metrics metrics_;
  Strategy strategy_;
  SnapshotBuffer snapshots_;
  Processor processor_;
  Publisher publisher_;
  IngestStage ingest_;

  std::vector<std::uint8_t> buf_;
  std::atomic<bool> stop_{false};
  std::atomic<bool> running_{false};
  bool used_ = false;
  FinalReport report_{};
};

// Logs the final statistics and the pass/fail assessment.
void log_final_report(const FinalReport& r, std::chrono::milliseconds budget);

} // namespace pitwall
