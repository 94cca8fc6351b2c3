#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <thread>
#include <vector>
#include <pitwall/snapshot.hpp>
#include <pitwall/transport.hpp>

namespace pitwall {

struct PublisherConfig {
  std::chrono::milliseconds interval{100};
  std::chrono::milliseconds summary_interval{2000};
};

// Owns the publishing thread. Each tick takes the latest snapshot from the
// processor, serializes it and hands it to every sink. Never waits on the
// processor and never lets a sink failure travel back upstream.
class Publisher {
public:
  using Clock = std::chrono::steady_clock;

  Publisher(SnapshotBuffer& in, PublisherConfig cfg = {});
  ~Publisher() { stop(); }
  Publisher(const Publisher&) = delete;
  Publisher& operator=(const Publisher&) = delete;

  // Call before start().
  void add_sink(std::unique_ptr<LiveViewSink> sink);

  void start();
  void stop();

  // One publishing cycle. Returns true if a new snapshot was emitted.
  bool tick(Clock::time_point now);

  // Latest published snapshot, for in-process viewers.
  SnapshotBuffer& view() { return view_; }
  const SnapshotBuffer& view() const { return view_; }

  std::uint64_t emitted() const { return emitted_.load(std::memory_order_relaxed); }
  std::uint64_t send_failures() const { return send_failures_.load(std::memory_order_relaxed); }
  std::size_t sink_count() const { return sinks_.size(); }

private:
  void thread_main_();
  void log_summary_(const PipelineSnapshot& s);

  SnapshotBuffer& in_;
  PublisherConfig cfg_;
  std::vector<std::unique_ptr<LiveViewSink>> sinks_;

  std::thread th_;
  std::atomic<bool> running_{false};

  std::uint64_t cursor_ = 0;
  PipelineSnapshot current_{};
  SnapshotBuffer view_;
  Clock::time_point last_summary_{};
  MetricsSnapshot last_logged_{};
  std::uint64_t last_untracked_ = 0;

  std::atomic<std::uint64_t> emitted_{0};
  std::atomic<std::uint64_t> send_failures_{0};
};

} // namespace pitwall
