#include <pitwall/pipeline.hpp>
#include <pitwall/errors.hpp>
#include <pitwall/log.hpp>
#include <pitwall/retry.hpp>
#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <thread>

namespace pitwall {

namespace {

PipelineConfig checked(PipelineConfig c) {
  c.validate();
  return c;
}

IngestConfig ingest_config(const PipelineConfig& c) {
  IngestConfig ic{};
  ic.target_car = c.target_car;
  ic.verify_checksum = c.verify_checksum;
  ic.require_checksum = c.require_checksum;
  // Arrival-referenced timestamps may be session-relative.
  ic.check_horizon = c.processor.reference == LatencyReference::Source;
  ic.max_future_ms = c.max_future_ms;
  ic.priorities = c.priorities;
  return ic;
}

constexpr std::chrono::milliseconds kPollSlice{100};

} // namespace

const char* to_string(ShutdownReason r) {
  switch (r) {
    case ShutdownReason::IdleTimeout:     return "IdleTimeout";
    case ShutdownReason::StopRequested:   return "StopRequested";
    case ShutdownReason::TransportFailed: return "TransportFailed";
  }
  return "Unknown";
}

Pipeline::Pipeline(PipelineConfig cfg)
  : cfg_(checked(std::move(cfg))),
    ring_(cfg_.capacity),
    metrics_(cfg_.latency_window, cfg_.throughput_window_s),
    strategy_(cfg_.strategy),
    processor_(ring_, metrics_, strategy_, snapshots_, cfg_.processor),
    publisher_(snapshots_, PublisherConfig{ .interval = cfg_.publish_interval,
                                            .summary_interval = cfg_.summary_interval }),
    ingest_(ring_, metrics_, ingest_config(cfg_)),
    buf_(cfg_.recv_buffer) {}

Pipeline::~Pipeline() {
  request_stop();
  publisher_.stop();
}

void Pipeline::add_sink(std::unique_ptr<LiveViewSink> sink) {
  publisher_.add_sink(std::move(sink));
}

ShutdownReason Pipeline::ingest_loop_(DatagramSource& source) {
  using Clock = PriorityRing::Clock;
  auto last_rx = Clock::now();
  int consecutive_errors = 0;

  while (!stop_.load(std::memory_order_relaxed)) {
    const auto now = Clock::now();
    const auto idle = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_rx);
    if (idle >= cfg_.idle_timeout) {
      PW_INFO("[INGEST] no data for " << idle.count() << "ms, shutting down");
      return ShutdownReason::IdleTimeout;
    }
    const auto slice = std::min(kPollSlice, cfg_.idle_timeout - idle);

    const RecvResult r = source.receive(std::span<std::uint8_t>(buf_.data(), buf_.size()), slice);
    switch (r.status) {
      case RecvStatus::Data: {
        const auto arrival = Clock::now();
        last_rx = arrival;
        consecutive_errors = 0;
        ingest_.on_datagram(std::span<const std::uint8_t>(buf_.data(), r.size), arrival);
        break;
      }
      case RecvStatus::Timeout:
        break;
      case RecvStatus::Error: {
        if (consecutive_errors >= cfg_.retry.attempts) {
          PW_ERROR("[INGEST] receive failed " << consecutive_errors << " times on "
                   << source.describe() << ": " << std::strerror(r.error));
          return ShutdownReason::TransportFailed;
        }
        const auto d = backoff_delay(cfg_.retry, consecutive_errors++);
        PW_WARN("[INGEST] receive error on " << source.describe() << ": "
                << std::strerror(r.error) << ", retrying in " << d.count() << "ms");
        std::this_thread::sleep_for(d);
        last_rx = Clock::now();   // time spent backing off is not idleness
        break;
      }
    }
  }
  return ShutdownReason::StopRequested;
}

ShutdownReason Pipeline::run(DatagramSource& source) {
  if (used_) throw std::logic_error("Pipeline::run called twice");
  used_ = true;

  PW_INFO("[PIPELINE] " << cfg_);
  PW_INFO("[PIPELINE] ingesting from " << source.describe());

  metrics_.start(PriorityRing::Clock::now());
  running_.store(true, std::memory_order_release);

  std::thread proc_th(&Processor::run, &processor_);
  publisher_.start();

  ShutdownReason reason = ShutdownReason::StopRequested;
  try {
    reason = ingest_loop_(source);
  } catch (...) {
    ring_.close();
    proc_th.join();
    publisher_.stop();
    running_.store(false, std::memory_order_release);
    throw;
  }

  // Drain: no more admissions, processor finishes what is buffered.
  ring_.close();
  proc_th.join();
  publisher_.stop();
  running_.store(false, std::memory_order_release);

  build_report_(reason);
  log_final_report(report_, cfg_.processor.budget);
  return reason;
}

void Pipeline::build_report_(ShutdownReason reason) {
  // Processor thread has been joined; safe to read its state here.
  report_.reason = reason;
  report_.metrics = metrics_.snapshot(PriorityRing::Clock::now());
  report_.total_decisions = strategy_.total_decisions();
  const double budget_ms = static_cast<double>(cfg_.processor.budget.count());
  report_.latency_ok = report_.metrics.latency.p99_ms < budget_ms;
  report_.drop_rate_ok = report_.metrics.drop_rate_pct < kMaxDropRatePct;
}

void log_final_report(const FinalReport& r, std::chrono::milliseconds budget) {
  const auto& m = r.metrics;
  PW_INFO("========== FINAL STATISTICS (" << to_string(r.reason) << ") ==========");
  PW_INFO("Total packets:     " << m.received << " (" << m.bytes_received << " bytes)");
  PW_INFO("Processed:         " << m.processed << " (" << m.late << " late, "
          << m.processing_errors << " errors)");
  PW_INFO("Dropped:           " << m.dropped() << " (" << m.drop_rate_pct << "%)"
          << " decode " << m.decode_failures() << ", stale " << m.stale()
          << ", evicted " << m.evicted << ", rejected " << m.rejected);
  PW_INFO("Filtered:          " << m.filtered);
  PW_INFO("Avg throughput:    " << m.avg_pps << " pkt/s over " << m.uptime_s << "s");
  PW_INFO("Latency:           mean " << m.latency.mean_ms << "ms p50 " << m.latency.p50_ms
          << "ms p95 " << m.latency.p95_ms << "ms p99 " << m.latency.p99_ms
          << "ms max " << m.latency.max_ms << "ms");
  PW_INFO("Advisories:        " << r.total_decisions);
  PW_INFO("P99 < " << budget.count() << "ms:       " << (r.latency_ok ? "PASS" : "FAIL"));
  PW_INFO("Drop rate < " << Pipeline::kMaxDropRatePct << "%:  " << (r.drop_rate_ok ? "PASS" : "FAIL"));
  if (r.passed()) {
    PW_INFO("All latency and loss requirements met");
  } else {
    PW_WARN("Latency or loss requirements not met");
  }
}

} // namespace pitwall
