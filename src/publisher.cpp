#include <pitwall/publisher.hpp>
#include <pitwall/log.hpp>

namespace pitwall {

Publisher::Publisher(SnapshotBuffer& in, PublisherConfig cfg)
  : in_(in), cfg_(cfg) {}

void Publisher::add_sink(std::unique_ptr<LiveViewSink> sink) {
  if (sink) sinks_.push_back(std::move(sink));
}

void Publisher::start() {
  if (running_.load()) return;
  running_.store(true);
  last_summary_ = Clock::now();
  th_ = std::thread(&Publisher::thread_main_, this);
}

void Publisher::stop() {
  if (!running_.load()) return;
  running_.store(false);
  if (th_.joinable()) th_.join();
  // Pick up whatever the processor published last.
  tick(Clock::now());
}

void Publisher::log_summary_(const PipelineSnapshot& s) {
  const auto& m = s.metrics;
  const auto& p = last_logged_;
  PW_INFO("[SUMMARY] " << m.received << " pkts (" << static_cast<long long>(m.avg_pps) << " pps)"
          << " | processed " << m.processed
          << " | p50 " << m.latency.p50_ms << "ms p99 " << m.latency.p99_ms << "ms"
          << " | drops " << m.dropped() << " (" << m.drop_rate_pct << "%)"
          << " | buffer " << s.buffer_size << "/" << s.buffer_capacity
          << " | advisories " << s.total_decisions);

  // The ingestion and processing threads only count; what went wrong since
  // the last summary is reported from here.
  if (m.dropped() > p.dropped()) {
    PW_WARN("[SUMMARY] +" << (m.dropped() - p.dropped()) << " dropped:"
            << " decode " << (m.decode_failures() - p.decode_failures())
            << ", stale " << (m.stale() - p.stale())
            << ", evicted " << (m.evicted - p.evicted)
            << ", rejected " << (m.rejected - p.rejected));
  }
  if (m.late > p.late) {
    PW_WARN("[SUMMARY] +" << (m.late - p.late) << " late (budget " << s.budget.count() << "ms)");
  }
  if (m.processing_errors > p.processing_errors) {
    PW_WARN("[SUMMARY] +" << (m.processing_errors - p.processing_errors)
            << " processing errors, last: " << s.last_error);
  }
  if (s.untracked_readings > last_untracked_) {
    PW_WARN("[SUMMARY] +" << (s.untracked_readings - last_untracked_)
            << " readings from cars beyond the strategy pool");
  }
  last_logged_ = m;
  last_untracked_ = s.untracked_readings;
}

bool Publisher::tick(Clock::time_point now) {
  if (!in_.try_consume_latest(cursor_, current_)) return false;

  const std::string line = to_json(current_);
  for (auto& sink : sinks_) {
    if (!sink->send(line)) {
      send_failures_.fetch_add(1, std::memory_order_relaxed);
      PW_TRACE("[PUB] " << sink->describe() << " did not take snapshot " << current_.tick);
    }
  }
  view_.publish(current_);
  emitted_.fetch_add(1, std::memory_order_relaxed);

  if (now - last_summary_ >= cfg_.summary_interval) {
    last_summary_ = now;
    if (current_.metrics.received > 0) log_summary_(current_);
  }
  return true;
}

void Publisher::thread_main_() {
  auto next = Clock::now();
  while (running_.load(std::memory_order_relaxed)) {
    const auto now = Clock::now();
    tick(now);
    next += cfg_.interval;
    if (next < now) next = now + cfg_.interval;   // fell behind, don't burst
    std::this_thread::sleep_until(next);
  }
}

} // namespace pitwall
