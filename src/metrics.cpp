#include <pitwall/metrics.hpp>
#include <algorithm>

namespace pitwall {

// ---- LatencyWindow ----

LatencyWindow::LatencyWindow(std::size_t cap)
  : ring_(cap == 0 ? 1 : cap), scratch_(ring_.size()) {}

void LatencyWindow::add(std::chrono::microseconds v) {
  ring_[head_] = v.count();
  head_ = (head_ + 1) % ring_.size();
  if (count_ < ring_.size()) ++count_;
}

LatencySummary LatencyWindow::summarize() const {
  LatencySummary s{};
  const std::size_t n = count_;
  if (n == 0) return s;

  // Oldest entries are overwritten first, so the live range is the whole
  // ring once full and [0, n) before that.
  std::copy(ring_.begin(), ring_.begin() + static_cast<std::ptrdiff_t>(n), scratch_.begin());
  auto first = scratch_.begin();
  auto last  = scratch_.begin() + static_cast<std::ptrdiff_t>(n);

  double sum = 0.0;
  std::int64_t mx = 0;
  for (auto it = first; it != last; ++it) {
    sum += static_cast<double>(*it);
    mx = std::max(mx, *it);
  }

  auto at = [&](double q) {
    const std::size_t idx = std::min(static_cast<std::size_t>(static_cast<double>(n) * q), n - 1);
    std::nth_element(first, first + static_cast<std::ptrdiff_t>(idx), last);
    return static_cast<double>(*(first + static_cast<std::ptrdiff_t>(idx))) / 1000.0;
  };

  s.count  = n;
  s.mean_ms = sum / static_cast<double>(n) / 1000.0;
  s.max_ms = static_cast<double>(mx) / 1000.0;
  s.p50_ms = at(0.50);
  s.p95_ms = at(0.95);
  s.p99_ms = at(0.99);
  return s;
}

// ---- ThroughputWindow ----

ThroughputWindow::ThroughputWindow(std::size_t window_s)
  : window_s_(std::clamp<std::size_t>(window_s, 1, kMaxWindowS - 1)) {}

void ThroughputWindow::start(Clock::time_point t0) {
  t0_ = t0;
  buckets_.fill(Bucket{});
}

std::int64_t ThroughputWindow::second_of_(Clock::time_point t) const {
  return std::chrono::duration_cast<std::chrono::seconds>(t - t0_).count();
}

void ThroughputWindow::add(Clock::time_point now, std::uint64_t samples, std::uint64_t bytes) {
  const std::int64_t sec = second_of_(now);
  if (sec < 0) return;
  auto& b = buckets_[static_cast<std::size_t>(sec) % kMaxWindowS];
  if (b.second != sec) b = Bucket{sec, 0, 0};
  b.samples += samples;
  b.bytes += bytes;
}

void ThroughputWindow::rates(Clock::time_point now, double& samples_per_s, double& bytes_per_s) const {
  samples_per_s = 0.0;
  bytes_per_s = 0.0;
  const double elapsed = std::chrono::duration<double>(now - t0_).count();
  if (elapsed <= 0.0) return;

  const std::int64_t cur = second_of_(now);
  const std::int64_t oldest = cur - static_cast<std::int64_t>(window_s_) + 1;
  std::uint64_t n = 0, bytes = 0;
  for (const auto& b : buckets_) {
    if (b.second >= oldest && b.second <= cur) {
      n += b.samples;
      bytes += b.bytes;
    }
  }
  // Span covered by the counted buckets: whole buckets behind the current
  // one plus the elapsed part of the current one.
  const double into_cur = elapsed - static_cast<double>(cur);
  const double span = std::min(elapsed, static_cast<double>(window_s_ - 1) + into_cur);
  if (span <= 0.0) return;
  samples_per_s = static_cast<double>(n) / span;
  bytes_per_s = static_cast<double>(bytes) / span;
}

// ---- Metrics ----

Metrics::Metrics(std::size_t latency_window, std::size_t throughput_window_s)
  : latency_(latency_window), throughput_(throughput_window_s) {
  start(Clock::now());
}

void Metrics::on_received(std::size_t bytes) {
  bump_(in_.received);
  bump_(in_.bytes_received, bytes);
}

void Metrics::on_decode_failure(DecodeError e) {
  switch (e) {
    case DecodeError::MalformedPacket: bump_(in_.malformed); break;
    case DecodeError::VersionMismatch: bump_(in_.version_mismatch); break;
    case DecodeError::ChecksumFailure: bump_(in_.checksum_failures); break;
    case DecodeError::None: break;
  }
}

void Metrics::on_filtered()     { bump_(in_.filtered); }
void Metrics::on_duplicate()    { bump_(in_.duplicates); }
void Metrics::on_out_of_order() { bump_(in_.out_of_order); }
void Metrics::on_admitted()     { bump_(in_.admitted); }

void Metrics::on_dropped(const OutcomeRecord& o) {
  if (o.status == OutcomeStatus::Evicted)  bump_(in_.evicted);
  if (o.status == OutcomeStatus::Rejected) bump_(in_.rejected);
}

void Metrics::start(Clock::time_point t0) {
  t0_ = t0;
  throughput_.start(t0);
}

void Metrics::record(const OutcomeRecord& o, std::size_t bytes, Clock::time_point now) {
  if (o.status == OutcomeStatus::ProcessingError) {
    ++processing_errors_;
  } else {
    ++processed_;
  }
  if (!o.met_deadline) ++late_;
  bytes_processed_ += bytes;
  latency_.add(o.latency);
  throughput_.add(now, 1, bytes);
}

MetricsSnapshot Metrics::snapshot(Clock::time_point now) const {
  auto ld = [](const std::atomic<std::uint64_t>& c){ return c.load(std::memory_order_relaxed); };

  MetricsSnapshot s{};
  s.received          = ld(in_.received);
  s.bytes_received    = ld(in_.bytes_received);
  s.malformed         = ld(in_.malformed);
  s.version_mismatch  = ld(in_.version_mismatch);
  s.checksum_failures = ld(in_.checksum_failures);
  s.filtered          = ld(in_.filtered);
  s.duplicates        = ld(in_.duplicates);
  s.out_of_order      = ld(in_.out_of_order);
  s.admitted          = ld(in_.admitted);
  s.evicted           = ld(in_.evicted);
  s.rejected          = ld(in_.rejected);

  s.processed         = processed_;
  s.late              = late_;
  s.processing_errors = processing_errors_;
  s.bytes_processed   = bytes_processed_;

  s.latency = latency_.summarize();
  throughput_.rates(now, s.throughput_sps, s.bytes_per_sec);

  s.uptime_s = std::chrono::duration<double>(now - t0_).count();
  if (s.uptime_s > 0.0) s.avg_pps = static_cast<double>(s.received) / s.uptime_s;
  if (s.received > 0) {
    s.drop_rate_pct = static_cast<double>(s.dropped()) / static_cast<double>(s.received) * 100.0;
  }
  return s;
}

void Metrics::reset(Clock::time_point t0) {
  for (auto* c : {&in_.received, &in_.bytes_received, &in_.malformed, &in_.version_mismatch,
                  &in_.checksum_failures, &in_.filtered, &in_.duplicates, &in_.out_of_order,
                  &in_.admitted, &in_.evicted, &in_.rejected}) {
    c->store(0, std::memory_order_relaxed);
  }
  processed_ = 0;
  late_ = 0;
  processing_errors_ = 0;
  bytes_processed_ = 0;
  latency_.clear();
  start(t0);
}

} // namespace pitwall
