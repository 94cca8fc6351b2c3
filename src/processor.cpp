#include <pitwall/processor.hpp>
#include <pitwall/errors.hpp>
#include <pitwall/log.hpp>
#include <pitwall/wire.hpp>
#include <exception>
#include <string_view>

namespace pitwall {

namespace {
constexpr std::size_t kMaxErrorText = 255;

void keep_error(std::string& dst, const char* what) {
  // Reuses the reserved capacity; no allocation once reserved.
  const std::string_view msg(what);
  dst.assign(msg.substr(0, kMaxErrorText));
}
} // namespace

Processor::Processor(PriorityRing& ring, Metrics& metrics, Strategy& strategy,
                     SnapshotBuffer& out, ProcessorConfig cfg)
  : ring_(ring), metrics_(metrics), strategy_(strategy), out_(out),
    cfg_(cfg), load_(cfg.load),
    recent_(cfg.recent_outcomes == 0 ? 1 : cfg.recent_outcomes) {
  scratch_.recent_outcomes.reserve(recent_.size());
  scratch_.recent_decisions.reserve(cfg_.recent_decisions);
  last_error_.reserve(kMaxErrorText);
  scratch_.last_error.reserve(kMaxErrorText);
}

std::chrono::microseconds Processor::latency_(const PriorityRing::Entry& e,
                                              Clock::time_point now) const {
  using namespace std::chrono;
  if (cfg_.reference == LatencyReference::Source) {
    const std::uint64_t wall = wall_clock_ms();
    const std::uint64_t src = e.sample.source_ts_ms;
    return wall > src ? duration_cast<microseconds>(milliseconds(wall - src)) : microseconds(0);
  }
  return duration_cast<microseconds>(now - e.arrival);
}

void Processor::remember_(const OutcomeRecord& o) {
  recent_[recent_head_] = o;
  recent_head_ = (recent_head_ + 1) % recent_.size();
  if (recent_count_ < recent_.size()) ++recent_count_;
}

OutcomeRecord Processor::process_(const PriorityRing::Entry& e) {
  const Sample& s = e.sample;
  OutcomeRecord o{};
  o.car = s.car;
  o.seq = s.seq;
  o.priority = s.priority;
  o.status = OutcomeStatus::Processed;

  Derived d{};
  bool ok = true;
  try {
    load_.run(s);
    d = strategy_.derive(s);
  } catch (const std::exception& ex) {
    // ProcessingError from derivation, anything else from per-sample work:
    // either way the sample fails and the processor moves on.
    ok = false;
    o.status = OutcomeStatus::ProcessingError;
    keep_error(last_error_, ex.what());
  }

  const auto now = Clock::now();
  o.latency = latency_(e, now);
  o.met_deadline = o.latency <= cfg_.budget;

  if (ok) {
    strategy_.update(s, d, o);
    if (!d.reordered) {
      latest_ = s;
      has_latest_ = true;
    }
  }
  metrics_.record(o, wire::kFrameSize, now);
  remember_(o);
  ++processed_;
  return o;
}

std::optional<OutcomeRecord> Processor::process_next() {
  auto e = ring_.take_next();
  if (!e) return std::nullopt;
  return process_(*e);
}

std::size_t Processor::drain() {
  std::size_t n = 0;
  while (auto e = ring_.take_next()) {
    process_(*e);
    ++n;
  }
  return n;
}

void Processor::publish_snapshot(Clock::time_point now) {
  PipelineSnapshot& s = scratch_;
  s.tick = ++snapshots_;
  s.wall_ts_ms = wall_clock_ms();
  s.budget = cfg_.budget;
  s.metrics = metrics_.snapshot(now);

  const auto rs = ring_.stats();
  s.buffer_size = ring_.size();
  s.buffer_capacity = ring_.capacity();
  s.buffer_high_water = rs.high_water;

  s.recent_outcomes.clear();
  for (std::size_t i = 0; i < recent_count_; ++i) {
    s.recent_outcomes.push_back(recent_[(recent_head_ + recent_.size() - recent_count_ + i) % recent_.size()]);
  }
  strategy_.recent(cfg_.recent_decisions, s.recent_decisions);
  s.total_decisions = strategy_.total_decisions();
  s.untracked_readings = strategy_.untracked();
  s.last_error = last_error_;
  s.has_latest = has_latest_;
  s.latest = latest_;

  out_.publish(s);
  last_snapshot_ = now;
}

void Processor::maybe_snapshot_(Clock::time_point now) {
  if (now - last_snapshot_ >= cfg_.snapshot_interval) publish_snapshot(now);
}

void Processor::run() {
  PW_INFO("[PROC] started, budget " << cfg_.budget.count() << "ms, capacity " << ring_.capacity());
  const auto idle_wait = cfg_.snapshot_interval.count() > 0
    ? cfg_.snapshot_interval : std::chrono::milliseconds(50);

  while (true) {
    if (!ring_.wait_for_data(idle_wait)) {
      // Idle: keep uptime and throughput moving for the publisher.
      publish_snapshot(Clock::now());
      if (ring_.closed() && ring_.empty()) break;
      continue;
    }
    while (auto e = ring_.take_next()) {
      process_(*e);
      maybe_snapshot_(Clock::now());
    }
  }

  publish_snapshot(Clock::now());
  PW_INFO("[PROC] stopped after " << processed_ << " samples");
}

} // namespace pitwall
