#include <pitwall/config.hpp>
#include <pitwall/errors.hpp>
#include <pitwall/metrics.hpp>
#include <ostream>

namespace pitwall {

namespace {
void require(bool ok, const char* msg) {
  if (!ok) throw ConfigError(msg);
}
}

void PipelineConfig::validate() const {
  require(port != 0, "port must be non-zero");
  require(recv_buffer > 0, "recv_buffer must be positive");
  require(capacity > 0, "capacity must be positive");
  require(idle_timeout.count() > 0, "idle_timeout must be positive");
  require(processor.budget.count() > 0, "budget must be positive");
  require(processor.snapshot_interval.count() > 0, "snapshot_interval must be positive");
  require(processor.load.fixed.count() >= 0, "work_us must not be negative");
  require(latency_window > 0, "latency_window must be positive");
  require(throughput_window_s > 0 && throughput_window_s < ThroughputWindow::kMaxWindowS,
          "throughput_window_s must be in 1..59");
  require(publish_interval.count() > 0, "publish_interval must be positive");
  require(summary_interval.count() > 0, "summary_interval must be positive");
  require(!live_view || view_port != 0, "view_port must be non-zero");
  require(strategy.history > 0, "strategy history must be positive");
  require(strategy.decision_log > 0, "decision log size must be positive");
  require(strategy.max_cars > 0 && strategy.max_cars <= Strategy::kMaxCarsLimit,
          "max_cars must be in 1..4096");
  require(retry.attempts >= 1, "retry attempts must be at least 1");
  require(retry.initial.count() >= 0 && retry.max >= retry.initial,
          "retry backoff must satisfy 0 <= initial <= max");
  require(!require_checksum || verify_checksum,
          "require_checksum needs verify_checksum");
}

std::ostream& operator<<(std::ostream& os, const PipelineConfig& c) {
  const auto& p = c.priorities;
  os << "listen udp://" << c.host << ":" << c.port
     << " | car " << (c.target_car == 0 ? std::string("all") : std::to_string(c.target_car))
     << " | capacity " << c.capacity
     << " | budget " << c.processor.budget.count() << "ms"
     << " | idle " << c.idle_timeout.count() << "ms"
     << " | latency from " << (c.processor.reference == LatencyReference::Source ? "source" : "arrival")
     << " | checksum " << (c.require_checksum ? "required" : (c.verify_checksum ? "verified" : "ignored"))
     << " | priorities routine=" << priority_name(p.routine)
     << " hard_braking=" << priority_name(p.hard_braking)
     << " drs=" << priority_name(p.drs)
     << " engine_alarm=" << priority_name(p.engine_alarm)
     << " tyre_alarm=" << priority_name(p.tyre_alarm);
  if (c.processor.load.simulate) os << " | simulated load";
  if (c.processor.load.fixed.count() > 0) os << " | work " << c.processor.load.fixed.count() << "us";
  if (c.live_view) {
    os << " | live view " << (c.view_protocol == LiveViewProtocol::WebSocket ? "ws://" : "tcp://")
       << c.view_host << ":" << c.view_port;
  }
  return os;
}

} // namespace pitwall
