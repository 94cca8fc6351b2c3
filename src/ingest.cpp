#include <pitwall/ingest.hpp>
#include <pitwall/snapshot.hpp>

namespace pitwall {

namespace {
OutcomeRecord dropped_outcome(const Sample& s, OutcomeStatus st,
                              PriorityRing::Clock::time_point arrival,
                              PriorityRing::Clock::time_point now) {
  OutcomeRecord o{};
  o.car = s.car;
  o.seq = s.seq;
  o.priority = s.priority;
  o.status = st;
  o.latency = std::chrono::duration_cast<std::chrono::microseconds>(now - arrival);
  o.met_deadline = false;
  return o;
}
} // namespace

const char* to_string(IngestVerdict v) {
  switch (v) {
    case IngestVerdict::Admitted:             return "Admitted";
    case IngestVerdict::AdmittedWithEviction: return "AdmittedWithEviction";
    case IngestVerdict::Rejected:             return "Rejected";
    case IngestVerdict::DecodeFailed:         return "DecodeFailed";
    case IngestVerdict::Filtered:             return "Filtered";
    case IngestVerdict::Duplicate:            return "Duplicate";
    case IngestVerdict::OutOfOrder:           return "OutOfOrder";
  }
  return "Unknown";
}

IngestStage::IngestStage(PriorityRing& ring, Metrics& metrics, IngestConfig cfg)
  : ring_(ring), metrics_(metrics), cfg_(cfg) {}

IngestVerdict IngestStage::on_datagram(std::span<const std::uint8_t> bytes,
                                       Clock::time_point arrival) {
  metrics_.on_received(bytes.size());

  wire::DecodeOptions opt{};
  opt.verify_checksum = cfg_.verify_checksum;
  opt.require_checksum = cfg_.require_checksum;
  opt.max_future_ms = cfg_.max_future_ms;
  if (cfg_.check_horizon) opt.now_ms = wall_clock_ms();

  const auto res = wire::decode(bytes, opt);
  if (!res) {
    metrics_.on_decode_failure(res.error);
    return IngestVerdict::DecodeFailed;
  }

  const wire::SampleView& v = res.view;
  if (cfg_.target_car != 0 && v.car() != cfg_.target_car) {
    metrics_.on_filtered();
    return IngestVerdict::Filtered;
  }

  Sample s = v.to_sample();
  s.priority = classify(s.ch, v.wire_priority(), cfg_.priorities);

  switch (seq_.check(s.car, s.seq)) {
    case SeqVerdict::Accepted:
      break;
    case SeqVerdict::Duplicate:
      metrics_.on_duplicate();
      return IngestVerdict::Duplicate;
    case SeqVerdict::OutOfOrder:
      metrics_.on_out_of_order();
      return IngestVerdict::OutOfOrder;
  }

  const auto r = ring_.admit(s, arrival);
  switch (r.status) {
    case PriorityRing::AdmitStatus::Admitted:
      metrics_.on_admitted();
      return IngestVerdict::Admitted;

    case PriorityRing::AdmitStatus::AdmittedWithEviction: {
      metrics_.on_admitted();
      const auto& ev = *r.evicted;
      metrics_.on_dropped(dropped_outcome(ev.sample, OutcomeStatus::Evicted, ev.arrival, Clock::now()));
      return IngestVerdict::AdmittedWithEviction;
    }

    case PriorityRing::AdmitStatus::Rejected:
      metrics_.on_dropped(dropped_outcome(s, OutcomeStatus::Rejected, arrival, Clock::now()));
      return IngestVerdict::Rejected;
  }
  return IngestVerdict::Rejected;
}

} // namespace pitwall
