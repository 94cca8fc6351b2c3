#pragma once
#include <cstdint>
#include <span>
#include <pitwall/classify.hpp>
#include <pitwall/metrics.hpp>
#include <pitwall/priority_ring.hpp>
#include <pitwall/sequence_guard.hpp>
#include <pitwall/wire.hpp>

namespace pitwall {

struct IngestConfig {
  CarId target_car = 0;        // 0 = all cars
  bool verify_checksum = true;
  bool require_checksum = false;
  bool check_horizon = false;  // reject source timestamps too far in the future
  std::uint64_t max_future_ms = 60'000;
  PriorityMap priorities{};
};

// What happened to one datagram. Exactly one per call.
enum class IngestVerdict : std::uint8_t {
  Admitted,
  AdmittedWithEviction,
  Rejected,
  DecodeFailed,
  Filtered,
  Duplicate,
  OutOfOrder,
};

const char* to_string(IngestVerdict v);

// Ingestion thread body for one datagram: decode -> filter -> classify ->
// sequence guard -> admit. The decoded view borrows the datagram buffer only
// for the duration of the call; the ring receives a copy of the sample.
// Outcomes are recorded as counters only; nothing here logs or waits on I/O.
class IngestStage {
public:
  using Clock = PriorityRing::Clock;

  IngestStage(PriorityRing& ring, Metrics& metrics, IngestConfig cfg = {});

  IngestVerdict on_datagram(std::span<const std::uint8_t> bytes, Clock::time_point arrival);

  const IngestConfig& config() const { return cfg_; }

private:
  PriorityRing& ring_;
  Metrics& metrics_;
  IngestConfig cfg_;
  SequenceGuard seq_;
};

} // namespace pitwall
