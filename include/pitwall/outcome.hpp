#pragma once
#include <chrono>
#include <cstdint>
#include <pitwall/sample.hpp>

namespace pitwall {

enum class OutcomeStatus : std::uint8_t {
  Processed,        // ran to completion (on time or late, see met_deadline)
  ProcessingError,  // per-sample computation fault, pipeline continued
  Evicted,          // admitted, then displaced by a higher class
  Rejected,         // refused at admission (buffer full)
};

inline const char* to_string(OutcomeStatus s) {
  switch (s) {
    case OutcomeStatus::Processed:       return "Processed";
    case OutcomeStatus::ProcessingError: return "ProcessingError";
    case OutcomeStatus::Evicted:         return "Evicted";
    case OutcomeStatus::Rejected:        return "Rejected";
  }
  return "Unknown";
}

// Per-sample result. Immutable once produced.
struct OutcomeRecord {
  CarId car = 0;
  std::uint32_t seq = 0;
  Priority priority = Priority::Low;
  OutcomeStatus status = OutcomeStatus::Processed;
  std::chrono::microseconds latency{0};  // arrival (or source) to dispatch
  bool met_deadline = false;

  bool dropped() const {
    return status == OutcomeStatus::Evicted || status == OutcomeStatus::Rejected;
  }
};

} // namespace pitwall
