#pragma once
#include <cstdint>
#include <limits>
#include <vector>
#include <pitwall/sample.hpp>

namespace pitwall {

enum class SeqVerdict : std::uint8_t {
  Accepted,
  Duplicate,    // same sequence as the last accepted one for this car
  OutOfOrder,   // older than the last accepted one for this car
};

// Tracks the last accepted sequence number per car. Accepted sequences are
// strictly increasing per car; gaps (lost datagrams) are allowed.
// Table covers the whole CarId range so check() never allocates.
// Not thread-safe: owned by the ingestion stage.
class SequenceGuard {
public:
  SequenceGuard() : cars_(std::size_t{std::numeric_limits<CarId>::max()} + 1) {}

  SeqVerdict check(CarId car, std::uint32_t seq) {
    auto& st = cars_[car];
    if (st.seen) {
      if (seq == st.last) return SeqVerdict::Duplicate;
      if (seq < st.last)  return SeqVerdict::OutOfOrder;
    }
    st.seen = true;
    st.last = seq;
    ++accepted_;
    return SeqVerdict::Accepted;
  }

  // Last accepted sequence for car, or false if none yet.
  bool last(CarId car, std::uint32_t& out) const {
    const auto& st = cars_[car];
    if (!st.seen) return false;
    out = st.last;
    return true;
  }

  std::uint64_t accepted() const { return accepted_; }

  void reset() {
    for (auto& st : cars_) st = State{};
    accepted_ = 0;
  }

private:
  struct State {
    std::uint32_t last = 0;
    bool seen = false;
  };
  std::vector<State> cars_;
  std::uint64_t accepted_ = 0;
};

inline const char* to_string(SeqVerdict v) {
  switch (v) {
    case SeqVerdict::Accepted:   return "Accepted";
    case SeqVerdict::Duplicate:  return "Duplicate";
    case SeqVerdict::OutOfOrder: return "OutOfOrder";
  }
  return "Unknown";
}

} // namespace pitwall
