#pragma once
#include <array>
#include <atomic>
#include <cstdint>

namespace pitwall {

// Single-producer single-consumer latest-only buffer.
//
// Triple buffering: the writer fills its back slot and swaps it with the
// shared middle slot; the reader swaps the middle slot into its front slot
// when the dirty bit is set. Neither side blocks or waits on the other, and
// a slot is never read while it is being written. Slots are reused, so once
// their capacity has grown, copying a T with containers does not allocate.
template <class T>
class LatestBuffer {
public:
  void publish(const T& v) {
    Slot& s = slots_[back_];
    s.value = v;
    s.seq = ++published_;
    back_ = middle_.exchange(static_cast<std::uint8_t>(back_ | kDirty), std::memory_order_acq_rel) & kIndex;
  }

  // Try to consume if the sequence advanced past cursor.
  bool try_consume_latest(std::uint64_t& cursor, T& out) const {
    if (middle_.load(std::memory_order_relaxed) & kDirty) {
      front_ = middle_.exchange(front_, std::memory_order_acq_rel) & kIndex;
    }
    const Slot& s = slots_[front_];
    if (s.seq == cursor) return false;
    out = s.value;
    cursor = s.seq;
    return true;
  }

  // Writer side only.
  std::uint64_t published() const { return published_; }

private:
  static constexpr std::uint8_t kIndex = 0x3;
  static constexpr std::uint8_t kDirty = 0x4;

  struct Slot {
    T value{};
    std::uint64_t seq = 0;
  };

  mutable std::array<Slot, 3> slots_{};
  mutable std::uint8_t front_ = 0;              // reader-owned
  std::uint8_t back_ = 2;                       // writer-owned
  mutable std::atomic<std::uint8_t> middle_{1}; // shared
  std::uint64_t published_ = 0;
};

} // namespace pitwall
