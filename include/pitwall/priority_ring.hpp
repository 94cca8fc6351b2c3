#pragma once
#include <array>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>
#include <pitwall/sample.hpp>

namespace pitwall {

// Bounded holding area between ingestion and processing.
//
// Storage is a fixed slot array plus one FIFO of slot indices per priority
// class, all allocated in the constructor. Every operation holds the lock for
// O(kPriorityCount) work and never allocates.
//
// Dequeue order: highest class first, oldest admission within a class.
// Overload: when full, an incoming sample of a strictly higher class than the
// lowest buffered class evicts the oldest sample of that lowest class;
// otherwise (including ties) the incoming sample is rejected.
class PriorityRing {
public:
  using Clock = std::chrono::steady_clock;

  struct Entry {
    Sample sample{};
    Clock::time_point arrival{};
    std::uint64_t order = 0;       // admission order, unique per ring
  };

  enum class AdmitStatus : std::uint8_t {
    Admitted,
    AdmittedWithEviction,
    Rejected,
  };

  struct AdmitResult {
    AdmitStatus status = AdmitStatus::Admitted;
    std::optional<Entry> evicted;  // set iff AdmittedWithEviction

    // True when the caller should see backpressure (something was dropped).
    bool backpressure() const { return status != AdmitStatus::Admitted; }
  };

  struct Stats {
    std::uint64_t admitted = 0;
    std::uint64_t evicted = 0;
    std::uint64_t rejected = 0;
    std::uint64_t taken = 0;
    std::size_t high_water = 0;
  };

  explicit PriorityRing(std::size_t capacity);

  PriorityRing(const PriorityRing&) = delete;
  PriorityRing& operator=(const PriorityRing&) = delete;

  AdmitResult admit(const Sample& s, Clock::time_point arrival);
  std::optional<Entry> take_next();

  // Blocks the single consumer until a sample is buffered, the ring is
  // closed, or the timeout elapses. Returns true if a sample is available.
  bool wait_for_data(std::chrono::milliseconds timeout);

  // Wakes the consumer; buffered samples stay takeable.
  void close();
  bool closed() const;

  std::size_t size() const;
  std::size_t size_of(Priority p) const;
  std::size_t capacity() const { return capacity_; }
  bool is_full() const;
  bool empty() const;
  Stats stats() const;

private:
  struct ClassQueue {
    std::size_t head = 0;
    std::size_t count = 0;
  };

  void push_back_(std::size_t cls, std::uint32_t slot);
  std::uint32_t pop_front_(std::size_t cls);
  bool lowest_buffered_(std::size_t& cls) const;
  bool highest_buffered_(std::size_t& cls) const;

  const std::size_t capacity_;
  std::vector<Entry> slots_;
  std::vector<std::uint32_t> free_;   // stack of free slot indices
  std::vector<std::uint32_t> order_;  // kPriorityCount rings of capacity_ slot indices
  std::array<ClassQueue, kPriorityCount> queues_{};
  std::size_t size_ = 0;
  std::uint64_t next_order_ = 0;
  bool closed_ = false;
  Stats stats_{};

  mutable std::mutex mu_;
  std::condition_variable cv_;
};

const char* to_string(PriorityRing::AdmitStatus s);

} // namespace pitwall
