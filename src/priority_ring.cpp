#include <pitwall/priority_ring.hpp>
#include <limits>
#include <stdexcept>

namespace pitwall {

PriorityRing::PriorityRing(std::size_t capacity)
  : capacity_(capacity) {
  if (capacity_ == 0) {
    throw std::invalid_argument("PriorityRing capacity must be at least 1");
  }
  if (capacity_ > std::numeric_limits<std::uint32_t>::max()) {
    throw std::invalid_argument("PriorityRing capacity exceeds slot index range");
  }
  slots_.resize(capacity_);
  order_.resize(capacity_ * kPriorityCount);
  free_.reserve(capacity_);
  // Hand out low indices first.
  for (std::size_t i = capacity_; i > 0; --i) {
    free_.push_back(static_cast<std::uint32_t>(i - 1));
  }
}

void PriorityRing::push_back_(std::size_t cls, std::uint32_t slot) {
  auto& q = queues_[cls];
  order_[cls * capacity_ + (q.head + q.count) % capacity_] = slot;
  ++q.count;
}

std::uint32_t PriorityRing::pop_front_(std::size_t cls) {
  auto& q = queues_[cls];
  const std::uint32_t slot = order_[cls * capacity_ + q.head];
  q.head = (q.head + 1) % capacity_;
  --q.count;
  return slot;
}

bool PriorityRing::lowest_buffered_(std::size_t& cls) const {
  for (std::size_t c = 0; c < kPriorityCount; ++c) {
    if (queues_[c].count > 0) { cls = c; return true; }
  }
  return false;
}

bool PriorityRing::highest_buffered_(std::size_t& cls) const {
  for (std::size_t c = kPriorityCount; c > 0; --c) {
    if (queues_[c - 1].count > 0) { cls = c - 1; return true; }
  }
  return false;
}

PriorityRing::AdmitResult PriorityRing::admit(const Sample& s, Clock::time_point arrival) {
  AdmitResult res{};
  const std::size_t cls = priority_index(s.priority);
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (size_ == capacity_) {
      std::size_t lowest = 0;
      if (!lowest_buffered_(lowest) || cls <= lowest) {
        ++stats_.rejected;
        res.status = AdmitStatus::Rejected;
        return res;
      }
      const std::uint32_t victim = pop_front_(lowest);
      res.evicted = slots_[victim];
      res.status = AdmitStatus::AdmittedWithEviction;
      free_.push_back(victim);
      --size_;
      ++stats_.evicted;
    }

    const std::uint32_t slot = free_.back();
    free_.pop_back();
    Entry& e = slots_[slot];
    e.sample = s;
    e.arrival = arrival;
    e.order = next_order_++;
    push_back_(cls, slot);
    ++size_;
    ++stats_.admitted;
    if (size_ > stats_.high_water) stats_.high_water = size_;
  }
  cv_.notify_one();
  return res;
}

std::optional<PriorityRing::Entry> PriorityRing::take_next() {
  std::lock_guard<std::mutex> lock(mu_);
  std::size_t cls = 0;
  if (!highest_buffered_(cls)) return std::nullopt;
  const std::uint32_t slot = pop_front_(cls);
  free_.push_back(slot);
  --size_;
  ++stats_.taken;
  return slots_[slot];
}

bool PriorityRing::wait_for_data(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mu_);
  cv_.wait_for(lock, timeout, [this]{ return size_ > 0 || closed_; });
  return size_ > 0;
}

void PriorityRing::close() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool PriorityRing::closed() const {
  std::lock_guard<std::mutex> lock(mu_);
  return closed_;
}

std::size_t PriorityRing::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return size_;
}

std::size_t PriorityRing::size_of(Priority p) const {
  std::lock_guard<std::mutex> lock(mu_);
  return queues_[priority_index(p)].count;
}

bool PriorityRing::is_full() const {
  std::lock_guard<std::mutex> lock(mu_);
  return size_ == capacity_;
}

bool PriorityRing::empty() const {
  std::lock_guard<std::mutex> lock(mu_);
  return size_ == 0;
}

PriorityRing::Stats PriorityRing::stats() const {
  std::lock_guard<std::mutex> lock(mu_);
  return stats_;
}

const char* to_string(PriorityRing::AdmitStatus s) {
  switch (s) {
    case PriorityRing::AdmitStatus::Admitted:             return "Admitted";
    case PriorityRing::AdmitStatus::AdmittedWithEviction: return "Evicted";
    case PriorityRing::AdmitStatus::Rejected:             return "BufferFull";
  }
  return "Unknown";
}

} // namespace pitwall
