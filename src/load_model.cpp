#include <pitwall/load_model.hpp>

namespace pitwall {

std::chrono::microseconds LoadModel::next_delay(const Sample& s) {
  std::int64_t us = cfg_.fixed.count();
  if (!cfg_.simulate) return std::chrono::microseconds(us);

  std::int64_t lo = 200, hi = 800;
  if (s.priority == Priority::Critical)  { lo = 50;  hi = 200; }
  else if (s.priority == Priority::High) { lo = 100; hi = 500; }
  std::uniform_int_distribution<std::int64_t> base(lo, hi - 1);
  std::int64_t extra = base(rng_);

  if (s.ch.speed_kmh > 300) extra *= 2;

  std::bernoulli_distribution spike(0.05);
  if (spike(rng_)) extra *= 10;

  return std::chrono::microseconds(us + extra);
}

void LoadModel::run(const Sample& s) {
  if (!active()) return;
  const auto delay = next_delay(s);
  if (delay.count() > 0) {
    using clock = std::chrono::steady_clock;
    const auto until = clock::now() + delay;
    while (clock::now() < until) {
      // spin
    }
  }
  if (cfg_.work) cfg_.work(s);
}

} // namespace pitwall
