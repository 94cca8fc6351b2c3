#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <random>
#include <pitwall/sample.hpp>

namespace pitwall {

struct LoadConfig {
  bool simulate = false;                    // randomized per-class work
  std::chrono::microseconds fixed{0};       // constant work added to every sample
  std::uint32_t seed = 20777;
  // Caller-supplied per-sample work, run after the synthetic delay.
  // May throw; the processor records the sample as a processing error.
  std::function<void(const Sample&)> work;
};

// Synthetic per-sample processing cost.
// Randomized mode: base delay by class (critical 50-200us, high 100-500us,
// others 200-800us), doubled above 300 km/h, 5% chance of a x10 spike.
// Deterministic for a given seed.
class LoadModel {
public:
  explicit LoadModel(LoadConfig cfg = {}) : cfg_(cfg), rng_(cfg.seed) {}

  std::chrono::microseconds next_delay(const Sample& s);

  // Busy-waits for next_delay(s); sleeping would add scheduler jitter.
  void run(const Sample& s);

  bool active() const { return cfg_.simulate || cfg_.fixed.count() > 0 || cfg_.work != nullptr; }

private:
  LoadConfig cfg_;
  std::mt19937 rng_;
};

} // namespace pitwall
