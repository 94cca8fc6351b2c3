#pragma once
#include <array>
#include <cstddef>
#include <cstdint>

namespace pitwall {

using CarId = std::uint16_t;

// Ordered: a higher value preempts a lower one for buffer slots.
enum class Priority : std::uint8_t {
  Low = 0,
  Medium = 1,
  High = 2,
  Critical = 3,
};

inline constexpr std::size_t kPriorityCount = 4;

inline constexpr std::size_t priority_index(Priority p) {
  return static_cast<std::size_t>(p);
}

inline constexpr bool is_valid_priority(std::uint8_t raw) {
  return raw < kPriorityCount;
}

inline const char* priority_name(Priority p) {
  switch (p) {
    case Priority::Low:      return "low";
    case Priority::Medium:   return "medium";
    case Priority::High:     return "high";
    case Priority::Critical: return "critical";
  }
  return "unknown";
}

// Typed channel values of one reading. Tyre arrays are [FL, FR, RL, RR].
struct Channels {
  std::uint16_t speed_kmh = 0;
  float throttle = 0.0f;          // 0..1
  float brake = 0.0f;             // 0..1
  float steering = 0.0f;          // -1..1
  std::int8_t gear = 0;           // -1 reverse, 0 neutral
  std::uint16_t rpm = 0;
  bool drs = false;
  float oil_pressure_bar = 0.0f;
  std::int16_t oil_temp_c = 0;
  std::int16_t water_temp_c = 0;
  std::array<float, 4> tyre_pressure_psi{};
  std::array<std::int16_t, 4> tyre_temp_c{};
  float ers_store_j = 0.0f;
  float mguk_power_w = 0.0f;
  float fuel_flow_kg_h = 0.0f;
  std::array<float, 3> position_m{};  // x, y, z
};

// One telemetry reading for one car at one instant.
struct Sample {
  CarId car = 0;
  std::uint32_t seq = 0;
  std::uint64_t source_ts_ms = 0;  // capture time, not arrival time
  Priority priority = Priority::Low;
  Channels ch{};
};

} // namespace pitwall
