#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>
#include <pitwall/outcome.hpp>
#include <pitwall/sample.hpp>

namespace pitwall {

enum class Advisory : std::uint8_t {
  HeavyBraking,      // sustained high brake with a real speed drop
  EngineOverheat,
  LowOilPressure,
  PitWindow,         // tyres past their working window
  DrsOpen,
  TelemetryLagging,  // most recent outcomes for the car missed the deadline
};

inline constexpr std::size_t kAdvisoryCount = 6;

const char* advisory_name(Advisory a);

struct StrategyConfig {
  std::size_t history = 64;          // readings kept per car
  std::size_t max_cars = 64;         // cars tracked; later ones are ignored
  std::size_t decision_log = 256;    // decisions retained

  float heavy_brake = 0.8f;
  std::size_t heavy_brake_samples = 5;
  double heavy_brake_speed_drop_kmh = 30.0;

  std::int16_t overheat_water_c = 130;
  float low_oil_bar = 2.0f;
  std::uint16_t low_oil_min_rpm = 4000;

  double pit_window_tyre_c = 110.0;
  std::size_t pit_window_min_readings = 32;

  std::size_t lagging_min_readings = 16;
};

// Values computed from a reading and the car's previous one.
struct Derived {
  double dt_s = 0.0;          // 0 for the first reading of a car
  double decel_mps2 = 0.0;    // positive when slowing down
  double tyre_mean_c = 0.0;
  bool reordered = false;     // older than the car's newest reading
};

// Appended, never revised.
struct Decision {
  std::uint64_t id = 0;            // 1-based, strictly increasing
  CarId car = 0;
  std::uint32_t seq = 0;
  std::uint64_t source_ts_ms = 0;
  Advisory advisory = Advisory::HeavyBraking;
  double value = 0.0;              // triggering measurement (km/h, °C, bar, ...)
};

// Per-car bounded history plus the append-only decision log.
// Car state comes from a pool sized at construction: the first max_cars
// cars seen are tracked, readings from any other car are counted and
// otherwise ignored. Nothing allocates after construction.
// Single writer: the processor thread.
class Strategy {
public:
  static constexpr std::size_t kMaxCarsLimit = 4096;

  explicit Strategy(StrategyConfig cfg = {});

  // Throws ProcessingError when the reading cannot be related to the car's
  // previous one (same source timestamp, non-finite result). A reading older
  // than the newest one comes back flagged as reordered.
  Derived derive(const Sample& s) const;

  // Appends the reading to the car's window and evaluates the advisories.
  // Reordered readings are ignored. Returns the number of decisions appended.
  std::size_t update(const Sample& s, const Derived& d, const OutcomeRecord& o);

  // Up to n most recent decisions, oldest first.
  void recent(std::size_t n, std::vector<Decision>& out) const;
  std::uint64_t total_decisions() const { return next_id_ - 1; }
  std::size_t cars() const { return used_; }
  // Readings dropped because the car pool was full.
  std::uint64_t untracked() const { return untracked_; }

  void reset();

private:
  struct Reading {
    std::uint64_t ts_ms = 0;
    float speed_kmh = 0.0f;
    double tyre_mean_c = 0.0;
    bool late = false;
  };

  struct CarState {
    std::vector<Reading> ring;
    std::size_t head = 0;
    std::size_t count = 0;
    double tyre_sum = 0.0;
    std::size_t late_count = 0;

    std::size_t brake_run = 0;
    float brake_run_start_speed = 0.0f;

    std::array<bool, kAdvisoryCount> active{};
    const Reading* last() const;
    void clear();
  };

  static constexpr std::uint16_t kNoSlot = 0xFFFF;

  const CarState* find_(CarId car) const;
  CarState* claim_(CarId car);

  void push_(CarState& st, const Reading& r);
  void evaluate_(CarState& st, const Sample& s, std::size_t& appended);
  void edge_(CarState& st, Advisory a, bool cond, double value, const Sample& s, std::size_t& appended);
  void append_(const Sample& s, Advisory a, double value);

  StrategyConfig cfg_;
  std::vector<CarState> pool_;
  std::vector<std::uint16_t> slot_of_;   // CarId -> pool index
  std::size_t used_ = 0;
  std::uint64_t untracked_ = 0;
  std::vector<Decision> log_;
  std::size_t log_head_ = 0;
  std::size_t log_count_ = 0;
  std::uint64_t next_id_ = 1;
};

} // namespace pitwall
