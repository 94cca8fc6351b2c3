#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <pitwall/sample.hpp>

namespace pitwall {

// Event types a reading can carry; each maps to a configurable class.
enum class EventType : std::uint8_t {
  Routine,
  HardBraking,
  Drs,
  EngineAlarm,
  TyreAlarm,
};

struct PriorityMap {
  Priority routine      = Priority::Low;
  Priority hard_braking = Priority::Critical;
  Priority drs          = Priority::High;
  Priority engine_alarm = Priority::Critical;
  Priority tyre_alarm   = Priority::Medium;

  // Event thresholds
  float hard_braking_brake = 0.95f;
  std::int16_t water_temp_alarm_c = 130;
  float oil_pressure_alarm_bar = 2.0f;
  std::int16_t tyre_temp_alarm_c = 120;

  Priority priority_of(EventType e) const;
};

// Final class = max(wire class, class of every event the reading triggers).
// The wire class acts as a floor so a producer can escalate but not demote.
Priority classify(const Channels& ch, Priority wire, const PriorityMap& map);

bool parse_priority(std::string_view s, Priority& out);
bool parse_event_type(std::string_view s, EventType& out);
const char* event_type_name(EventType e);

// Applies one "event=class" rule, e.g. "drs=critical". Returns false and
// leaves the map untouched if either side is unknown.
bool apply_priority_rule(PriorityMap& map, std::string_view rule);

} // namespace pitwall
