#include <pitwall/classify.hpp>
#include <algorithm>
#include <cctype>

namespace pitwall {

static std::string_view trim(std::string_view s) {
  auto is_space = [](char c){ return std::isspace(static_cast<unsigned char>(c)) != 0; };
  while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
  while (!s.empty() && is_space(s.back()))  s.remove_suffix(1);
  return s;
}

Priority PriorityMap::priority_of(EventType e) const {
  switch (e) {
    case EventType::Routine:     return routine;
    case EventType::HardBraking: return hard_braking;
    case EventType::Drs:         return drs;
    case EventType::EngineAlarm: return engine_alarm;
    case EventType::TyreAlarm:   return tyre_alarm;
  }
  return routine;
}

Priority classify(const Channels& ch, Priority wire, const PriorityMap& map) {
  Priority p = std::max(wire, map.routine);
  auto raise = [&](EventType e){ p = std::max(p, map.priority_of(e)); };

  if (ch.brake > map.hard_braking_brake) raise(EventType::HardBraking);
  if (ch.drs) raise(EventType::Drs);
  if (ch.water_temp_c > map.water_temp_alarm_c || ch.oil_pressure_bar < map.oil_pressure_alarm_bar) {
    raise(EventType::EngineAlarm);
  }
  for (auto t : ch.tyre_temp_c) {
    if (t > map.tyre_temp_alarm_c) { raise(EventType::TyreAlarm); break; }
  }
  return p;
}

bool parse_priority(std::string_view s, Priority& out) {
  s = trim(s);
  if (s == "low")      { out = Priority::Low;      return true; }
  if (s == "medium")   { out = Priority::Medium;   return true; }
  if (s == "high")     { out = Priority::High;     return true; }
  if (s == "critical") { out = Priority::Critical; return true; }
  return false;
}

bool parse_event_type(std::string_view s, EventType& out) {
  s = trim(s);
  if (s == "routine")      { out = EventType::Routine;     return true; }
  if (s == "hard_braking") { out = EventType::HardBraking; return true; }
  if (s == "drs")          { out = EventType::Drs;         return true; }
  if (s == "engine_alarm") { out = EventType::EngineAlarm; return true; }
  if (s == "tyre_alarm")   { out = EventType::TyreAlarm;   return true; }
  return false;
}

const char* event_type_name(EventType e) {
  switch (e) {
    case EventType::Routine:     return "routine";
    case EventType::HardBraking: return "hard_braking";
    case EventType::Drs:         return "drs";
    case EventType::EngineAlarm: return "engine_alarm";
    case EventType::TyreAlarm:   return "tyre_alarm";
  }
  return "unknown";
}

bool apply_priority_rule(PriorityMap& map, std::string_view rule) {
  const auto eq = rule.find('=');
  if (eq == std::string_view::npos) return false;
  EventType e{};
  Priority p{};
  if (!parse_event_type(rule.substr(0, eq), e)) return false;
  if (!parse_priority(rule.substr(eq + 1), p)) return false;

  switch (e) {
    case EventType::Routine:     map.routine = p;      break;
    case EventType::HardBraking: map.hard_braking = p; break;
    case EventType::Drs:         map.drs = p;          break;
    case EventType::EngineAlarm: map.engine_alarm = p; break;
    case EventType::TyreAlarm:   map.tyre_alarm = p;   break;
  }
  return true;
}

} // namespace pitwall
