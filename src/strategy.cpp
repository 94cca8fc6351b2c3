#include <pitwall/strategy.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <pitwall/errors.hpp>

namespace pitwall {

const char* advisory_name(Advisory a) {
  switch (a) {
    case Advisory::HeavyBraking:     return "HEAVY_BRAKING";
    case Advisory::EngineOverheat:   return "ENGINE_OVERHEAT";
    case Advisory::LowOilPressure:   return "LOW_OIL_PRESSURE";
    case Advisory::PitWindow:        return "PIT_WINDOW";
    case Advisory::DrsOpen:          return "DRS_OPEN";
    case Advisory::TelemetryLagging: return "TELEMETRY_LAGGING";
  }
  return "UNKNOWN";
}

static double tyre_mean(const Channels& ch) {
  double sum = 0.0;
  for (auto t : ch.tyre_temp_c) sum += t;
  return sum / static_cast<double>(ch.tyre_temp_c.size());
}

const Strategy::Reading* Strategy::CarState::last() const {
  if (count == 0) return nullptr;
  return &ring[(head + ring.size() - 1) % ring.size()];
}

void Strategy::CarState::clear() {
  head = 0;
  count = 0;
  tyre_sum = 0.0;
  late_count = 0;
  brake_run = 0;
  brake_run_start_speed = 0.0f;
  active = {};
}

Strategy::Strategy(StrategyConfig cfg)
  : cfg_(cfg),
    slot_of_(std::size_t{std::numeric_limits<CarId>::max()} + 1, kNoSlot) {
  if (cfg_.history == 0) cfg_.history = 1;
  if (cfg_.decision_log == 0) cfg_.decision_log = 1;
  cfg_.max_cars = std::clamp<std::size_t>(cfg_.max_cars, 1, kMaxCarsLimit);
  log_.resize(cfg_.decision_log);
  pool_.resize(cfg_.max_cars);
  for (auto& st : pool_) st.ring.resize(cfg_.history);
}

const Strategy::CarState* Strategy::find_(CarId car) const {
  const std::uint16_t slot = slot_of_[car];
  return slot == kNoSlot ? nullptr : &pool_[slot];
}

Strategy::CarState* Strategy::claim_(CarId car) {
  std::uint16_t& slot = slot_of_[car];
  if (slot == kNoSlot) {
    if (used_ == pool_.size()) return nullptr;
    slot = static_cast<std::uint16_t>(used_++);
  }
  return &pool_[slot];
}

Derived Strategy::derive(const Sample& s) const {
  Derived d{};
  d.tyre_mean_c = tyre_mean(s.ch);

  const CarState* st = find_(s.car);
  if (!st) return d;
  const Reading* prev = st->last();
  if (!prev) return d;

  if (s.source_ts_ms < prev->ts_ms) {
    // Dequeued behind a newer, higher-class reading of the same car.
    d.reordered = true;
    return d;
  }
  if (s.source_ts_ms == prev->ts_ms) {
    throw ProcessingError("car " + std::to_string(s.car) + " seq " + std::to_string(s.seq) +
                          ": zero time step at source timestamp " + std::to_string(s.source_ts_ms));
  }
  d.dt_s = static_cast<double>(s.source_ts_ms - prev->ts_ms) / 1000.0;
  d.decel_mps2 = (static_cast<double>(prev->speed_kmh) - s.ch.speed_kmh) / 3.6 / d.dt_s;
  if (!std::isfinite(d.decel_mps2)) {
    throw ProcessingError("car " + std::to_string(s.car) + ": non-finite deceleration");
  }
  return d;
}

void Strategy::push_(CarState& st, const Reading& r) {
  if (st.count == st.ring.size()) {
    const Reading& old = st.ring[st.head];
    st.tyre_sum -= old.tyre_mean_c;
    if (old.late) --st.late_count;
  } else {
    ++st.count;
  }
  st.ring[st.head] = r;
  st.head = (st.head + 1) % st.ring.size();
  st.tyre_sum += r.tyre_mean_c;
  if (r.late) ++st.late_count;
}

void Strategy::append_(const Sample& s, Advisory a, double value) {
  Decision& d = log_[log_head_];
  d.id = next_id_++;
  d.car = s.car;
  d.seq = s.seq;
  d.source_ts_ms = s.source_ts_ms;
  d.advisory = a;
  d.value = value;
  log_head_ = (log_head_ + 1) % log_.size();
  if (log_count_ < log_.size()) ++log_count_;
}

// Edge-triggered: fires when cond becomes true, re-arms when it clears.
void Strategy::edge_(CarState& st, Advisory a, bool cond, double value,
                     const Sample& s, std::size_t& appended) {
  bool& active = st.active[static_cast<std::size_t>(a)];
  if (cond && !active) {
    append_(s, a, value);
    ++appended;
  }
  active = cond;
}

void Strategy::evaluate_(CarState& st, const Sample& s, std::size_t& appended) {
  const Channels& ch = s.ch;

  // Heavy braking: run of high-brake readings with a real speed drop.
  if (ch.brake >= cfg_.heavy_brake) {
    if (st.brake_run == 0) st.brake_run_start_speed = ch.speed_kmh;
    ++st.brake_run;
  } else {
    st.brake_run = 0;
  }
  const double drop = static_cast<double>(st.brake_run_start_speed) - ch.speed_kmh;
  edge_(st, Advisory::HeavyBraking,
        st.brake_run >= cfg_.heavy_brake_samples && drop >= cfg_.heavy_brake_speed_drop_kmh,
        drop, s, appended);

  edge_(st, Advisory::EngineOverheat, ch.water_temp_c > cfg_.overheat_water_c,
        ch.water_temp_c, s, appended);

  edge_(st, Advisory::LowOilPressure,
        ch.oil_pressure_bar < cfg_.low_oil_bar && ch.rpm > cfg_.low_oil_min_rpm,
        ch.oil_pressure_bar, s, appended);

  const double window_tyre = st.count ? st.tyre_sum / static_cast<double>(st.count) : 0.0;
  edge_(st, Advisory::PitWindow,
        st.count >= cfg_.pit_window_min_readings && window_tyre > cfg_.pit_window_tyre_c,
        window_tyre, s, appended);

  edge_(st, Advisory::DrsOpen, ch.drs, ch.speed_kmh, s, appended);

  const bool lagging = st.count >= cfg_.lagging_min_readings && st.late_count * 2 > st.count;
  edge_(st, Advisory::TelemetryLagging, lagging,
        st.count ? static_cast<double>(st.late_count) / static_cast<double>(st.count) : 0.0,
        s, appended);
}

std::size_t Strategy::update(const Sample& s, const Derived& d, const OutcomeRecord& o) {
  if (d.reordered) return 0;
  CarState* slot = claim_(s.car);
  if (!slot) {
    ++untracked_;
    return 0;
  }
  CarState& st = *slot;

  Reading r{};
  r.ts_ms = s.source_ts_ms;
  r.speed_kmh = s.ch.speed_kmh;
  r.tyre_mean_c = d.tyre_mean_c;
  r.late = !o.met_deadline;
  push_(st, r);

  std::size_t appended = 0;
  evaluate_(st, s, appended);
  return appended;
}

void Strategy::recent(std::size_t n, std::vector<Decision>& out) const {
  out.clear();
  const std::size_t k = std::min(n, log_count_);
  for (std::size_t i = 0; i < k; ++i) {
    const std::size_t idx = (log_head_ + log_.size() - k + i) % log_.size();
    out.push_back(log_[idx]);
  }
}

void Strategy::reset() {
  for (auto& st : pool_) st.clear();
  std::fill(slot_of_.begin(), slot_of_.end(), kNoSlot);
  used_ = 0;
  untracked_ = 0;
  log_head_ = 0;
  log_count_ = 0;
  next_id_ = 1;
}

} // namespace pitwall
