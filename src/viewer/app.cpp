#include <raylib.h>
#include <algorithm>
#include <cstdio>

#include <pitwall/viewer/app.hpp>
#include <pitwall/pipeline.hpp>

namespace pitwall {

namespace {

const Color kText    = Color{220, 225, 235, 255};
const Color kDim     = Color{150, 155, 170, 255};
const Color kPanel   = Color{24, 24, 28, 220};
const Color kGood    = Color{ 80, 220, 120, 255};
const Color kWarn    = Color{241, 196,  15, 255};
const Color kBad     = Color{231,  76,  60, 255};

static Color colorFor(Priority p) {
  switch (p) {
    case Priority::Critical: return kBad;
    case Priority::High:     return Color{230, 126, 34, 255};
    case Priority::Medium:   return Color{52, 152, 219, 255};
    case Priority::Low:      return kDim;
  }
  return kDim;
}

static Color colorFor(OutcomeStatus s, bool met) {
  switch (s) {
    case OutcomeStatus::Processed:       return met ? kGood : kWarn;
    case OutcomeStatus::ProcessingError: return kBad;
    case OutcomeStatus::Evicted:
    case OutcomeStatus::Rejected:        return Color{155, 89, 182, 255};
  }
  return kText;
}

static void panel(int x, int y, int w, int h, const char* title) {
  DrawRectangle(x - 6, y - 6, w + 12, h + 12, Color{0, 0, 0, 80});
  DrawRectangle(x, y, w, h, kPanel);
  DrawText(title, x + 8, y + 6, 16, kDim);
  DrawLine(x, y + 26, x + w, y + 26, Color{60, 60, 70, 255});
}

// Horizontal 0..1 bar with a label.
static void bar(int x, int y, int w, const char* label, float v, Color c) {
  DrawText(label, x, y, 14, kDim);
  const int bx = x + 70;
  DrawRectangle(bx, y + 2, w, 10, Color{45, 45, 52, 255});
  DrawRectangle(bx, y + 2, static_cast<int>(w * std::clamp(v, 0.0f, 1.0f)), 10, c);
}

// --- Layout ---
static constexpr int kMargin   = 20;
static constexpr int kTopY     = 84;
static constexpr int kLeftW    = 430;
static constexpr int kRightX   = kMargin + kLeftW + 30;
static constexpr int kRightW   = 520;

} // namespace

// ---- ViewerApp ----

ViewerApp::ViewerApp(Pipeline& pipeline) : pipeline_(pipeline) {}

int ViewerApp::run() {
  const int W = 1024, H = 768;
  InitWindow(W, H, "pitwall - live telemetry");
  SetTargetFPS(60);

  while (!WindowShouldClose()) {
    process_input_();
    pump_snapshots_();
    render_frame_();
  }

  CloseWindow();
  return 0;
}

void ViewerApp::process_input_() {
  if (IsKeyPressed(KEY_SPACE)) frozen_ = !frozen_;
  if (IsKeyPressed(KEY_C)) { hist_head_ = 0; hist_count_ = 0; }
  // Plot scale: auto, then fixed multiples of the budget
  if (IsKeyPressed(KEY_S)) {
    const float budget = static_cast<float>(pipeline_.config().processor.budget.count());
    if (plot_max_ms_ == 0.0f)             plot_max_ms_ = budget;
    else if (plot_max_ms_ < budget * 4.f) plot_max_ms_ *= 2.0f;
    else                                  plot_max_ms_ = 0.0f;
  }
  if (IsKeyPressed(KEY_Q)) pipeline_.request_stop();
}

void ViewerApp::pump_snapshots_() {
  if (frozen_) return;
  auto& buf = pipeline_.view();
  if (!buf.try_consume_latest(cursor_, snap_)) return;
  have_snap_ = true;

  p50_[hist_head_] = static_cast<float>(snap_.metrics.latency.p50_ms);
  p99_[hist_head_] = static_cast<float>(snap_.metrics.latency.p99_ms);
  hist_head_ = (hist_head_ + 1) % kHistory;
  if (hist_count_ < kHistory) ++hist_count_;
}

void ViewerApp::render_frame_() {
  BeginDrawing();
  ClearBackground(Color{16, 18, 22, 255});

  draw_hud_();
  if (have_snap_) {
    draw_metrics_(kMargin, kTopY);
    draw_car_(kMargin, kTopY + 250);
    draw_latency_plot_(kRightX, kTopY, kRightW, 230);
    draw_outcomes_(kRightX, kTopY + 262);
    draw_decisions_(kRightX, kTopY + 480);
  } else {
    DrawText("waiting for data...", kMargin, kTopY, 20, kDim);
  }
  EndDrawing();
}

void ViewerApp::draw_hud_() {
  const auto& m = snap_.metrics;
  const auto& cfg = pipeline_.config();
  DrawText(TextFormat("udp %s:%u  budget=%lldms  buffer=%zu/%zu  uptime=%.1fs%s",
                      cfg.host.c_str(), static_cast<unsigned>(cfg.port),
                      static_cast<long long>(cfg.processor.budget.count()),
                      snap_.buffer_size, snap_.buffer_capacity,
                      m.uptime_s,
                      frozen_ ? "  [FROZEN]" : ""),
           kMargin, 20, 20, kText);

  const bool ok = pipeline_.running();
  DrawText(ok ? "running" : "stopped", kMargin, 46, 18, ok ? kGood : kWarn);
  DrawText("Space: Freeze | C: Clear plot | S: Plot scale | Q: Stop pipeline",
           kMargin + 110, 48, 14, kDim);
}

void ViewerApp::draw_metrics_(int x, int y) {
  const auto& m = snap_.metrics;
  const double budget = static_cast<double>(snap_.budget.count());
  panel(x, y, kLeftW, 220, "Pipeline");

  int ly = y + 36;
  const int lh = 20;
  DrawText(TextFormat("throughput   %8.0f samples/s", m.throughput_sps), x + 10, ly, 16, kText); ly += lh;
  DrawText(TextFormat("bandwidth    %8.1f KB/s", m.bytes_per_sec / 1024.0), x + 10, ly, 16, kText); ly += lh;
  DrawText(TextFormat("latency p50  %8.3f ms", m.latency.p50_ms), x + 10, ly, 16, kText); ly += lh;
  DrawText(TextFormat("latency p99  %8.3f ms", m.latency.p99_ms), x + 10, ly, 16,
           m.latency.p99_ms < budget ? kGood : kBad); ly += lh;
  DrawText(TextFormat("drop rate    %8.3f %%", m.drop_rate_pct), x + 10, ly, 16,
           m.drop_rate_pct < Pipeline::kMaxDropRatePct ? kGood : kBad); ly += lh;
  DrawText(TextFormat("received %llu  processed %llu  late %llu",
                      static_cast<unsigned long long>(m.received),
                      static_cast<unsigned long long>(m.processed),
                      static_cast<unsigned long long>(m.late)),
           x + 10, ly, 14, kDim); ly += lh;
  DrawText(TextFormat("decode %llu  stale %llu  evicted %llu  rejected %llu",
                      static_cast<unsigned long long>(m.decode_failures()),
                      static_cast<unsigned long long>(m.stale()),
                      static_cast<unsigned long long>(m.evicted),
                      static_cast<unsigned long long>(m.rejected)),
           x + 10, ly, 14, kDim); ly += lh;
  DrawText(TextFormat("errors %llu  advisories %llu  high water %zu",
                      static_cast<unsigned long long>(m.processing_errors),
                      static_cast<unsigned long long>(snap_.total_decisions),
                      snap_.buffer_high_water),
           x + 10, ly, 14, kDim);
}

void ViewerApp::draw_latency_plot_(int x, int y, int w, int h) {
  panel(x, y, w, h, "Latency p50 / p99 (ms)");
  const int px = x + 40, py = y + 34, pw = w - 52, ph = h - 46;
  const float budget = static_cast<float>(snap_.budget.count());

  float top = plot_max_ms_;
  if (top == 0.0f) {
    top = budget;
    for (std::size_t i = 0; i < hist_count_; ++i) top = std::max(top, p99_[i]);
    top *= 1.1f;
  }
  if (top <= 0.0f) top = 1.0f;

  DrawText(TextFormat("%.1f", top), x + 4, py - 4, 12, kDim);
  DrawText("0", x + 4, py + ph - 10, 12, kDim);
  DrawRectangleLines(px, py, pw, ph, Color{60, 60, 70, 255});

  auto to_y = [&](float v) { return py + ph - static_cast<int>(ph * std::min(v, top) / top); };
  const int by = to_y(budget);
  DrawLine(px, by, px + pw, by, Color{231, 76, 60, 140});

  if (hist_count_ < 2) return;
  const std::size_t first = (hist_head_ + kHistory - hist_count_) % kHistory;
  const float step = static_cast<float>(pw) / static_cast<float>(kHistory - 1);
  for (std::size_t i = 1; i < hist_count_; ++i) {
    const std::size_t a = (first + i - 1) % kHistory;
    const std::size_t b = (first + i) % kHistory;
    const float xa = px + step * static_cast<float>(i - 1);
    const float xb = px + step * static_cast<float>(i);
    DrawLineEx({xa, static_cast<float>(to_y(p50_[a]))}, {xb, static_cast<float>(to_y(p50_[b]))}, 2.0f, kGood);
    DrawLineEx({xa, static_cast<float>(to_y(p99_[a]))}, {xb, static_cast<float>(to_y(p99_[b]))}, 2.0f, kWarn);
  }
}

void ViewerApp::draw_car_(int x, int y) {
  panel(x, y, kLeftW, 400, "Latest reading");
  if (!snap_.has_latest) {
    DrawText("none yet", x + 10, y + 36, 16, kDim);
    return;
  }
  const Sample& s = snap_.latest;
  const Channels& c = s.ch;

  int ly = y + 36;
  DrawText(TextFormat("car %u  seq %u", static_cast<unsigned>(s.car), s.seq), x + 10, ly, 18, kText);
  DrawText(priority_name(s.priority), x + 260, ly, 18, colorFor(s.priority));
  ly += 28;

  DrawText(TextFormat("%3u km/h", static_cast<unsigned>(c.speed_kmh)), x + 10, ly, 30, kText);
  DrawText(TextFormat("gear %d", static_cast<int>(c.gear)), x + 190, ly + 6, 20, kText);
  DrawText(TextFormat("%5u rpm", static_cast<unsigned>(c.rpm)), x + 290, ly + 6, 20, kText);
  ly += 42;

  bar(x + 10, ly, 300, "throttle", c.throttle, kGood); ly += 20;
  bar(x + 10, ly, 300, "brake", c.brake, kBad); ly += 20;
  bar(x + 10, ly, 300, "steer", (c.steering + 1.0f) * 0.5f, Color{52, 152, 219, 255}); ly += 26;

  DrawText(c.drs ? "DRS OPEN" : "DRS closed", x + 10, ly, 16, c.drs ? kGood : kDim);
  ly += 24;

  DrawText(TextFormat("water %d C", static_cast<int>(c.water_temp_c)), x + 10, ly, 16,
           c.water_temp_c > 130 ? kBad : kText);
  DrawText(TextFormat("oil %d C  %.1f bar", static_cast<int>(c.oil_temp_c), c.oil_pressure_bar), x + 160, ly, 16,
           c.oil_pressure_bar < 2.0f ? kBad : kText);
  ly += 24;
  DrawText(TextFormat("fuel %.1f kg/h   ERS %.0f kJ", c.fuel_flow_kg_h, c.ers_store_j / 1000.0f),
           x + 10, ly, 16, kText);
  ly += 30;

  // Tyres laid out as on the car: FL FR / RL RR
  static const char* kTyre[4] = {"FL", "FR", "RL", "RR"};
  for (int i = 0; i < 4; ++i) {
    const int tx = x + 10 + (i % 2) * 200;
    const int ty = ly + (i / 2) * 44;
    const int t = c.tyre_temp_c[static_cast<std::size_t>(i)];
    const Color tc = t > 110 ? kBad : (t < 70 ? Color{52, 152, 219, 255} : kGood);
    DrawRectangle(tx, ty, 180, 38, Color{35, 35, 42, 255});
    DrawText(TextFormat("%s %d C", kTyre[i], t), tx + 8, ty + 4, 16, tc);
    DrawText(TextFormat("%.1f psi", c.tyre_pressure_psi[static_cast<std::size_t>(i)]), tx + 8, ty + 21, 14, kDim);
  }
}

void ViewerApp::draw_outcomes_(int x, int y) {
  panel(x, y, kRightW, 190, "Recent outcomes");
  int ly = y + 34;
  const auto& v = snap_.recent_outcomes;
  const std::size_t n = std::min<std::size_t>(v.size(), 8);
  for (std::size_t i = 0; i < n; ++i) {
    const auto& o = v[v.size() - 1 - i];   // newest first
    DrawText(TextFormat("car %3u seq %8u", static_cast<unsigned>(o.car), o.seq), x + 10, ly, 14, kText);
    DrawText(priority_name(o.priority), x + 180, ly, 14, colorFor(o.priority));
    DrawText(to_string(o.status), x + 260, ly, 14, colorFor(o.status, o.met_deadline));
    if (!o.dropped()) {
      DrawText(TextFormat("%.3f ms", static_cast<double>(o.latency.count()) / 1000.0), x + 400, ly, 14, kDim);
    }
    ly += 19;
  }
}

void ViewerApp::draw_decisions_(int x, int y) {
  panel(x, y, kRightW, 190, "Strategy advisories");
  int ly = y + 34;
  const auto& v = snap_.recent_decisions;
  if (v.empty()) {
    DrawText("none", x + 10, ly, 14, kDim);
    return;
  }
  const std::size_t n = std::min<std::size_t>(v.size(), 8);
  for (std::size_t i = 0; i < n; ++i) {
    const auto& d = v[v.size() - 1 - i];
    DrawText(TextFormat("#%llu  car %3u  %-16s %.1f",
                        static_cast<unsigned long long>(d.id),
                        static_cast<unsigned>(d.car),
                        advisory_name(d.advisory),
                        d.value),
             x + 10, ly, 14, d.advisory == Advisory::DrsOpen ? kGood : kWarn);
    ly += 19;
  }
}

} // namespace pitwall
