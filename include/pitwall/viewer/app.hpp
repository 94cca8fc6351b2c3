#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <pitwall/snapshot.hpp>

namespace pitwall {

class Pipeline;

// RAII application that renders the latest pipeline snapshot.
class ViewerApp {
public:
  explicit ViewerApp(Pipeline& pipeline);
  int run(); // returns 0 on normal exit

private:
  // Input & data flow
  void process_input_();
  void pump_snapshots_();
  // Rendering
  void render_frame_();
  void draw_hud_();
  void draw_metrics_(int x, int y);
  void draw_latency_plot_(int x, int y, int w, int h);
  void draw_car_(int x, int y);
  void draw_outcomes_(int x, int y);
  void draw_decisions_(int x, int y);

  // Dependencies
  Pipeline& pipeline_;
  PipelineSnapshot snap_{};
  std::uint64_t cursor_{0};
  bool have_snap_{false};

  // p50/p99 history, one point per consumed snapshot
  static constexpr std::size_t kHistory = 240;
  std::array<float, kHistory> p50_{};
  std::array<float, kHistory> p99_{};
  std::size_t hist_head_{0};
  std::size_t hist_count_{0};

  // UI state
  bool frozen_{false};
  float plot_max_ms_{0.0f};  // 0 = auto scale
};

} // namespace pitwall
