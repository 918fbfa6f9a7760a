#pragma once

#include <cstddef>
#include <vector>

#include "driftgrid/core/color_resolver.h"
#include "driftgrid/core/grid_layout.h"
#include "driftgrid/core/palette.h"
#include "driftgrid/core/params.h"
#include "driftgrid/core/signal_compositor.h"

namespace driftgrid {

// One rectangle for the host to composite.
struct CellDraw {
  int x_px{0};
  int y_px{0};
  int size_px{0};
  Rgb color;
  double alpha{0.0};
};

struct FrameStats {
  int rows_drawn{0};
  int rows_masked{0};
  int cells_drawn{0};
  // Mean stored activation over the cells drawn this frame.
  double mean_activation{0.0};
};

// The animation engine: grid layout, palette cache, noise compositor and the
// per-frame pipeline
//   noise -> compositor -> smoother -> colour/alpha resolver.
//
// Hosts must finish build() before the next render_frame() whenever the
// surface size, cell geometry or accent probabilities change; rebuilding
// discards accumulated activation.
class Engine {
 public:
  Engine() = default;

  // Lays out a new grid for the surface and refreshes the palette.
  void build(double width, double height, const Params& p);

  // Re-parses the palette colour strings.
  void refresh_palette(const Params& p);

  // Renders one frame at host time `time_ms` (milliseconds). With motion
  // disabled the pattern is evaluated at t = 0 and stays static.
  //
  // Rows fully hidden by the vertical mask are skipped and their cells keep
  // their stored activation until they become visible again.
  //
  // The returned list is reused by the next call.
  const std::vector<CellDraw>& render_frame(double time_ms, bool motion_enabled, const Params& p);

  // Draw list of the most recent render_frame(); empty right after build().
  const std::vector<CellDraw>& last_frame() const { return draws_; }

  const Grid& grid() const { return grid_; }
  const Palette& palette() const { return palette_; }
  const FrameStats& stats() const { return stats_; }
  const SignalCompositor& compositor() const { return compositor_; }

  // Host time in milliseconds -> engine seconds.
  static double seconds_from_ms(double time_ms, bool motion_enabled) {
    return motion_enabled ? time_ms * 0.001 : 0.0;
  }

 private:
  SignalCompositor compositor_;
  Grid grid_;
  Palette palette_;
  std::vector<CellDraw> draws_;
  FrameStats stats_{};
};

} // namespace driftgrid
