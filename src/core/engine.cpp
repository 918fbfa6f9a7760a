#include "driftgrid/core/engine.h"

#include "driftgrid/core/temporal_smoother.h"

namespace driftgrid {

void Engine::build(double width, double height, const Params& p) {
  refresh_palette(p);
  grid_ = build_grid(width, height, p);
  draws_.clear();
  draws_.reserve(grid_.cell_count());
  stats_ = FrameStats{};
}

void Engine::refresh_palette(const Params& p) { palette_ = make_palette(p); }

const std::vector<CellDraw>& Engine::render_frame(double time_ms, bool motion_enabled, const Params& p) {
  draws_.clear();
  stats_ = FrameStats{};
  if (grid_.empty()) return draws_;

  // Snapshot so a concurrent tuning edit cannot tear one frame.
  const Params frame = p;
  const double t = seconds_from_ms(time_ms, motion_enabled);
  const int cols = grid_.cols();
  const int rows = grid_.rows();
  const int pitch = grid_.pitch();
  double activation_sum = 0.0;

  for (int y = 0; y < rows; ++y) {
    const double ny = static_cast<double>(y) / static_cast<double>(rows);
    const double mask = vertical_mask(ny, frame.mask_height, frame.mask_feather_y);
    if (mask <= 0.0) {
      ++stats_.rows_masked;
      continue;
    }
    ++stats_.rows_drawn;

    for (int x = 0; x < cols; ++x) {
      const std::size_t i = grid_.index(x, y);
      const double target = compositor_.target(x, y, t, grid_.bias(i), frame);
      const double a = TemporalSmoother::step(grid_, i, target, frame.smoothing);
      activation_sum += a;

      const CellAppearance look = resolve_cell(grid_.color_class(i), a, mask, palette_, frame);
      draws_.push_back(CellDraw{x * pitch, y * pitch, grid_.cell_size(), look.color, look.alpha});
    }
  }

  stats_.cells_drawn = static_cast<int>(draws_.size());
  if (stats_.cells_drawn > 0) stats_.mean_activation = activation_sum / static_cast<double>(stats_.cells_drawn);
  return draws_;
}

} // namespace driftgrid
