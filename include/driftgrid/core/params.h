#pragma once

#include <string>

#include "driftgrid/core/vec2.h"

namespace driftgrid {

// Threshold band applied to one noise field.
struct FieldBand {
  // Spatial frequency in 1/cells.
  double scale{0.012};
  // Multiplier from seconds to the field's third (time) axis.
  double time_scale{0.003};
  // Remapped [0,1] noise value at the centre of the soft edge.
  double threshold{0.35};
  // Half-width of the soft edge.
  double feather{0.15};
};

// Caller-owned tuning values. The engine reads a snapshot each frame and never
// writes to it.
//
// Geometry (cell_size, gap) and the accent probabilities only take effect on
// the next Engine::build; colour strings on the next Engine::refresh_palette;
// everything else on the next frame.
struct Params {
  // Geometry (surface pixels).
  int cell_size{3};
  int gap{5};

  // Palette, "#RRGGBB".
  std::string background_color{"#F6F2EF"};
  std::string base_color{"#D9D7D2"};
  std::string accent_a_color{"#F5F7D9"};
  std::string accent_b_color{"#FFEAEA"};

  // Accent assignment at build time.
  double accent_a_prob{0.25};
  double accent_b_prob{0.1};

  // Vertical visibility mask. 1.0 = full surface, 0.33 = bottom third.
  double mask_height{1.0};
  double mask_feather_y{0.2};

  // Both fields travel with this velocity (cells per second), so the fine
  // texture stays attached to the coarse cloud.
  Vec2 advection{2.5, -1.0};

  FieldBand macro{0.012, 0.003, 0.35, 0.15};
  FieldBand micro{0.08, 0.01, 0.2, 0.2};

  // Weight of the per-cell bias in [-1,1] added to the combined mask.
  double bias_strength{0.5};

  double color_mix_strength{1.0};
  double mix_gamma{1.8};
  // Per-frame EMA weight in (0,1].
  double smoothing{0.15};

  // Callers keep base_alpha + active_alpha_boost <= 1.
  double base_alpha{0.25};
  double active_alpha_boost{0.35};

  bool enable_animation{true};
  bool debug_view{false};

  int pitch() const { return cell_size + gap; }
};

// True when a switch from `a` to `b` invalidates the built grid.
bool requires_rebuild(const Params& a, const Params& b);

// True when any palette colour string differs.
bool palette_changed(const Params& a, const Params& b);

} // namespace driftgrid
