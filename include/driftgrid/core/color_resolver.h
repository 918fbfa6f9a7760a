#pragma once

#include "driftgrid/core/grid_layout.h"
#include "driftgrid/core/palette.h"
#include "driftgrid/core/params.h"

namespace driftgrid {

struct CellAppearance {
  Rgb color;
  double alpha{0.0};
};

// Visibility of a row at normalized height ny = y / rows (0 = top).
//
// Rows fade in over mask_feather_y above the bottom mask_height of the
// surface. mask_height >= 1 disables the mask.
double vertical_mask(double ny, double mask_height, double mask_feather_y);

// Base cells always resolve to the base colour. Accent cells blend from base
// toward their accent by clamp(activation * mix_strength, 0, 1), snapping to
// the end colours within 0.01 of either end.
Rgb resolve_color(ColorClass cls, double activation, double mix_strength, const Palette& pal);

// Final colour and opacity of a visible cell.
//
// alpha = (base_alpha + activation * active_alpha_boost) * mask, not re-clamped.
// In debug view the cell is an opaque grey of floor(activation * 255 * mask).
CellAppearance resolve_cell(ColorClass cls, double activation, double mask, const Palette& pal, const Params& p);

} // namespace driftgrid
