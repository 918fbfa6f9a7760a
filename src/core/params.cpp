#include "driftgrid/core/params.h"

namespace driftgrid {

bool requires_rebuild(const Params& a, const Params& b) {
  return a.cell_size != b.cell_size || a.gap != b.gap || a.accent_a_prob != b.accent_a_prob ||
         a.accent_b_prob != b.accent_b_prob;
}

bool palette_changed(const Params& a, const Params& b) {
  return a.background_color != b.background_color || a.base_color != b.base_color ||
         a.accent_a_color != b.accent_a_color || a.accent_b_color != b.accent_b_color;
}

} // namespace driftgrid
