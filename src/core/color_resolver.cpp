#include "driftgrid/core/color_resolver.h"

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace driftgrid {

namespace {

constexpr double kMixSnapLow = 0.01;
constexpr double kMixSnapHigh = 0.99;

} // namespace

double vertical_mask(double ny, double mask_height, double mask_feather_y) {
  if (mask_height >= 1.0) return 1.0;
  const double threshold = 1.0 - mask_height;
  if (!(mask_feather_y > 0.0)) return ny >= threshold ? 1.0 : 0.0;
  return std::clamp((ny - threshold) / mask_feather_y, 0.0, 1.0);
}

Rgb resolve_color(ColorClass cls, double activation, double mix_strength, const Palette& pal) {
  if (cls == ColorClass::Base) return pal.base;

  const double mix = std::clamp(activation * mix_strength, 0.0, 1.0);
  if (mix < kMixSnapLow) return pal.base;
  if (mix > kMixSnapHigh) return pal.color_for(cls);
  return lerp_rgb(pal.base, pal.color_for(cls), mix);
}

CellAppearance resolve_cell(ColorClass cls, double activation, double mask, const Palette& pal, const Params& p) {
  if (p.debug_view) {
    const double v = std::clamp(std::floor(activation * 255.0 * mask), 0.0, 255.0);
    const auto g = static_cast<std::uint8_t>(v);
    return CellAppearance{Rgb{g, g, g}, 1.0};
  }

  CellAppearance out;
  out.color = resolve_color(cls, activation, p.color_mix_strength, pal);
  out.alpha = (p.base_alpha + activation * p.active_alpha_boost) * mask;
  return out;
}

} // namespace driftgrid
