#include "driftgrid/core/signal_compositor.h"

#include <algorithm>
#include <cmath>

namespace driftgrid {

double smoothstep_band(double value, double threshold, double feather) {
  if (!(feather > 0.0)) return value >= threshold ? 1.0 : 0.0;
  const double band = std::clamp((value - (threshold - feather)) / (2.0 * feather), 0.0, 1.0);
  return band * band * (3.0 - 2.0 * band);
}

double SignalCompositor::field_mask(const NoiseField& field, const Vec2& pos, double t, const FieldBand& band) {
  const double raw = field.sample(pos.x * band.scale, pos.y * band.scale, t * band.time_scale);
  const double v01 = (raw + 1.0) * 0.5;
  return smoothstep_band(v01, band.threshold, band.feather);
}

double SignalCompositor::target(int x, int y, double t, double bias, const Params& p) const {
  const Vec2 pos = advect(static_cast<double>(x), static_cast<double>(y), t, p.advection);

  // A cell lights up only where both fields agree; its bias then nudges it.
  const double signal = macro_mask(pos, t, p) * micro_mask(pos, t, p) + bias * p.bias_strength;

  const double clamped = std::clamp(signal, 0.0, 1.0);
  if (p.mix_gamma == 1.0) return clamped;
  return std::pow(clamped, p.mix_gamma);
}

} // namespace driftgrid
