#pragma once

#include "driftgrid/core/noise_field.h"
#include "driftgrid/core/params.h"
#include "driftgrid/core/vec2.h"

namespace driftgrid {

// Hermite-eased threshold: 0 below threshold - feather, 1 above
// threshold + feather, 3b^2 - 2b^3 in between. Bounded to [0,1] and
// non-decreasing in `value` for every real input. A non-positive feather
// degrades to a hard step at the threshold.
double smoothstep_band(double value, double threshold, double feather);

// Grid position moved along the advection vector after t seconds.
inline Vec2 advect(double x, double y, double t, const Vec2& velocity) {
  return Vec2{x + t * velocity.x, y + t * velocity.y};
}

// Combines the macro ("moving cloud") and micro ("patchy texture") fields and a
// cell's bias into a target activation.
//
// Both fields are sampled at the same advected position; only their spatial
// scale, time scale and band differ.
class SignalCompositor {
 public:
  SignalCompositor() : macro_(kMacroNoiseSeed), micro_(kMicroNoiseSeed) {}
  SignalCompositor(NoiseField macro, NoiseField micro) : macro_(macro), micro_(micro) {}

  // Soft mask of one field at an already advected position.
  static double field_mask(const NoiseField& field, const Vec2& pos, double t, const FieldBand& band);

  double macro_mask(const Vec2& pos, double t, const Params& p) const { return field_mask(macro_, pos, t, p.macro); }
  double micro_mask(const Vec2& pos, double t, const Params& p) const { return field_mask(micro_, pos, t, p.micro); }

  // Target activation in [0,1] for cell (x, y) with the given bias at time t (seconds).
  double target(int x, int y, double t, double bias, const Params& p) const;

  const NoiseField& macro() const { return macro_; }
  const NoiseField& micro() const { return micro_; }

 private:
  NoiseField macro_;
  NoiseField micro_;
};

} // namespace driftgrid
