#include <cmath>
#include <iostream>

#include "driftgrid/core/params.h"
#include "driftgrid/core/signal_compositor.h"

#define DG_ASSERT(expr)                                                                             \
  do {                                                                                              \
    if (!(expr)) {                                                                                  \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n";           \
      return 1;                                                                                     \
    }                                                                                               \
  } while (0)

int test_signal_compositor() {
  using namespace driftgrid;

  // Smoothstep band: bounded, monotone, exact outside the band.
  {
    const double thr = 0.35;
    const double feather = 0.15;
    double prev = -1.0;
    for (int k = -2000; k <= 2000; ++k) {
      const double v = k * 0.005;  // [-10, 10]
      const double m = smoothstep_band(v, thr, feather);
      DG_ASSERT(m >= 0.0 && m <= 1.0);
      DG_ASSERT(m >= prev);
      prev = m;
    }
    DG_ASSERT(smoothstep_band(0.19, thr, feather) == 0.0);
    DG_ASSERT(smoothstep_band(0.51, thr, feather) == 1.0);
    DG_ASSERT(smoothstep_band(-1e9, thr, feather) == 0.0);
    DG_ASSERT(smoothstep_band(1e9, thr, feather) == 1.0);
    DG_ASSERT(std::abs(smoothstep_band(thr, thr, feather) - 0.5) < 1e-12);

    // Hermite ease: quarter of the way in -> 3/16 - 2/64 = 0.15625.
    DG_ASSERT(std::abs(smoothstep_band(0.275, thr, feather) - 0.15625) < 1e-9);

    // Zero feather degrades to a step.
    DG_ASSERT(smoothstep_band(0.34, thr, 0.0) == 0.0);
    DG_ASSERT(smoothstep_band(0.36, thr, 0.0) == 1.0);
  }

  const SignalCompositor comp;
  Params p;

  // Targets stay in [0,1] over a patch of cells and times.
  {
    for (int t = 0; t < 5; ++t) {
      for (int y = 0; y < 20; ++y) {
        for (int x = 0; x < 20; ++x) {
          const double bias = (x - 10) / 10.0;
          const double v = comp.target(x, y, t * 7.5, bias, p);
          DG_ASSERT(v >= 0.0 && v <= 1.0);
        }
      }
    }
  }

  // Saturated bias pins the target regardless of the fields.
  {
    Params q = p;
    q.bias_strength = 1.0;
    for (int x = 0; x < 10; ++x) {
      DG_ASSERT(comp.target(x, 3, 12.0, 1.0, q) == 1.0);
      DG_ASSERT(comp.target(x, 3, 12.0, -1.0, q) == 0.0);
    }
  }

  // With zero bias and unit gamma the target is exactly the product of the two
  // masks, both read at the same advected position.
  {
    Params q = p;
    q.mix_gamma = 1.0;
    const double t = 4.2;
    for (int x = 0; x < 8; ++x) {
      const Vec2 pos = advect(x, 5, t, q.advection);
      const double expected = comp.macro_mask(pos, t, q) * comp.micro_mask(pos, t, q);
      DG_ASSERT(comp.target(x, 5, t, 0.0, q) == expected);
    }
  }

  // Gamma reshapes the clamped signal.
  {
    Params linear = p;
    linear.mix_gamma = 1.0;
    Params snappy = p;
    snappy.mix_gamma = 2.0;
    for (int x = 0; x < 30; ++x) {
      const double a = comp.target(x, 2, 3.0, 0.1, linear);
      const double b = comp.target(x, 2, 3.0, 0.1, snappy);
      DG_ASSERT(std::abs(b - a * a) < 1e-12);
    }
  }

  // Texture advection: with frozen field evolution, the pattern at time t is
  // the t = 0 pattern shifted by velocity * t, for both fields together.
  {
    Params q = p;
    q.advection = Vec2{2.0, 0.0};
    q.macro.time_scale = 0.0;
    q.micro.time_scale = 0.0;
    for (int x = 0; x < 10; ++x) {
      DG_ASSERT(comp.target(x, 4, 3.0, 0.2, q) == comp.target(x + 6, 4, 0.0, 0.2, q));
    }
  }

  // Field masks read the configured band.
  {
    Params q = p;
    q.macro.threshold = -1.0;  // everything is above the band
    q.macro.feather = 0.1;
    q.micro.threshold = 2.0;   // everything is below the band
    q.micro.feather = 0.1;
    const Vec2 pos{3.0, 4.0};
    DG_ASSERT(comp.macro_mask(pos, 1.0, q) == 1.0);
    DG_ASSERT(comp.micro_mask(pos, 1.0, q) == 0.0);
  }

  return 0;
}
