#include <algorithm>
#include <cmath>
#include <iostream>

#include "driftgrid/core/noise_field.h"

#define DG_ASSERT(expr)                                                                             \
  do {                                                                                              \
    if (!(expr)) {                                                                                  \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n";           \
      return 1;                                                                                     \
    }                                                                                               \
  } while (0)

int test_noise_field() {
  using namespace driftgrid;

  const NoiseField macro(kMacroNoiseSeed);
  const NoiseField micro(kMicroNoiseSeed);

  // Pure: repeated sampling returns the identical value, interleaving included.
  {
    const double a = macro.sample(3.25, -7.5, 0.125);
    (void)macro.sample(100.0, 200.0, 300.0);
    const double b = macro.sample(3.25, -7.5, 0.125);
    DG_ASSERT(a == b);
  }

  // Two instances from the same seed name are the same field.
  {
    const NoiseField again(kMacroNoiseSeed);
    DG_ASSERT(again.seed() == macro.seed());
    for (int i = 0; i < 50; ++i) {
      const double x = i * 0.37 - 4.0;
      const double y = i * -0.91 + 2.0;
      const double z = i * 0.05;
      DG_ASSERT(again.sample(x, y, z) == macro.sample(x, y, z));
    }
  }

  // Bounded, varying, and uncorrelated between macro and micro.
  {
    int differing = 0;
    double lo = 1.0;
    double hi = -1.0;
    for (int yi = -20; yi < 20; ++yi) {
      for (int xi = -20; xi < 20; ++xi) {
        const double x = xi * 0.173;
        const double y = yi * 0.219;
        const double z = (xi + yi) * 0.031;
        const double a = macro.sample(x, y, z);
        const double b = micro.sample(x, y, z);
        DG_ASSERT(a >= -1.0 && a <= 1.0);
        DG_ASSERT(b >= -1.0 && b <= 1.0);
        if (a != b) ++differing;
        lo = std::min(lo, a);
        hi = std::max(hi, a);
      }
    }
    DG_ASSERT(macro.seed() != micro.seed());
    DG_ASSERT(differing > 1500);
    DG_ASSERT(hi - lo > 0.5);
  }

  // Continuous: nearby points give nearby values.
  {
    const double a = macro.sample(1.5, 2.5, 0.5);
    const double b = macro.sample(1.5 + 1e-6, 2.5, 0.5);
    DG_ASSERT(std::abs(a - b) < 1e-3);
  }

  // Negative and large coordinates stay in range.
  {
    const double a = micro.sample(-1234.5, 987.25, -55.0);
    DG_ASSERT(std::isfinite(a));
    DG_ASSERT(a >= -1.0 && a <= 1.0);

    // Lattice coordinates beyond the int range.
    const NoiseField macro_far(kMacroNoiseSeed);
    const double coords[] = {3.0e9, -3.0e9, 1.0e12, -1.0e12, 4.5e15};
    for (const double c : coords) {
      const double v = macro_far.sample(c, -c, c * 0.5);
      DG_ASSERT(std::isfinite(v));
      DG_ASSERT(v >= -1.0 && v <= 1.0);
      DG_ASSERT(macro_far.sample(c, -c, c * 0.5) == v);
    }
  }

  return 0;
}
