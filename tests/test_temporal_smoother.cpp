#include <cmath>
#include <iostream>

#include "driftgrid/core/grid_layout.h"
#include "driftgrid/core/params.h"
#include "driftgrid/core/temporal_smoother.h"

#define DG_ASSERT(expr)                                                                             \
  do {                                                                                              \
    if (!(expr)) {                                                                                  \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n";           \
      return 1;                                                                                     \
    }                                                                                               \
  } while (0)

int test_temporal_smoother() {
  using namespace driftgrid;

  Params p;
  const double factors[] = {0.01, 0.15, 0.5, 0.9, 1.0};
  const double targets[] = {0.0, 0.3, 0.75, 1.0};

  // From 0 under a constant target: monotone, no overshoot, converges.
  for (const double factor : factors) {
    for (const double target : targets) {
      Grid g = build_grid(16, 16, p);
      double prev = g.activation(0);
      DG_ASSERT(prev == 0.0);
      for (int frame = 0; frame < 3000; ++frame) {
        const double a = TemporalSmoother::step(g, 0, target, factor);
        DG_ASSERT(a >= prev);
        DG_ASSERT(a <= target + 1e-12);
        DG_ASSERT(g.activation(0) == a);
        prev = a;
      }
      DG_ASSERT(std::abs(prev - target) < 1e-9);
    }
  }

  // Factor 1 tracks the target with no lag.
  {
    Grid g = build_grid(16, 16, p);
    DG_ASSERT(TemporalSmoother::step(g, 1, 0.42, 1.0) == 0.42);
    DG_ASSERT(TemporalSmoother::step(g, 1, 0.17, 1.0) == 0.17);
  }

  // One step is the EMA blend, and only the addressed cell moves.
  {
    Grid g = build_grid(16, 16, p);
    const double a = TemporalSmoother::step(g, 2, 1.0, 0.15);
    DG_ASSERT(std::abs(a - 0.15) < 1e-15);
    const double b = TemporalSmoother::step(g, 2, 1.0, 0.15);
    DG_ASSERT(std::abs(b - (0.15 + 0.85 * 0.15)) < 1e-15);
    for (std::size_t i = 0; i < g.cell_count(); ++i) {
      if (i != 2) DG_ASSERT(g.activation(i) == 0.0);
    }
  }

  // Falling target decays toward it from above.
  {
    DG_ASSERT(TemporalSmoother::blend(1.0, 0.0, 0.25) == 0.75);
    DG_ASSERT(TemporalSmoother::blend(0.5, 0.5, 0.3) == 0.5);
  }

  return 0;
}
