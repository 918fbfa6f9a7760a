#pragma once

#include <cstddef>

#include "driftgrid/core/grid_layout.h"

namespace driftgrid {

// Exponential moving average of each cell's target activation.
//
// The effective time constant depends on the frame rate; a factor of 1 tracks
// the target with no lag.
class TemporalSmoother {
 public:
  static double blend(double current, double target, double factor) {
    return current + (target - current) * factor;
  }

  // Advances cell i one frame toward `target` and returns the stored value.
  // Call exactly once per cell per rendered frame.
  static double step(Grid& grid, std::size_t i, double target, double factor) {
    double& a = grid.activation_[i];
    a = blend(a, target, factor);
    return a;
  }
};

} // namespace driftgrid
