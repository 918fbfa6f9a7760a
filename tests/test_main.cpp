#include <iostream>

#include "test.h"

int main() {
  int fails = 0;
  fails += test_hash_rng();
  fails += test_noise_field();
  fails += test_grid_layout();
  fails += test_signal_compositor();
  fails += test_temporal_smoother();
  fails += test_color_resolver();
  fails += test_engine();
  fails += test_params_io();
  fails += test_params_validation();
  fails += test_json();
  fails += test_log();
  fails += test_frame_buffer();

  if (fails == 0) {
    std::cout << "All tests passed\n";
    return 0;
  }
  std::cerr << fails << " tests failed\n";
  return 1;
}
