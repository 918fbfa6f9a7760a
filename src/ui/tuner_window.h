#pragma once

#include <string>

#include "driftgrid/core/engine.h"
#include "driftgrid/core/params.h"

namespace driftgrid::ui {

// Live parameter panel ("Grid Tuner").
//
// Edits are written straight into the caller's Params; the App decides
// whether they need a rebuild, a palette refresh or nothing.
class TunerWindow {
 public:
  explicit TunerWindow(std::string preset_path);

  void draw(Params* params, bool* reduced_motion, const Engine& engine);

 private:
  void draw_presets(Params* params);

  char preset_path_[256] = "";
  std::string status_;
  bool status_is_error_{false};
};

} // namespace driftgrid::ui
