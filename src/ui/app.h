#pragma once

#include <string>

#include <SDL.h>

#include "driftgrid/core/engine.h"
#include "driftgrid/core/params.h"

#include "ui/tuner_window.h"

namespace driftgrid::ui {

struct AppOptions {
  bool reduced_motion{false};
  bool show_tuner{true};
  std::string params_path{"driftgrid_params.json"};
};

// Frame driver for the interactive host: tracks the surface size, applies
// tuning edits (rebuild / palette refresh / next frame) and blits the engine's
// cells through SDL_Renderer.
class App {
 public:
  App(Params params, AppOptions opts);

  // Called once per frame between ImGui::NewFrame() and ImGui::Render().
  void frame(SDL_Renderer* renderer);

  // Clears to the palette background and draws the current cells.
  void render_cells(SDL_Renderer* renderer) const;

  void on_event(const SDL_Event& e);

 private:
  void sync_surface(SDL_Renderer* renderer);
  void apply_edits();
  void rebuild();

  Engine engine_;
  Params params_;
  // Parameters the grid and palette were last built from.
  Params applied_;
  AppOptions opts_;
  TunerWindow tuner_;

  int surface_w_{0};
  int surface_h_{0};
  bool needs_frame_{true};
  Uint64 start_counter_{0};
};

} // namespace driftgrid::ui
