#include "ui/app.h"

#include <algorithm>
#include <cmath>
#include <utility>

#include "driftgrid/util/log.h"

namespace driftgrid::ui {

App::App(Params params, AppOptions opts)
    : params_(std::move(params)), applied_(params_), opts_(std::move(opts)), tuner_(opts_.params_path) {
  start_counter_ = SDL_GetPerformanceCounter();
}

void App::on_event(const SDL_Event& e) {
  if (e.type == SDL_KEYDOWN && e.key.keysym.sym == SDLK_F1) opts_.show_tuner = !opts_.show_tuner;
}

void App::rebuild() {
  engine_.build(surface_w_, surface_h_, params_);
  applied_ = params_;
  needs_frame_ = true;
}

void App::sync_surface(SDL_Renderer* renderer) {
  int w = 0;
  int h = 0;
  if (SDL_GetRendererOutputSize(renderer, &w, &h) != 0) {
    log::warn(std::string("SDL_GetRendererOutputSize failed: ") + SDL_GetError());
    return;
  }
  if (w == surface_w_ && h == surface_h_) return;
  surface_w_ = w;
  surface_h_ = h;
  log::debug("Surface resized to " + std::to_string(w) + "x" + std::to_string(h));
  rebuild();
}

void App::apply_edits() {
  if (requires_rebuild(applied_, params_)) {
    rebuild();
    return;
  }
  if (palette_changed(applied_, params_)) {
    engine_.refresh_palette(params_);
    needs_frame_ = true;
  }
  applied_ = params_;
}

void App::frame(SDL_Renderer* renderer) {
  sync_surface(renderer);

  if (opts_.show_tuner) {
    tuner_.draw(&params_, &opts_.reduced_motion, engine_);
    apply_edits();
  }

  const bool motion = params_.enable_animation && !opts_.reduced_motion;
  if (motion || needs_frame_) {
    const Uint64 ticks = SDL_GetPerformanceCounter() - start_counter_;
    const double now_ms =
        static_cast<double>(ticks) * 1000.0 / static_cast<double>(SDL_GetPerformanceFrequency());
    engine_.render_frame(now_ms, motion, params_);
    needs_frame_ = false;
  }
}

void App::render_cells(SDL_Renderer* renderer) const {
  const Rgb& bg = engine_.palette().background;
  SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_NONE);
  SDL_SetRenderDrawColor(renderer, bg.r, bg.g, bg.b, 255);
  SDL_RenderClear(renderer);

  SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
  for (const CellDraw& d : engine_.last_frame()) {
    const auto a = static_cast<Uint8>(std::lround(std::clamp(d.alpha, 0.0, 1.0) * 255.0));
    if (a == 0) continue;
    SDL_SetRenderDrawColor(renderer, d.color.r, d.color.g, d.color.b, a);
    const SDL_Rect r{d.x_px, d.y_px, d.size_px, d.size_px};
    SDL_RenderFillRect(renderer, &r);
  }
}

} // namespace driftgrid::ui
