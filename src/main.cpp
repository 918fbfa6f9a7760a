#include <SDL.h>

#include <cstdlib>
#include <string>
#include <utility>

#include <imgui.h>
#include <imgui_impl_sdl2.h>
#include <imgui_impl_sdlrenderer2.h>

#include "driftgrid/core/params.h"
#include "driftgrid/core/params_io.h"
#include "driftgrid/core/params_validation.h"
#include "driftgrid/util/log.h"

#include "ui/app.h"

namespace {

std::string get_str_arg(int argc, char** argv, const std::string& key, const std::string& def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return argv[i + 1];
  }
  return def;
}

bool has_flag(int argc, char** argv, const std::string& flag) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] == flag) return true;
  }
  return false;
}

// Hosts without an accessibility query can opt in through the environment.
bool env_reduced_motion() {
  const char* v = std::getenv("DRIFTGRID_REDUCED_MOTION");
  return v && *v && std::string(v) != "0";
}

} // namespace

int main(int argc, char** argv) {
  try {
    driftgrid::log::set_level(has_flag(argc, argv, "--verbose") ? driftgrid::log::Level::Debug
                                                                 : driftgrid::log::Level::Info);

    driftgrid::ui::AppOptions opts;
    opts.reduced_motion = has_flag(argc, argv, "--reduced-motion") || env_reduced_motion();
    opts.show_tuner = !has_flag(argc, argv, "--no-tuner");
    opts.params_path = get_str_arg(argc, argv, "--params", opts.params_path);

    driftgrid::Params params;
    if (has_flag(argc, argv, "--params")) {
      params = driftgrid::load_params_file(opts.params_path);
      const auto errors = driftgrid::validate_params(params);
      if (!errors.empty()) {
        for (const auto& e : errors) driftgrid::log::error("Invalid parameter: " + e);
        return 1;
      }
    }

    driftgrid::ui::App app(std::move(params), opts);

    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
      driftgrid::log::error(std::string("SDL_Init failed: ") + SDL_GetError());
      return 1;
    }

    SDL_Window* window = SDL_CreateWindow("driftgrid", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, 1280, 720,
                                          SDL_WINDOW_RESIZABLE | SDL_WINDOW_ALLOW_HIGHDPI);
    if (!window) {
      driftgrid::log::error(std::string("SDL_CreateWindow failed: ") + SDL_GetError());
      SDL_Quit();
      return 1;
    }

    SDL_Renderer* renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
    if (!renderer) {
      driftgrid::log::error(std::string("SDL_CreateRenderer failed: ") + SDL_GetError());
      SDL_DestroyWindow(window);
      SDL_Quit();
      return 1;
    }

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::StyleColorsLight();

    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    io.IniFilename = nullptr;

    ImGui_ImplSDL2_InitForSDLRenderer(window, renderer);
    ImGui_ImplSDLRenderer2_Init(renderer);

    bool running = true;
    while (running) {
      SDL_Event e;
      while (SDL_PollEvent(&e)) {
        ImGui_ImplSDL2_ProcessEvent(&e);
        if (e.type == SDL_QUIT) running = false;
        if (e.type == SDL_WINDOWEVENT && e.window.event == SDL_WINDOWEVENT_CLOSE &&
            e.window.windowID == SDL_GetWindowID(window))
          running = false;
        app.on_event(e);
      }

      ImGui_ImplSDLRenderer2_NewFrame();
      ImGui_ImplSDL2_NewFrame();
      ImGui::NewFrame();

      app.frame(renderer);

      ImGui::Render();
      app.render_cells(renderer);
      ImGui_ImplSDLRenderer2_RenderDrawData(ImGui::GetDrawData(), renderer);
      SDL_RenderPresent(renderer);
    }

    ImGui_ImplSDLRenderer2_Shutdown();
    ImGui_ImplSDL2_Shutdown();
    ImGui::DestroyContext();

    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(window);
    SDL_Quit();
    return 0;
  } catch (const std::exception& e) {
    driftgrid::log::error(std::string("Fatal: ") + e.what());
    return 1;
  }
}
