#include <iostream>
#include <string>
#include <vector>

#include "driftgrid/core/engine.h"
#include "driftgrid/core/params.h"
#include "driftgrid/core/params_io.h"
#include "driftgrid/core/params_validation.h"
#include "driftgrid/util/file_io.h"
#include "driftgrid/util/frame_buffer.h"
#include "driftgrid/util/log.h"
#include "driftgrid/util/strings.h"

namespace {

#ifndef DRIFTGRID_VERSION
#define DRIFTGRID_VERSION "unknown"
#endif

int get_int_arg(int argc, char** argv, const std::string& key, int def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return std::stoi(argv[i + 1]);
  }
  return def;
}

double get_double_arg(int argc, char** argv, const std::string& key, double def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return std::stod(argv[i + 1]);
  }
  return def;
}

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

void print_usage(const char* exe) {
  std::cout << "driftgrid CLI v" << DRIFTGRID_VERSION << "\n\n";
  std::cout << "Usage: " << exe << " [options]\n";
  std::cout << "  --width N            Surface width in pixels (default 640)\n";
  std::cout << "  --height N           Surface height in pixels (default 360)\n";
  std::cout << "  --frames N           Frames to render (default 120)\n";
  std::cout << "  --fps F              Host frame rate used to advance time (default 60)\n";
  std::cout << "  --params PATH        Load parameters from JSON\n";
  std::cout << "  --write-params PATH  Write the effective parameters as JSON and exit\n";
  std::cout << "  --ppm PATH           Write the last frame as a binary PPM\n";
  std::cout << "  --reduced-motion     Freeze time at 0 (static pattern)\n";
  std::cout << "  --debug-view         Render raw activation as greyscale\n";
  std::cout << "  --log-level L        debug|info|warn|error|off\n";
  std::cout << "  --verbose            Same as --log-level debug\n";
  std::cout << "  --quiet              Suppress the summary\n";
  std::cout << "  --version, --help\n";
}

} // namespace

int main(int argc, char** argv) {
  try {
    if (has_flag(argc, argv, "--version")) {
      std::cout << DRIFTGRID_VERSION << "\n";
      return 0;
    }
    if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
      print_usage(argv[0]);
      return 0;
    }

    const bool quiet = has_flag(argc, argv, "--quiet");
    if (has_flag(argc, argv, "--verbose")) driftgrid::log::set_level(driftgrid::log::Level::Debug);
    const std::string level_name = get_str_arg(argc, argv, "--log-level", "");
    if (!level_name.empty()) {
      driftgrid::log::Level lvl;
      if (!driftgrid::log::parse_level(level_name, &lvl)) {
        std::cerr << "Unknown --log-level: " << level_name << "\n\n";
        print_usage(argv[0]);
        return 2;
      }
      driftgrid::log::set_level(lvl);
    }

    const int width = get_int_arg(argc, argv, "--width", 640);
    const int height = get_int_arg(argc, argv, "--height", 360);
    const int frames = get_int_arg(argc, argv, "--frames", 120);
    const double fps = get_double_arg(argc, argv, "--fps", 60.0);
    const std::string params_path = get_str_arg(argc, argv, "--params", "");
    const std::string write_params_path = get_str_arg(argc, argv, "--write-params", "");
    const std::string ppm_path = get_str_arg(argc, argv, "--ppm", "");
    const bool reduced_motion = has_flag(argc, argv, "--reduced-motion");

    if (frames < 0 || !(fps > 0.0)) {
      std::cerr << "--frames must be >= 0 and --fps must be > 0\n\n";
      print_usage(argv[0]);
      return 2;
    }

    driftgrid::Params params = params_path.empty() ? driftgrid::Params{} : driftgrid::load_params_file(params_path);
    if (has_flag(argc, argv, "--debug-view")) params.debug_view = true;

    const auto errors = driftgrid::validate_params(params);
    if (!errors.empty()) {
      std::cerr << "Parameter validation failed:\n";
      for (const auto& e : errors) std::cerr << "  - " << e << "\n";
      return 1;
    }

    if (!write_params_path.empty()) {
      driftgrid::save_params_file(write_params_path, params);
      if (!quiet) std::cout << "Parameters written to " << write_params_path << "\n";
      return 0;
    }

    driftgrid::Engine engine;
    engine.build(width, height, params);

    // One engine frame per display refresh. With animation paused only the
    // first frame is rendered.
    const bool motion = params.enable_animation && !reduced_motion;
    const double frame_ms = 1000.0 / fps;
    driftgrid::FrameBuffer fb(width, height);
    int rendered = 0;
    const std::vector<driftgrid::CellDraw>* last = nullptr;

    for (int f = 0; f < frames; ++f) {
      if (!params.enable_animation && f > 0) break;
      last = &engine.render_frame(static_cast<double>(f) * frame_ms, motion, params);
      ++rendered;
    }

    if (!ppm_path.empty()) {
      const auto& bg = engine.palette().background;
      fb.clear(bg.r, bg.g, bg.b);
      if (last) {
        for (const auto& d : *last) {
          fb.fill_rect(d.x_px, d.y_px, d.size_px, d.size_px, d.color.r, d.color.g, d.color.b, d.alpha);
        }
      }
      driftgrid::write_binary_file(ppm_path, fb.to_ppm());
      if (!quiet) std::cout << "Frame written to " << ppm_path << "\n";
    }

    if (!quiet) {
      const auto& grid = engine.grid();
      const auto& st = engine.stats();
      std::cout << "Grid " << grid.cols() << "x" << grid.rows() << " (pitch " << grid.pitch() << "), "
                << grid.count(driftgrid::ColorClass::AccentA) << " accent A, "
                << grid.count(driftgrid::ColorClass::AccentB) << " accent B\n";
      std::cout << "Frames rendered: " << rendered << (motion ? "" : " (static)") << "\n";
      std::cout << "Last frame: " << st.cells_drawn << " cells in " << st.rows_drawn << " rows, " << st.rows_masked
                << " rows masked, mean activation " << driftgrid::format_fixed(st.mean_activation, 4) << "\n";
    }
    return 0;
  } catch (const std::exception& e) {
    driftgrid::log::error(std::string("Fatal: ") + e.what());
    return 1;
  }
}
