#include <iostream>
#include <string_view>

#ifndef DRIFTGRID_VERSION
#define DRIFTGRID_VERSION "unknown"
#endif

#ifndef DRIFTGRID_UI_UNAVAILABLE_REASON
#define DRIFTGRID_UI_UNAVAILABLE_REASON "SDL2 and/or Dear ImGui were not found when this build was configured."
#endif

namespace {

constexpr int kExitCodeOk = 0;
constexpr int kExitCodeUiRequiredUnavailable = 2;

bool has_flag(int argc, char** argv, std::string_view flag) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] && flag == argv[i]) return true;
  }
  return false;
}

void print_usage(const char* exe) {
  const char* name = (exe && *exe) ? exe : "driftgrid";
  std::cout << "driftgrid viewer v" << DRIFTGRID_VERSION << "\n\n";
  std::cout << "Usage: " << name << " [--help] [--version] [--require-ui]\n\n";
  std::cout << "This build does not include the interactive viewer.\n";
  std::cout << "Reason: " << DRIFTGRID_UI_UNAVAILABLE_REASON << "\n\n";
  std::cout << "Headless rendering is still available:\n";
  std::cout << "  driftgrid_cli --frames 120 --ppm frame.ppm\n\n";
  std::cout << "Install SDL2 and Dear ImGui (with the SDL2 + SDL_Renderer backends)\n";
  std::cout << "and reconfigure to build the viewer.\n";
}

}  // namespace

int main(int argc, char** argv) {
  if (has_flag(argc, argv, "--version")) {
    std::cout << DRIFTGRID_VERSION << "\n";
    return kExitCodeOk;
  }
  if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
    print_usage(argv[0]);
    return kExitCodeOk;
  }

  std::cerr << "driftgrid viewer is unavailable in this build.\n";
  std::cerr << "Reason: " << DRIFTGRID_UI_UNAVAILABLE_REASON << "\n";
  std::cerr << "Run with --help for details.\n";
  return has_flag(argc, argv, "--require-ui") ? kExitCodeUiRequiredUnavailable : kExitCodeOk;
}
