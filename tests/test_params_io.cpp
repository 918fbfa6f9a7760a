#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "driftgrid/core/params.h"
#include "driftgrid/core/params_io.h"

#define DG_ASSERT(expr)                                                                             \
  do {                                                                                              \
    if (!(expr)) {                                                                                  \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n";           \
      return 1;                                                                                     \
    }                                                                                               \
  } while (0)

namespace {

bool same_band(const driftgrid::FieldBand& a, const driftgrid::FieldBand& b) {
  return a.scale == b.scale && a.time_scale == b.time_scale && a.threshold == b.threshold && a.feather == b.feather;
}

bool same_params(const driftgrid::Params& a, const driftgrid::Params& b) {
  return a.cell_size == b.cell_size && a.gap == b.gap && a.background_color == b.background_color &&
         a.base_color == b.base_color && a.accent_a_color == b.accent_a_color &&
         a.accent_b_color == b.accent_b_color && a.accent_a_prob == b.accent_a_prob &&
         a.accent_b_prob == b.accent_b_prob && a.mask_height == b.mask_height &&
         a.mask_feather_y == b.mask_feather_y && a.advection == b.advection && same_band(a.macro, b.macro) &&
         same_band(a.micro, b.micro) && a.bias_strength == b.bias_strength &&
         a.color_mix_strength == b.color_mix_strength && a.mix_gamma == b.mix_gamma && a.smoothing == b.smoothing &&
         a.base_alpha == b.base_alpha && a.active_alpha_boost == b.active_alpha_boost &&
         a.enable_animation == b.enable_animation && a.debug_view == b.debug_view;
}

std::string load_error(const std::string& text) {
  try {
    (void)driftgrid::params_from_json(text);
  } catch (const std::runtime_error& e) {
    return e.what();
  }
  return {};
}

} // namespace

int test_params_io() {
  using namespace driftgrid;

  // Defaults survive a trip through JSON text.
  {
    const Params d;
    DG_ASSERT(same_params(params_from_json(params_to_json(d)), d));
  }

  // Non-default values too, including ones without a short decimal form.
  {
    Params p;
    p.cell_size = 4;
    p.gap = 2;
    p.base_color = "#101010";
    p.accent_a_prob = 0.1 + 0.2;
    p.advection = Vec2{-3.75, 0.4};
    p.macro.scale = 1.0 / 3.0;
    p.micro.feather = 0.05;
    p.smoothing = 1.0;
    p.enable_animation = false;
    p.debug_view = true;
    const Params back = params_from_json(params_to_json(p));
    DG_ASSERT(same_params(back, p));
  }

  // Layout of the document.
  {
    const json::Value v = params_to_json_value(Params{});
    DG_ASSERT(v.find("cell_size") != nullptr);
    DG_ASSERT(v.find("macro") != nullptr && v.find("macro")->is_object());
    DG_ASSERT(v.find("advection")->find("x")->as_number() != nullptr);
    DG_ASSERT(*v.find("macro")->find("threshold")->as_number() == 0.35);
  }

  // Missing keys keep defaults.
  {
    DG_ASSERT(same_params(params_from_json("{}"), Params{}));
    const Params p = params_from_json(R"({"gap": 7, "micro": {"scale": 0.5}, "unknown_key": [1, 2]})");
    DG_ASSERT(p.gap == 7);
    DG_ASSERT(p.cell_size == 3);
    DG_ASSERT(p.micro.scale == 0.5);
    DG_ASSERT(p.micro.threshold == 0.2);
  }

  // Wrong types name the offending key.
  {
    DG_ASSERT(load_error(R"({"gap": "wide"})").find("'gap'") != std::string::npos);
    DG_ASSERT(load_error(R"({"macro": {"scale": true}})").find("'macro.scale'") != std::string::npos);
    DG_ASSERT(load_error(R"({"debug_view": 1})").find("'debug_view'") != std::string::npos);
    DG_ASSERT(load_error(R"({"base_color": 5})").find("'base_color'") != std::string::npos);
    DG_ASSERT(load_error(R"({"cell_size": 2.5})").find("integer") != std::string::npos);
    DG_ASSERT(load_error(R"({"cell_size": 1e300, "gap": 5})").find("'cell_size' must be an integer in range") !=
              std::string::npos);
    DG_ASSERT(load_error(R"({"gap": -3e10})").find("'gap' must be an integer in range") != std::string::npos);
    DG_ASSERT(load_error(R"({"gap": 1e999})").find("'gap'") != std::string::npos);
    DG_ASSERT(params_from_json(R"({"gap": 2147483647})").gap == 2147483647);
    DG_ASSERT(load_error(R"({"advection": 3})").find("'advection'") != std::string::npos);
    DG_ASSERT(!load_error("[1, 2]").empty());
    DG_ASSERT(!load_error("{\"gap\": ").empty());
  }

  // Files.
  {
    const auto dir = std::filesystem::temp_directory_path() / "driftgrid_test_params_io";
    const std::string path = (dir / "preset.json").string();
    Params p;
    p.mask_height = 0.33;
    p.accent_b_color = "#abcdef";
    save_params_file(path, p);
    DG_ASSERT(same_params(load_params_file(path), p));

    bool threw = false;
    try {
      (void)load_params_file((dir / "missing.json").string());
    } catch (const std::runtime_error&) {
      threw = true;
    }
    DG_ASSERT(threw);

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
  }

  // Rebuild / palette change detection.
  {
    const Params a;
    Params b = a;
    DG_ASSERT(!requires_rebuild(a, b));
    b.smoothing = 0.5;
    b.advection = Vec2{0.0, 0.0};
    DG_ASSERT(!requires_rebuild(a, b));
    b.gap = 6;
    DG_ASSERT(requires_rebuild(a, b));
    b = a;
    b.accent_b_prob = 0.0;
    DG_ASSERT(requires_rebuild(a, b));
    b = a;
    b.accent_a_color = "#000000";
    DG_ASSERT(!requires_rebuild(a, b));
    DG_ASSERT(palette_changed(a, b));
    DG_ASSERT(!palette_changed(a, a));
  }

  return 0;
}
