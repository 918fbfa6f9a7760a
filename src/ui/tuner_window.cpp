#include "ui/tuner_window.h"

#include <cstdint>
#include <cstdio>
#include <exception>
#include <utility>

#include "driftgrid/core/palette.h"
#include "driftgrid/core/params_io.h"
#include "driftgrid/core/params_validation.h"
#include "driftgrid/util/log.h"

#include "ui/imgui_includes.h"

namespace driftgrid::ui {

namespace {

// Edits a "#RRGGBB" string through a colour picker.
bool color_edit(const char* label, std::string* hex) {
  const Rgb c = parse_hex_color(*hex).value_or(Rgb{});
  float col[3] = {c.r / 255.0f, c.g / 255.0f, c.b / 255.0f};
  if (!ImGui::ColorEdit3(label, col)) return false;

  const auto to_u8 = [](float v) {
    const float s = v < 0.0f ? 0.0f : (v > 1.0f ? 1.0f : v);
    return static_cast<std::uint8_t>(s * 255.0f + 0.5f);
  };
  *hex = to_hex_color(Rgb{to_u8(col[0]), to_u8(col[1]), to_u8(col[2])});
  return true;
}

} // namespace

TunerWindow::TunerWindow(std::string preset_path) {
  std::snprintf(preset_path_, sizeof(preset_path_), "%s", preset_path.c_str());
}

void TunerWindow::draw(Params* params, bool* reduced_motion, const Engine& engine) {
  Params& p = *params;

  ImGui::SetNextWindowSize(ImVec2(340, 620), ImGuiCond_FirstUseEver);
  if (!ImGui::Begin("Grid Tuner")) {
    ImGui::End();
    return;
  }

  if (ImGui::CollapsingHeader("Geometry", ImGuiTreeNodeFlags_DefaultOpen)) {
    ImGui::SliderInt("Cell size", &p.cell_size, 1, 10);
    ImGui::SliderInt("Gap", &p.gap, 0, 20);
  }

  if (ImGui::CollapsingHeader("Colors")) {
    color_edit("Background", &p.background_color);
    color_edit("Base", &p.base_color);
    color_edit("Accent A", &p.accent_a_color);
    color_edit("Accent B", &p.accent_b_color);
    ImGui::SliderDouble("Accent A prob", &p.accent_a_prob, 0.0, 0.5);
    ImGui::SliderDouble("Accent B prob", &p.accent_b_prob, 0.0, 0.2);
  }

  if (ImGui::CollapsingHeader("Masking")) {
    ImGui::SliderDouble("Active height", &p.mask_height, 0.0, 1.0);
    ImGui::SliderDouble("Feather##mask", &p.mask_feather_y, 0.01, 0.5);
  }

  if (ImGui::CollapsingHeader("Macro Wave")) {
    ImGui::SliderDouble("Scale##macro", &p.macro.scale, 0.001, 0.05, "%.4f");
    ImGui::SliderDouble("Vel X", &p.advection.x, -5.0, 5.0);
    ImGui::SliderDouble("Vel Y", &p.advection.y, -5.0, 5.0);
    ImGui::SliderDouble("Time scale##macro", &p.macro.time_scale, 0.0, 0.02, "%.4f");
    ImGui::SliderDouble("Threshold##macro", &p.macro.threshold, 0.0, 1.0);
    ImGui::SliderDouble("Feather##macro", &p.macro.feather, 0.0, 0.5);
  }

  if (ImGui::CollapsingHeader("Micro Gate")) {
    ImGui::SliderDouble("Scale##micro", &p.micro.scale, 0.01, 0.5);
    ImGui::SliderDouble("Time scale##micro", &p.micro.time_scale, 0.0, 0.05, "%.4f");
    ImGui::SliderDouble("Threshold##micro", &p.micro.threshold, 0.0, 1.0);
    ImGui::SliderDouble("Feather##micro", &p.micro.feather, 0.0, 0.5);
    ImGui::SliderDouble("Bias strength", &p.bias_strength, 0.0, 1.0);
  }

  if (ImGui::CollapsingHeader("Look & Feel")) {
    ImGui::SliderDouble("Color mix", &p.color_mix_strength, 0.0, 2.0);
    ImGui::SliderDouble("Gamma", &p.mix_gamma, 0.5, 3.0);
    ImGui::SliderDouble("Smoothing", &p.smoothing, 0.01, 0.5);
    ImGui::SliderDouble("Base alpha", &p.base_alpha, 0.0, 1.0);
    ImGui::SliderDouble("Active boost", &p.active_alpha_boost, 0.0, 1.0);
    ImGui::Checkbox("Debug mask", &p.debug_view);
  }

  ImGui::Separator();
  ImGui::Checkbox("Animate", &p.enable_animation);
  ImGui::SameLine();
  ImGui::Checkbox("Reduced motion", reduced_motion);

  draw_presets(params);

  const Grid& g = engine.grid();
  const FrameStats& st = engine.stats();
  ImGui::Separator();
  ImGui::Text("Grid %dx%d (pitch %d)", g.cols(), g.rows(), g.pitch());
  ImGui::Text("Accents: %zu A / %zu B", g.count(ColorClass::AccentA), g.count(ColorClass::AccentB));
  ImGui::Text("Cells drawn: %d, rows masked: %d", st.cells_drawn, st.rows_masked);
  ImGui::Text("Mean activation: %.3f", st.mean_activation);
  ImGui::TextDisabled("F1 toggles this panel");

  ImGui::End();
}

void TunerWindow::draw_presets(Params* params) {
  if (!ImGui::CollapsingHeader("Presets")) return;

  ImGui::InputText("Path", preset_path_, sizeof(preset_path_));
  if (ImGui::Button("Save")) {
    try {
      save_params_file(preset_path_, *params);
      status_ = std::string("Saved ") + preset_path_;
      status_is_error_ = false;
    } catch (const std::exception& e) {
      status_ = e.what();
      status_is_error_ = true;
      log::error(std::string("Preset save failed: ") + e.what());
    }
  }
  ImGui::SameLine();
  if (ImGui::Button("Load")) {
    try {
      Params loaded = load_params_file(preset_path_);
      const auto errors = validate_params(loaded);
      if (errors.empty()) {
        *params = std::move(loaded);
        status_ = std::string("Loaded ") + preset_path_;
        status_is_error_ = false;
      } else {
        status_ = "Rejected preset: " + errors.front();
        status_is_error_ = true;
        for (const auto& e : errors) log::warn("Preset " + std::string(preset_path_) + ": " + e);
      }
    } catch (const std::exception& e) {
      status_ = e.what();
      status_is_error_ = true;
      log::error(std::string("Preset load failed: ") + e.what());
    }
  }
  ImGui::SameLine();
  if (ImGui::Button("Defaults")) *params = Params{};

  if (!status_.empty()) {
    if (status_is_error_) {
      ImGui::TextColored(ImVec4(1.0f, 0.45f, 0.4f, 1.0f), "%s", status_.c_str());
    } else {
      ImGui::TextUnformatted(status_.c_str());
    }
  }
}

} // namespace driftgrid::ui
