#pragma once

// Centralized ImGui includes for driftgrid UI code.

#include <imgui.h>

namespace ImGui {

// Dear ImGui has no SliderDouble(); every tuning value is a double.
//
// Older ImGui versions took a `power` parameter instead of ImGuiSliderFlags
// (changed around v1.78).
#if defined(IMGUI_VERSION_NUM) && (IMGUI_VERSION_NUM >= 17800)
inline bool SliderDouble(const char* label, double* v, double v_min, double v_max, const char* format = "%.3f",
                         ImGuiSliderFlags flags = 0) {
  return SliderScalar(label, ImGuiDataType_Double, v, &v_min, &v_max, format, flags);
}
#else
inline bool SliderDouble(const char* label, double* v, double v_min, double v_max, const char* format = "%.3f",
                         float power = 1.0f) {
  return SliderScalar(label, ImGuiDataType_Double, v, &v_min, &v_max, format, power);
}
#endif

}  // namespace ImGui
