#include "driftgrid/core/params_validation.h"

#include <cmath>

#include "driftgrid/core/palette.h"

namespace driftgrid {

namespace {

void check_finite(std::vector<std::string>& errors, const char* name, double v) {
  if (!std::isfinite(v)) errors.push_back(std::string(name) + " must be finite");
}

void check_range(std::vector<std::string>& errors, const char* name, double v, double lo, double hi) {
  if (!(v >= lo && v <= hi)) {
    errors.push_back(std::string(name) + " must be in [" + std::to_string(lo) + ", " + std::to_string(hi) +
                     "], got " + std::to_string(v));
  }
}

void check_positive(std::vector<std::string>& errors, const char* name, double v) {
  if (!(v > 0.0)) errors.push_back(std::string(name) + " must be > 0, got " + std::to_string(v));
}

void check_color(std::vector<std::string>& errors, const char* name, const std::string& text) {
  if (!parse_hex_color(text)) errors.push_back(std::string(name) + " is not a #RRGGBB colour: '" + text + "'");
}

void check_band(std::vector<std::string>& errors, const std::string& prefix, const FieldBand& b) {
  check_finite(errors, (prefix + ".scale").c_str(), b.scale);
  check_finite(errors, (prefix + ".time_scale").c_str(), b.time_scale);
  check_range(errors, (prefix + ".threshold").c_str(), b.threshold, 0.0, 1.0);
  check_positive(errors, (prefix + ".feather").c_str(), b.feather);
}

} // namespace

std::vector<std::string> validate_params(const Params& p) {
  std::vector<std::string> errors;

  if (p.cell_size < 1) errors.push_back("cell_size must be >= 1, got " + std::to_string(p.cell_size));
  if (p.gap < 0) errors.push_back("gap must be >= 0, got " + std::to_string(p.gap));

  check_color(errors, "background_color", p.background_color);
  check_color(errors, "base_color", p.base_color);
  check_color(errors, "accent_a_color", p.accent_a_color);
  check_color(errors, "accent_b_color", p.accent_b_color);

  check_range(errors, "accent_a_prob", p.accent_a_prob, 0.0, 1.0);
  check_range(errors, "accent_b_prob", p.accent_b_prob, 0.0, 1.0);
  if (p.accent_a_prob + p.accent_b_prob > 1.0) errors.push_back("accent_a_prob + accent_b_prob must be <= 1");

  check_range(errors, "mask_height", p.mask_height, 0.0, 1.0);
  check_positive(errors, "mask_feather_y", p.mask_feather_y);

  check_finite(errors, "advection.x", p.advection.x);
  check_finite(errors, "advection.y", p.advection.y);
  check_band(errors, "macro", p.macro);
  check_band(errors, "micro", p.micro);

  check_finite(errors, "bias_strength", p.bias_strength);
  check_finite(errors, "color_mix_strength", p.color_mix_strength);
  check_positive(errors, "mix_gamma", p.mix_gamma);
  if (!(p.smoothing > 0.0 && p.smoothing <= 1.0)) {
    errors.push_back("smoothing must be in (0, 1], got " + std::to_string(p.smoothing));
  }

  check_range(errors, "base_alpha", p.base_alpha, 0.0, 1.0);
  check_range(errors, "active_alpha_boost", p.active_alpha_boost, 0.0, 1.0);
  if (p.base_alpha + p.active_alpha_boost > 1.0) errors.push_back("base_alpha + active_alpha_boost must be <= 1");

  return errors;
}

} // namespace driftgrid
