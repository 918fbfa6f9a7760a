#include "driftgrid/core/params_io.h"

#include <cmath>
#include <limits>
#include <stdexcept>

#include "driftgrid/util/file_io.h"
#include "driftgrid/util/log.h"

namespace driftgrid {

namespace {

json::Value band_to_json(const FieldBand& b) {
  json::Object o;
  o["scale"] = b.scale;
  o["time_scale"] = b.time_scale;
  o["threshold"] = b.threshold;
  o["feather"] = b.feather;
  return o;
}

void read_number(const json::Value& obj, const std::string& key, const std::string& path, double* out) {
  const json::Value* v = obj.find(key);
  if (!v) return;
  const double* d = v->as_number();
  if (!d) throw std::runtime_error("Params JSON: '" + path + key + "' must be a number");
  *out = *d;
}

void read_int(const json::Value& obj, const std::string& key, const std::string& path, int* out) {
  double d = static_cast<double>(*out);
  read_number(obj, key, path, &d);
  if (!std::isfinite(d) || d != std::floor(d)) {
    throw std::runtime_error("Params JSON: '" + path + key + "' must be an integer");
  }
  if (d < static_cast<double>(std::numeric_limits<int>::min()) ||
      d > static_cast<double>(std::numeric_limits<int>::max())) {
    throw std::runtime_error("Params JSON: '" + path + key + "' must be an integer in range");
  }
  *out = static_cast<int>(d);
}

void read_bool(const json::Value& obj, const std::string& key, const std::string& path, bool* out) {
  const json::Value* v = obj.find(key);
  if (!v) return;
  const bool* b = v->as_bool();
  if (!b) throw std::runtime_error("Params JSON: '" + path + key + "' must be a boolean");
  *out = *b;
}

void read_string(const json::Value& obj, const std::string& key, const std::string& path, std::string* out) {
  const json::Value* v = obj.find(key);
  if (!v) return;
  const std::string* s = v->as_string();
  if (!s) throw std::runtime_error("Params JSON: '" + path + key + "' must be a string");
  *out = *s;
}

const json::Value* read_object(const json::Value& obj, const std::string& key) {
  const json::Value* v = obj.find(key);
  if (!v) return nullptr;
  if (!v->is_object()) throw std::runtime_error("Params JSON: '" + key + "' must be an object");
  return v;
}

void read_band(const json::Value& obj, const std::string& key, FieldBand* b) {
  const json::Value* o = read_object(obj, key);
  if (!o) return;
  const std::string path = key + ".";
  read_number(*o, "scale", path, &b->scale);
  read_number(*o, "time_scale", path, &b->time_scale);
  read_number(*o, "threshold", path, &b->threshold);
  read_number(*o, "feather", path, &b->feather);
}

} // namespace

json::Value params_to_json_value(const Params& p) {
  json::Object o;
  o["cell_size"] = static_cast<double>(p.cell_size);
  o["gap"] = static_cast<double>(p.gap);

  o["background_color"] = p.background_color;
  o["base_color"] = p.base_color;
  o["accent_a_color"] = p.accent_a_color;
  o["accent_b_color"] = p.accent_b_color;

  o["accent_a_prob"] = p.accent_a_prob;
  o["accent_b_prob"] = p.accent_b_prob;

  o["mask_height"] = p.mask_height;
  o["mask_feather_y"] = p.mask_feather_y;

  json::Object adv;
  adv["x"] = p.advection.x;
  adv["y"] = p.advection.y;
  o["advection"] = std::move(adv);
  o["macro"] = band_to_json(p.macro);
  o["micro"] = band_to_json(p.micro);

  o["bias_strength"] = p.bias_strength;
  o["color_mix_strength"] = p.color_mix_strength;
  o["mix_gamma"] = p.mix_gamma;
  o["smoothing"] = p.smoothing;
  o["base_alpha"] = p.base_alpha;
  o["active_alpha_boost"] = p.active_alpha_boost;

  o["enable_animation"] = p.enable_animation;
  o["debug_view"] = p.debug_view;
  return o;
}

std::string params_to_json(const Params& p) { return json::stringify(params_to_json_value(p), 2) + "\n"; }

Params params_from_json_value(const json::Value& v) {
  if (!v.is_object()) throw std::runtime_error("Params JSON: top-level value must be an object");

  Params p;
  const std::string root;
  read_int(v, "cell_size", root, &p.cell_size);
  read_int(v, "gap", root, &p.gap);

  read_string(v, "background_color", root, &p.background_color);
  read_string(v, "base_color", root, &p.base_color);
  read_string(v, "accent_a_color", root, &p.accent_a_color);
  read_string(v, "accent_b_color", root, &p.accent_b_color);

  read_number(v, "accent_a_prob", root, &p.accent_a_prob);
  read_number(v, "accent_b_prob", root, &p.accent_b_prob);

  read_number(v, "mask_height", root, &p.mask_height);
  read_number(v, "mask_feather_y", root, &p.mask_feather_y);

  if (const json::Value* adv = read_object(v, "advection")) {
    read_number(*adv, "x", "advection.", &p.advection.x);
    read_number(*adv, "y", "advection.", &p.advection.y);
  }
  read_band(v, "macro", &p.macro);
  read_band(v, "micro", &p.micro);

  read_number(v, "bias_strength", root, &p.bias_strength);
  read_number(v, "color_mix_strength", root, &p.color_mix_strength);
  read_number(v, "mix_gamma", root, &p.mix_gamma);
  read_number(v, "smoothing", root, &p.smoothing);
  read_number(v, "base_alpha", root, &p.base_alpha);
  read_number(v, "active_alpha_boost", root, &p.active_alpha_boost);

  read_bool(v, "enable_animation", root, &p.enable_animation);
  read_bool(v, "debug_view", root, &p.debug_view);
  return p;
}

Params params_from_json(const std::string& json_text) { return params_from_json_value(json::parse(json_text)); }

Params load_params_file(const std::string& path) {
  Params p = params_from_json(read_text_file(path));
  log::info("Loaded parameters from " + path);
  return p;
}

void save_params_file(const std::string& path, const Params& p) {
  write_text_file(path, params_to_json(p));
  log::info("Saved parameters to " + path);
}

} // namespace driftgrid
