#include "driftgrid/core/palette.h"

#include <cmath>
#include <cstdio>

#include "driftgrid/core/grid_layout.h"
#include "driftgrid/core/params.h"
#include "driftgrid/util/log.h"

namespace driftgrid {

namespace {

int hex_digit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::uint8_t lerp_channel(std::uint8_t a, std::uint8_t b, double t) {
  const double v = static_cast<double>(a) + (static_cast<double>(b) - static_cast<double>(a)) * t;
  const long r = std::lround(v);
  return static_cast<std::uint8_t>(r < 0 ? 0 : (r > 255 ? 255 : r));
}

Rgb parse_or_black(const std::string& text, const char* what) {
  if (auto c = parse_hex_color(text)) return *c;
  log::warn(std::string("Unparseable ") + what + " colour '" + text + "', using #000000");
  return Rgb{};
}

} // namespace

std::optional<Rgb> parse_hex_color(std::string_view text) {
  if (!text.empty() && text.front() == '#') text.remove_prefix(1);
  if (text.size() != 6) return std::nullopt;

  std::uint8_t ch[3];
  for (int k = 0; k < 3; ++k) {
    const int hi = hex_digit(text[static_cast<std::size_t>(2 * k)]);
    const int lo = hex_digit(text[static_cast<std::size_t>(2 * k + 1)]);
    if (hi < 0 || lo < 0) return std::nullopt;
    ch[k] = static_cast<std::uint8_t>(hi * 16 + lo);
  }
  return Rgb{ch[0], ch[1], ch[2]};
}

std::string to_hex_color(const Rgb& c) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", c.r, c.g, c.b);
  return std::string(buf);
}

Rgb lerp_rgb(const Rgb& a, const Rgb& b, double t) {
  return Rgb{lerp_channel(a.r, b.r, t), lerp_channel(a.g, b.g, t), lerp_channel(a.b, b.b, t)};
}

const Rgb& Palette::color_for(ColorClass c) const {
  switch (c) {
    case ColorClass::AccentA: return accent_a;
    case ColorClass::AccentB: return accent_b;
    case ColorClass::Base: break;
  }
  return base;
}

Palette make_palette(const Params& p) {
  Palette pal;
  pal.background = parse_or_black(p.background_color, "background");
  pal.base = parse_or_black(p.base_color, "base");
  pal.accent_a = parse_or_black(p.accent_a_color, "accent A");
  pal.accent_b = parse_or_black(p.accent_b_color, "accent B");
  return pal;
}

} // namespace driftgrid
