#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace driftgrid {

struct Params;
enum class ColorClass : std::uint8_t;

struct Rgb {
  std::uint8_t r{0};
  std::uint8_t g{0};
  std::uint8_t b{0};

  bool operator==(const Rgb& o) const { return r == o.r && g == o.g && b == o.b; }
  bool operator!=(const Rgb& o) const { return !(*this == o); }
};

// Accepts "#RRGGBB" or "RRGGBB", hex digits in either case.
std::optional<Rgb> parse_hex_color(std::string_view text);

// "#rrggbb"
std::string to_hex_color(const Rgb& c);

// Per-channel linear interpolation, rounded to the nearest integer.
Rgb lerp_rgb(const Rgb& a, const Rgb& b, double t);

// Parsed colours, cached by the engine until explicitly refreshed.
struct Palette {
  Rgb background;
  Rgb base;
  Rgb accent_a;
  Rgb accent_b;

  // Accent colour for a non-Base class; `base` for ColorClass::Base.
  const Rgb& color_for(ColorClass c) const;
};

// Unparseable strings become black and are reported through log::warn.
Palette make_palette(const Params& p);

} // namespace driftgrid
