#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace driftgrid {

// Minimal RGB8 software surface for headless hosts and tests.
class FrameBuffer {
 public:
  FrameBuffer(int width, int height);

  int width() const { return width_; }
  int height() const { return height_; }

  void clear(std::uint8_t r, std::uint8_t g, std::uint8_t b);

  // Source-over blend of a solid rectangle, clipped to the surface.
  // alpha is clamped to [0,1].
  void fill_rect(int x, int y, int w, int h, std::uint8_t r, std::uint8_t g, std::uint8_t b, double alpha);

  // Packed 0xRRGGBB; (0,0) is top-left.
  std::uint32_t pixel(int x, int y) const;

  // Binary PPM (P6).
  std::string to_ppm() const;

 private:
  int width_{0};
  int height_{0};
  std::vector<std::uint8_t> rgb_;
};

} // namespace driftgrid
