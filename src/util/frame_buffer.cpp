#include "driftgrid/util/frame_buffer.h"

#include <algorithm>
#include <cmath>

namespace driftgrid {

namespace {

std::uint8_t blend(std::uint8_t dst, std::uint8_t src, double a) {
  const double v = static_cast<double>(dst) + (static_cast<double>(src) - static_cast<double>(dst)) * a;
  return static_cast<std::uint8_t>(std::clamp(std::lround(v), 0L, 255L));
}

} // namespace

FrameBuffer::FrameBuffer(int width, int height)
    : width_(std::max(0, width)),
      height_(std::max(0, height)),
      rgb_(static_cast<std::size_t>(width_) * static_cast<std::size_t>(height_) * 3u, 0) {}

void FrameBuffer::clear(std::uint8_t r, std::uint8_t g, std::uint8_t b) {
  for (std::size_t i = 0; i + 2 < rgb_.size(); i += 3) {
    rgb_[i] = r;
    rgb_[i + 1] = g;
    rgb_[i + 2] = b;
  }
}

void FrameBuffer::fill_rect(int x, int y, int w, int h, std::uint8_t r, std::uint8_t g, std::uint8_t b,
                            double alpha) {
  const double a = std::clamp(alpha, 0.0, 1.0);
  if (a <= 0.0) return;

  const int x0 = std::max(0, x);
  const int y0 = std::max(0, y);
  const int x1 = std::min(width_, x + w);
  const int y1 = std::min(height_, y + h);

  for (int py = y0; py < y1; ++py) {
    for (int px = x0; px < x1; ++px) {
      const std::size_t i = (static_cast<std::size_t>(py) * static_cast<std::size_t>(width_) +
                             static_cast<std::size_t>(px)) * 3u;
      rgb_[i] = blend(rgb_[i], r, a);
      rgb_[i + 1] = blend(rgb_[i + 1], g, a);
      rgb_[i + 2] = blend(rgb_[i + 2], b, a);
    }
  }
}

std::uint32_t FrameBuffer::pixel(int x, int y) const {
  if (x < 0 || y < 0 || x >= width_ || y >= height_) return 0;
  const std::size_t i =
      (static_cast<std::size_t>(y) * static_cast<std::size_t>(width_) + static_cast<std::size_t>(x)) * 3u;
  return (static_cast<std::uint32_t>(rgb_[i]) << 16) | (static_cast<std::uint32_t>(rgb_[i + 1]) << 8) |
         static_cast<std::uint32_t>(rgb_[i + 2]);
}

std::string FrameBuffer::to_ppm() const {
  std::string out = "P6\n" + std::to_string(width_) + " " + std::to_string(height_) + "\n255\n";
  out.append(reinterpret_cast<const char*>(rgb_.data()), rgb_.size());
  return out;
}

} // namespace driftgrid
