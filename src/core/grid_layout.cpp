#include "driftgrid/core/grid_layout.h"

#include <algorithm>
#include <cmath>
#include <string>

#include "driftgrid/core/params.h"
#include "driftgrid/util/hash_rng.h"
#include "driftgrid/util/log.h"

namespace driftgrid {

namespace {

// Causal half-neighbourhood at radius 1: (dx, dy) offsets visited before the cell.
constexpr int kPredecessors[4][2] = {{-1, 0}, {-1, -1}, {0, -1}, {1, -1}};

bool accent_at(const std::vector<ColorClass>& classes, int cols, int rows, int x, int y) {
  if (x < 0 || x >= cols || y < 0 || y >= rows) return false;
  const std::size_t i = static_cast<std::size_t>(y) * static_cast<std::size_t>(cols) + static_cast<std::size_t>(x);
  return classes[i] != ColorClass::Base;
}

bool accent_predecessor(const std::vector<ColorClass>& classes, int cols, int rows, int x, int y) {
  for (const auto& d : kPredecessors) {
    if (accent_at(classes, cols, rows, x + d[0], y + d[1])) return true;
  }
  return false;
}

} // namespace

std::size_t Grid::count(ColorClass c) const {
  return static_cast<std::size_t>(std::count(color_class_.begin(), color_class_.end(), c));
}

bool has_accent_predecessor(const Grid& g, int x, int y) {
  return accent_predecessor(g.color_classes(), g.cols(), g.rows(), x, y);
}

Grid build_grid(double width, double height, const Params& p) {
  Grid g;
  g.cell_size_ = p.cell_size;
  g.pitch_ = p.pitch();

  if (!(width > 0.0) || !(height > 0.0) || g.pitch_ <= 0) {
    log::debug("Degenerate surface " + std::to_string(width) + "x" + std::to_string(height) + " (pitch " +
               std::to_string(g.pitch_) + "), grid is empty");
    return g;
  }

  const double pitch = static_cast<double>(g.pitch_);
  g.cols_ = static_cast<int>(std::ceil(width / pitch));
  g.rows_ = static_cast<int>(std::ceil(height / pitch));

  const std::size_t n = static_cast<std::size_t>(g.cols_) * static_cast<std::size_t>(g.rows_);
  g.color_class_.assign(n, ColorClass::Base);
  g.bias_.assign(n, 0.0);
  g.activation_.assign(n, 0.0);

  util::HashRng rng(kGridLayoutSeed);
  const double a_cut = p.accent_a_prob;
  const double b_cut = p.accent_a_prob + p.accent_b_prob;

  for (int y = 0; y < g.rows_; ++y) {
    for (int x = 0; x < g.cols_; ++x) {
      const std::size_t i = g.index(x, y);
      g.bias_[i] = rng.next_u01() * 2.0 - 1.0;

      // A blocked cell does not consume a class draw.
      if (accent_predecessor(g.color_class_, g.cols_, g.rows_, x, y)) continue;

      const double r = rng.next_u01();
      if (r < a_cut) {
        g.color_class_[i] = ColorClass::AccentA;
      } else if (r < b_cut) {
        g.color_class_[i] = ColorClass::AccentB;
      }
    }
  }

  log::info("Grid built: " + std::to_string(g.cols_) + "x" + std::to_string(g.rows_) + " (" + std::to_string(n) +
            " cells, " + std::to_string(g.count(ColorClass::AccentA)) + " accent A, " +
            std::to_string(g.count(ColorClass::AccentB)) + " accent B)");
  return g;
}

} // namespace driftgrid
