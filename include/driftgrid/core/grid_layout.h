#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace driftgrid {

struct Params;
class TemporalSmoother;

enum class ColorClass : std::uint8_t { Base = 0, AccentA = 1, AccentB = 2 };

// Seed name of the layout sequence. Constant across rebuilds, so a given grid
// shape always receives the same biases and colour classes.
inline constexpr const char* kGridLayoutSeed = "grid-layout-fixed";

// Cell layout for one surface size.
//
// bias and colour class are fixed at build time. activation is the only
// per-cell state that survives between frames; TemporalSmoother is its only
// writer, everything else gets read-only access.
class Grid {
 public:
  Grid() = default;

  int cols() const { return cols_; }
  int rows() const { return rows_; }
  int cell_size() const { return cell_size_; }
  int pitch() const { return pitch_; }
  std::size_t cell_count() const { return color_class_.size(); }
  bool empty() const { return color_class_.empty(); }

  std::size_t index(int x, int y) const {
    return static_cast<std::size_t>(y) * static_cast<std::size_t>(cols_) + static_cast<std::size_t>(x);
  }

  ColorClass color_class(std::size_t i) const { return color_class_[i]; }
  double bias(std::size_t i) const { return bias_[i]; }
  double activation(std::size_t i) const { return activation_[i]; }

  const std::vector<ColorClass>& color_classes() const { return color_class_; }
  const std::vector<double>& biases() const { return bias_; }
  const std::vector<double>& activations() const { return activation_; }

  std::size_t count(ColorClass c) const;

 private:
  friend Grid build_grid(double width, double height, const Params& p);
  friend class TemporalSmoother;

  int cols_{0};
  int rows_{0};
  int cell_size_{0};
  int pitch_{0};
  std::vector<ColorClass> color_class_;
  std::vector<double> bias_;
  std::vector<double> activation_;
};

// Lays out cols = ceil(width / pitch) by rows = ceil(height / pitch) cells.
//
// Cells are visited in raster order. Each draws a bias in [-1,1); unless one
// of its already-visited neighbours (left, up-left, up, up-right) holds an
// accent, it then draws its class: AccentA below accent_a_prob, AccentB below
// accent_a_prob + accent_b_prob, Base otherwise. Accents can still touch
// neighbours visited later.
//
// Non-positive dimensions or pitch yield an empty grid. All activations
// start at 0.
Grid build_grid(double width, double height, const Params& p);

// True when cell (x, y) has an accent among its already-visited neighbours.
bool has_accent_predecessor(const Grid& g, int x, int y);

} // namespace driftgrid
