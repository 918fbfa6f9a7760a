#include "driftgrid/core/noise_field.h"

#include <algorithm>
#include <cmath>

#include "driftgrid/util/hash_rng.h"

namespace driftgrid {

namespace {

// Skew/unskew factors for 3D simplex (Gustavson).
constexpr double kF3 = 1.0 / 3.0;
constexpr double kG3 = 1.0 / 6.0;

// Edge midpoints of a cube.
constexpr double kGrad3[12][3] = {
    {1, 1, 0}, {-1, 1, 0}, {1, -1, 0}, {-1, -1, 0},
    {1, 0, 1}, {-1, 0, 1}, {1, 0, -1}, {-1, 0, -1},
    {0, 1, 1}, {0, -1, 1}, {0, 1, -1}, {0, -1, -1},
};

// Lattice coordinate (already floored) reduced to [0, 255]. Works in double so
// coordinates far outside the int range stay defined.
inline int lattice_index(double f) {
  double m = std::fmod(f, 256.0);
  if (m < 0.0) m += 256.0;
  return static_cast<int>(m) & 255;
}

inline double corner(int gi, double x, double y, double z) {
  double t = 0.6 - x * x - y * y - z * z;
  if (t < 0.0) return 0.0;
  t *= t;
  const double* g = kGrad3[gi];
  return t * t * (g[0] * x + g[1] * y + g[2] * z);
}

} // namespace

NoiseField::NoiseField(std::string_view seed_name) : seed_(util::seed_from_string(seed_name)) {
  shuffle_permutation();
}

NoiseField::NoiseField(std::uint64_t seed) : seed_(seed) { shuffle_permutation(); }

void NoiseField::shuffle_permutation() {
  std::array<std::uint8_t, 256> p{};
  for (int i = 0; i < 256; ++i) p[static_cast<std::size_t>(i)] = static_cast<std::uint8_t>(i);

  // Fisher-Yates, driven by the seed.
  util::HashRng rng(seed_);
  for (std::size_t i = 255; i > 0; --i) {
    std::swap(p[i], p[rng.index(i + 1)]);
  }

  for (std::size_t i = 0; i < 512; ++i) {
    perm_[i] = p[i & 255];
    perm_mod12_[i] = static_cast<std::uint8_t>(perm_[i] % 12);
  }
}

double NoiseField::sample(double x, double y, double z) const {
  // Which skewed unit cell are we in?
  const double s = (x + y + z) * kF3;
  const double i = std::floor(x + s);
  const double j = std::floor(y + s);
  const double k = std::floor(z + s);

  const double t = (i + j + k) * kG3;
  const double x0 = x - (i - t);
  const double y0 = y - (j - t);
  const double z0 = z - (k - t);

  // Rank the offsets to pick one of the six tetrahedra.
  int i1, j1, k1, i2, j2, k2;
  if (x0 >= y0) {
    if (y0 >= z0) {
      i1 = 1; j1 = 0; k1 = 0; i2 = 1; j2 = 1; k2 = 0;
    } else if (x0 >= z0) {
      i1 = 1; j1 = 0; k1 = 0; i2 = 1; j2 = 0; k2 = 1;
    } else {
      i1 = 0; j1 = 0; k1 = 1; i2 = 1; j2 = 0; k2 = 1;
    }
  } else {
    if (y0 < z0) {
      i1 = 0; j1 = 0; k1 = 1; i2 = 0; j2 = 1; k2 = 1;
    } else if (x0 < z0) {
      i1 = 0; j1 = 1; k1 = 0; i2 = 0; j2 = 1; k2 = 1;
    } else {
      i1 = 0; j1 = 1; k1 = 0; i2 = 1; j2 = 1; k2 = 0;
    }
  }

  const double x1 = x0 - i1 + kG3;
  const double y1 = y0 - j1 + kG3;
  const double z1 = z0 - k1 + kG3;
  const double x2 = x0 - i2 + 2.0 * kG3;
  const double y2 = y0 - j2 + 2.0 * kG3;
  const double z2 = z0 - k2 + 2.0 * kG3;
  const double x3 = x0 - 1.0 + 3.0 * kG3;
  const double y3 = y0 - 1.0 + 3.0 * kG3;
  const double z3 = z0 - 1.0 + 3.0 * kG3;

  const int ii = lattice_index(i);
  const int jj = lattice_index(j);
  const int kk = lattice_index(k);

  const int gi0 = perm_mod12_[ii + perm_[jj + perm_[kk]]];
  const int gi1 = perm_mod12_[ii + i1 + perm_[jj + j1 + perm_[kk + k1]]];
  const int gi2 = perm_mod12_[ii + i2 + perm_[jj + j2 + perm_[kk + k2]]];
  const int gi3 = perm_mod12_[ii + 1 + perm_[jj + 1 + perm_[kk + 1]]];

  const double n = corner(gi0, x0, y0, z0) + corner(gi1, x1, y1, z1) + corner(gi2, x2, y2, z2) +
                   corner(gi3, x3, y3, z3);

  return std::clamp(32.0 * n, -1.0, 1.0);
}

} // namespace driftgrid
