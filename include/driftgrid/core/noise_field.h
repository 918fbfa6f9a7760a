#pragma once

// Seeded 3D simplex noise.
//
// A NoiseField is a repeatable scalar field over (x, y, t). The permutation
// table is shuffled once at construction from the seed; sampling never
// mutates the instance, so identical arguments always return the identical
// value and a field can be shared freely between readers.
//
// Two fields built from different seed names are uncorrelated even when
// sampled at the same coordinates.

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace driftgrid {

class NoiseField {
 public:
  explicit NoiseField(std::string_view seed_name);
  explicit NoiseField(std::uint64_t seed);

  // Value in [-1, 1]. Defined for every finite input.
  double sample(double x, double y, double z) const;

  std::uint64_t seed() const { return seed_; }

 private:
  void shuffle_permutation();

  std::uint64_t seed_{0};
  std::array<std::uint8_t, 512> perm_{};
  std::array<std::uint8_t, 512> perm_mod12_{};
};

// Seed names of the two fields the engine composites.
inline constexpr const char* kMacroNoiseSeed = "macro";
inline constexpr const char* kMicroNoiseSeed = "micro";

} // namespace driftgrid
