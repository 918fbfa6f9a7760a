#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace driftgrid::util {

// splitmix64 (Sebastiano Vigna): a small 64-bit mixer. Used both as a
// stateless hash and as the step function of HashRng.
//
// Not cryptographically secure.
inline std::uint64_t splitmix64(std::uint64_t x) {
  x += 0x9e3779b97f4a7c15ULL;
  x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
  x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
  return x ^ (x >> 31);
}

// Top 53 bits of a 64-bit word as a double in [0,1).
inline double u01_from_u64(std::uint64_t x) {
  return static_cast<double>(x >> 11) * (1.0 / 9007199254740992.0); // 2^53
}

// FNV-1a over the bytes of a string. Stable across platforms and runs, so it
// is safe to derive persistent seeds from human-readable names.
inline std::uint64_t fnv1a_64(std::string_view s) {
  std::uint64_t h = 0xcbf29ce484222325ULL;
  for (unsigned char c : s) {
    h ^= static_cast<std::uint64_t>(c);
    h *= 0x100000001b3ULL;
  }
  return h;
}

// Seed derived from a name ("macro", "grid-layout-fixed", ...).
inline std::uint64_t seed_from_string(std::string_view name) { return splitmix64(fnv1a_64(name)); }

// Deterministic sequential RNG. Two instances constructed from the same seed
// produce the same sequence on every platform.
struct HashRng {
  std::uint64_t s{0};

  explicit HashRng(std::uint64_t seed) : s(seed) {}
  explicit HashRng(std::string_view name) : s(seed_from_string(name)) {}

  std::uint64_t next_u64() {
    s = splitmix64(s);
    return s;
  }

  // [0,1)
  double next_u01() { return u01_from_u64(next_u64()); }

  // [lo,hi)
  double range(double lo, double hi) { return lo + (hi - lo) * next_u01(); }

  // Unbiased index in [0, n). Rejection sampling avoids modulo bias.
  std::size_t index(std::size_t n) {
    if (n <= 1) return 0;
    const std::uint64_t bound = static_cast<std::uint64_t>(n);
    const std::uint64_t threshold = (std::uint64_t(0) - bound) % bound;
    for (;;) {
      const std::uint64_t r = next_u64();
      if (r >= threshold) return static_cast<std::size_t>(r % bound);
    }
  }
};

} // namespace driftgrid::util
