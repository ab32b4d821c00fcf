#pragma once

#include <cstdint>

namespace shipcoord::util {

// splitmix64: fast deterministic mixing / RNG step (Sebastiano Vigna).
//
// IMPORTANT: This is *not* a cryptographically secure RNG. It is used for
// reproducible research runs, where the same seed must replay the same draws.
inline std::uint64_t splitmix64(std::uint64_t x) {
  x += 0x9e3779b97f4a7c15ULL;
  x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
  x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
  return x ^ (x >> 31);
}

// Convert a 64-bit word into a double in [0,1) using the top 53 bits.
inline double u01_from_u64(std::uint64_t x) {
  const std::uint64_t v = x >> 11;
  return static_cast<double>(v) * (1.0 / 9007199254740992.0); // 2^53
}

// Unbiased bounded random integer in [0, bound_exclusive) via rejection sampling.
inline std::uint64_t bounded_u64(std::uint64_t& state, std::uint64_t bound_exclusive) {
  if (bound_exclusive <= 1) return 0;
  const std::uint64_t threshold = (std::uint64_t(0) - bound_exclusive) % bound_exclusive;
  for (;;) {
    state = splitmix64(state);
    if (state >= threshold) return state % bound_exclusive;
  }
}

// Derive an independent stream seed from a base seed and a stream tag, so
// field generation and mining draws never share a sequence.
inline std::uint64_t derive_stream_seed(std::uint64_t seed, std::uint64_t stream_tag) {
  return splitmix64(seed ^ splitmix64(stream_tag));
}

struct HashRng {
  std::uint64_t s{0};
  // Number of words drawn since seeding. Persisted with the state so a
  // resumed session can report the draw position of each outcome.
  std::uint64_t draws{0};

  HashRng() = default;
  explicit HashRng(std::uint64_t seed) : s(seed) {}

  std::uint64_t next_u64() {
    ++draws;
    s = splitmix64(s);
    return s;
  }

  double next_u01() { return u01_from_u64(next_u64()); }

  // Inclusive integer range.
  int range_int(int lo_incl, int hi_incl) {
    if (hi_incl < lo_incl) {
      const int t = lo_incl;
      lo_incl = hi_incl;
      hi_incl = t;
    }
    ++draws;
    const std::uint64_t span = static_cast<std::uint64_t>(hi_incl - lo_incl) + 1ULL;
    return lo_incl + static_cast<int>(bounded_u64(s, span));
  }
};

} // namespace shipcoord::util
