#pragma once

#include <cstdint>

#include "shipcoord/core/session_config.h"
#include "shipcoord/core/types.h"
#include "shipcoord/util/hash_rng.h"

namespace shipcoord {

// One recorded mining attempt. Immutable once stored in the session.
struct MiningOutcome {
  int round{0};
  Asteroid asteroid{Asteroid::Alpha};
  Depth depth{Depth::Shallow};
  IntelState intel_state{IntelState::None};
  double probability{0.0};
  double draw{0.0};
  // 1-based position of the draw in the session's mining stream.
  std::uint64_t draw_index{0};
  bool success{false};
  int minerals{0};
  int cost{0};
};

// Stream tag separating the mining draws from other seed-derived streams.
inline constexpr std::uint64_t kMiningStreamTag = 0x4D494E45ULL;

// Seeded generator for a session's mining draws.
inline util::HashRng make_mining_rng(std::uint64_t seed) {
  return util::HashRng(util::derive_stream_seed(seed, kMiningStreamTag));
}

// Depth x intel-state probability lookup plus a single uniform draw.
class ProbabilityResolver {
 public:
  explicit ProbabilityResolver(const ProbabilityMatrix& matrix) : matrix_(matrix) {}

  double probability(Depth depth, IntelState state) const { return matrix_.at(depth, state); }

  // Draws exactly one value in [0,1) from rng; success iff draw < p.
  // On success minerals = success_yield, otherwise 0.
  // round/asteroid/cost are left for the caller to fill in.
  MiningOutcome resolve(Depth depth, IntelState state, int success_yield, util::HashRng& rng) const;

 private:
  ProbabilityMatrix matrix_;
};

} // namespace shipcoord
