#include "shipcoord/core/probability.h"

#include <algorithm>

namespace shipcoord {

MiningOutcome ProbabilityResolver::resolve(Depth depth, IntelState state, int success_yield,
                                           util::HashRng& rng) const {
  MiningOutcome out;
  out.depth = depth;
  out.intel_state = state;
  out.probability = probability(depth, state);
  out.draw = rng.next_u01();
  out.draw_index = rng.draws;
  out.success = out.draw < out.probability;
  out.minerals = out.success ? std::max(0, success_yield) : 0;
  return out;
}

} // namespace shipcoord
