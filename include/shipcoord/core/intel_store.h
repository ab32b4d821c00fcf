#pragma once

#include <optional>
#include <vector>

#include "shipcoord/core/types.h"

namespace shipcoord {

// A discovered (true) value of an asteroid.
struct IntelFact {
  Asteroid asteroid{Asteroid::Alpha};
  IntelKind kind{IntelKind::MaxMinerals};
  int value{0};
  Role discoverer{Role::Navigator};
  int round{0};
};

// Append-only store of intel facts plus the visibility policy.
//
// Visibility rule:
//   Low complexity  -> every fact is visible to every role immediately.
//   High complexity -> visible to the discoverer immediately, and to the rest
//                      of the crew from the round after discovery onward.
class IntelStore {
 public:
  explicit IntelStore(Complexity complexity = Complexity::High) : complexity_(complexity) {}

  Complexity complexity() const { return complexity_; }

  // Appends the fact unless one with the same (asteroid, kind, value) exists.
  // Returns true if appended.
  bool record(const IntelFact& fact);

  // Drops every fact (post-training reset).
  void clear() { facts_.clear(); }

  const std::vector<IntelFact>& facts() const { return facts_; }

  bool visible_to(Role role, const IntelFact& fact, int current_round) const;

  // Facts visible to the role in current_round, in discovery order.
  std::vector<IntelFact> visible_facts(Role role, int current_round) const;

  // Most recently discovered visible value for (asteroid, kind), if any.
  std::optional<int> known_value(Role role, Asteroid asteroid, IntelKind kind, int current_round) const;

  // Probe knowledge = a visible MaxMinerals fact; robot knowledge = a visible
  // ShallowCost or DeepCost fact.
  IntelState intel_state_for(Role role, Asteroid asteroid, int current_round) const;

 private:
  Complexity complexity_{Complexity::High};
  std::vector<IntelFact> facts_;
};

} // namespace shipcoord
