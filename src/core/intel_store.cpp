#include "shipcoord/core/intel_store.h"

namespace shipcoord {

bool IntelStore::record(const IntelFact& fact) {
  for (const auto& f : facts_) {
    if (f.asteroid == fact.asteroid && f.kind == fact.kind && f.value == fact.value) return false;
  }
  facts_.push_back(fact);
  return true;
}

bool IntelStore::visible_to(Role role, const IntelFact& fact, int current_round) const {
  if (complexity_ == Complexity::Low) return true;
  if (fact.discoverer == role) return true;
  return fact.round < current_round;
}

std::vector<IntelFact> IntelStore::visible_facts(Role role, int current_round) const {
  std::vector<IntelFact> out;
  for (const auto& f : facts_) {
    if (visible_to(role, f, current_round)) out.push_back(f);
  }
  return out;
}

std::optional<int> IntelStore::known_value(Role role, Asteroid asteroid, IntelKind kind, int current_round) const {
  // Facts are stored in discovery order; the last visible one wins.
  for (auto it = facts_.rbegin(); it != facts_.rend(); ++it) {
    if (it->asteroid != asteroid || it->kind != kind) continue;
    if (visible_to(role, *it, current_round)) return it->value;
  }
  return std::nullopt;
}

IntelState IntelStore::intel_state_for(Role role, Asteroid asteroid, int current_round) const {
  bool probe = false;
  bool robot = false;
  for (const auto& f : facts_) {
    if (f.asteroid != asteroid || !visible_to(role, f, current_round)) continue;
    if (f.kind == IntelKind::MaxMinerals) {
      probe = true;
    } else {
      robot = true;
    }
  }
  return make_intel_state(probe, robot);
}

} // namespace shipcoord
