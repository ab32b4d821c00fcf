#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "shipcoord/core/types.h"

namespace shipcoord {

struct CrewSlot {
  // External participant identifier (opaque to the engine).
  std::string participant_id;
  // True if the slot is driven by an AI client (only meaningful for the Captain).
  bool ai{false};
};

// Three participant slots, one per role. Role assignment is fixed for the
// lifetime of a session.
struct Crew {
  std::array<CrewSlot, kRoleCount> slots;

  CrewSlot& slot(Role r) { return slots[role_index(r)]; }
  const CrewSlot& slot(Role r) const { return slots[role_index(r)]; }

  // Role bound to a participant, if any.
  std::optional<Role> role_of(const std::string& participant_id) const;
};

// Convenience constructor for the common case.
Crew make_crew(const std::string& captain, const std::string& navigator, const std::string& driller,
               bool ai_captain = false);

// Returns human-readable problems; empty means the crew can start a session.
//
// Every slot must be bound, no participant may hold two roles, only the
// Captain slot may be an AI, and an LLM-captain session needs an AI captain.
std::vector<std::string> validate_crew(const Crew& crew, CaptainType captain_type);

} // namespace shipcoord
