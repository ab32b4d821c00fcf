#include "shipcoord/core/crew.h"

#include "shipcoord/core/enum_strings.h"

namespace shipcoord {

std::optional<Role> Crew::role_of(const std::string& participant_id) const {
  if (participant_id.empty()) return std::nullopt;
  for (Role r : kAllRoles) {
    if (slot(r).participant_id == participant_id) return r;
  }
  return std::nullopt;
}

Crew make_crew(const std::string& captain, const std::string& navigator, const std::string& driller,
               bool ai_captain) {
  Crew c;
  c.slot(Role::Captain) = CrewSlot{captain, ai_captain};
  c.slot(Role::Navigator) = CrewSlot{navigator, false};
  c.slot(Role::Driller) = CrewSlot{driller, false};
  return c;
}

std::vector<std::string> validate_crew(const Crew& crew, CaptainType captain_type) {
  std::vector<std::string> errors;

  for (Role r : kAllRoles) {
    const CrewSlot& s = crew.slot(r);
    if (s.participant_id.empty()) {
      errors.push_back(std::string("crew slot '") + role_to_string(r) + "' is not bound to a participant");
    }
    if (r != Role::Captain && s.ai) {
      errors.push_back(std::string("crew slot '") + role_to_string(r) + "' cannot be filled by an AI");
    }
  }

  for (std::size_t i = 0; i < kRoleCount; ++i) {
    for (std::size_t j = i + 1; j < kRoleCount; ++j) {
      const std::string& a = crew.slots[i].participant_id;
      if (!a.empty() && a == crew.slots[j].participant_id) {
        errors.push_back("participant '" + a + "' is bound to more than one role");
      }
    }
  }

  const bool ai_captain = crew.slot(Role::Captain).ai;
  if (captain_type == CaptainType::Llm && !ai_captain) {
    errors.push_back("captain_type is llm but the captain slot is not an AI participant");
  } else if (captain_type == CaptainType::Human && ai_captain) {
    errors.push_back("captain_type is human but the captain slot is an AI participant");
  }

  return errors;
}

} // namespace shipcoord
