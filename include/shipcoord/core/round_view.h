#pragma once

#include <array>
#include <optional>
#include <vector>

#include "shipcoord/core/action.h"
#include "shipcoord/core/events.h"
#include "shipcoord/core/intel_store.h"
#include "shipcoord/core/probability.h"
#include "shipcoord/core/types.h"

namespace shipcoord {

struct SessionState;

// Role-filtered projection of a session, used to render a participant's screen.
//
// Only facts and messages the role is authorized to see are included.
struct RoundView {
  struct AsteroidRow {
    Asteroid asteroid{Asteroid::Alpha};
    int travel_cost{0};
    bool here{false};
    bool mined{false};
    // Values visible to the role; unset when unknown.
    std::optional<int> max_minerals;
    std::optional<int> shallow_cost;
    std::optional<int> deep_cost;
  };

  CrewId crew_id{kInvalidCrewId};
  Role role{Role::Captain};

  int round{0};
  bool training{false};
  int last_round{0};
  SessionStatus status{SessionStatus::Pending};
  Stage stage{Stage::Briefing};
  TimeMs stage_entered_ms{0};
  TimeMs deadline_ms{0};
  TimeMs remaining_ms{0};

  int pu_per_round{0};
  int pu_remaining{0};
  int pu_available{0};

  Asteroid location{kHomeAsteroid};

  // The role's accepted action for this round, if any.
  std::optional<Action> own_action;
  // True if the role may submit right now (Action stage, Navigator/Driller).
  bool can_act{false};

  // Probes/robots still allowed within the configured cap scope.
  int probes_left{0};
  int robots_left{0};

  int cumulative_minerals{0};
  std::optional<MiningOutcome> last_outcome;

  std::array<AsteroidRow, kAsteroidCount> asteroids{};
  std::vector<IntelFact> intel;
  std::vector<ChatMessage> messages;
};

bool message_visible_to(const ChatMessage& m, Role role);

RoundView build_round_view(const SessionState& state, Role role, TimeMs now);

} // namespace shipcoord
