#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <vector>

#include "shipcoord/core/action.h"
#include "shipcoord/core/crew.h"
#include "shipcoord/core/events.h"
#include "shipcoord/core/intel_store.h"
#include "shipcoord/core/probability.h"
#include "shipcoord/core/resource_ledger.h"
#include "shipcoord/core/session_config.h"
#include "shipcoord/core/types.h"
#include "shipcoord/util/hash_rng.h"

namespace shipcoord {

struct RoundState {
  int number{0};
  Stage stage{Stage::Briefing};
  TimeMs stage_entered_ms{0};
  TimeMs deadline_ms{0};

  // Accepted action per role. Once the Action stage ends every Navigator and
  // Driller entry is set (an implicit NoOp stands in for a missing one).
  std::array<std::optional<Action>, kRoleCount> actions{};

  ResourceLedger ledger;
  std::vector<ChatMessage> messages;

  // Resolved probe/robot actions in this round.
  int probes{0};
  int robots{0};

  bool resolved{false};
};

// The whole mutable state of one crew's session.
//
// Owned by Session and passed by reference to RoundMachine. Nothing in here
// is shared between crews.
struct SessionState {
  CrewId crew_id{kInvalidCrewId};
  SessionConfig config;
  Crew crew;
  AsteroidField field{};

  SessionStatus status{SessionStatus::Pending};
  Asteroid location{kHomeAsteroid};
  std::array<bool, kAsteroidCount> mined{};

  IntelStore intel;
  util::HashRng rng;

  RoundState round;
  std::vector<RoundState> archive;

  std::vector<MiningOutcome> outcomes;
  std::vector<RoundResolvedEvent> resolved;

  std::vector<SessionEvent> events;
  std::uint64_t next_event_seq{1};

  // Resolved probe/robot actions since the session (or the post-training
  // reset) began.
  int probes_total{0};
  int robots_total{0};

  int cumulative_minerals{0};
  int training_minerals{0};
  int cumulative_pu_spent{0};
  std::array<int, kRoleCount> pu_spent_by_role{};

  TimeMs created_ms{0};
  TimeMs started_ms{0};
  TimeMs ended_ms{0};
};

} // namespace shipcoord
