#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "shipcoord/core/action.h"
#include "shipcoord/core/intel_store.h"
#include "shipcoord/core/probability.h"
#include "shipcoord/core/types.h"

namespace shipcoord {

// A persistent, human-readable session log entry.
struct SessionEvent {
  // Monotonic sequence number (1..N) within a session. Never reused, even
  // when old events are pruned by max_events.
  std::uint64_t seq{0};
  int round{0};
  TimeMs time_ms{0};
  EventLevel level{EventLevel::Info};
  EventCategory category{EventCategory::Session};
  std::string message;
};

// Briefing-stage chat line. to == nullopt means crew-wide.
struct ChatMessage {
  int round{0};
  Role from{Role::Captain};
  std::optional<Role> to;
  std::string text;
  TimeMs sent_at_ms{0};
};

// How one role's action played out during resolution.
struct ResolvedStep {
  Action action{NoOp{}};
  // False if the step was skipped (already-mined asteroid) or degraded.
  bool applied{false};
  int cost{0};
};

// Emitted exactly once per round, right after the Result stage resolves.
struct RoundResolvedEvent {
  int round{0};
  bool training{false};

  Asteroid location_before{kHomeAsteroid};
  Asteroid location_after{kHomeAsteroid};

  // Indexed by Role. The Captain entry is always an explicit NoOp.
  std::array<ResolvedStep, kRoleCount> steps{};

  std::optional<MiningOutcome> outcome;
  std::vector<IntelFact> discovered;

  int pu_remaining{0};
  int pu_spent_round{0};

  // Analytics after this round. Training minerals are not counted.
  int cumulative_minerals{0};
  int cumulative_pu_spent{0};
  std::array<int, kRoleCount> cumulative_pu_by_role{};

  // Next-stage metadata.
  bool session_complete{false};
  int next_round{-1};

  TimeMs resolved_at_ms{0};
};

} // namespace shipcoord
