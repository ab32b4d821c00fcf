#pragma once

#include <array>

#include "shipcoord/core/action.h"
#include "shipcoord/core/types.h"

namespace shipcoord {

struct SessionConfig;
class ResourceLedger;

// Everything the validator needs to judge one submission. Built by the round
// machine from the live session state; the validator never mutates it.
struct ValidationContext {
  const SessionConfig* config{nullptr};
  const ResourceLedger* ledger{nullptr};

  SessionStatus status{SessionStatus::Pending};
  int current_round{0};
  Stage stage{Stage::Briefing};

  // Round number named by the submitter.
  int submitted_round{0};

  // True if the role already has a recorded action for submitted_round: an
  // accepted submission, or the implicit No-Op substituted at the deadline.
  bool role_has_action{false};

  Asteroid location{kHomeAsteroid};
  std::array<bool, kAsteroidCount> mined{};

  // Resolved probes/robots counted within the configured cap scope.
  int probes_used{0};
  int robots_used{0};
};

// Whether a role may ever submit this kind of action.
// Navigator: NoOp, Travel, SendProbe. Driller: NoOp, DeployRobot, Mine.
// Captain: nothing.
bool role_may_submit(Role role, ActionKind kind);

// Validate a submission. Checks run in order and the first failure wins:
//   1. stage    -> StageViolation / DuplicateAction
//   2. role     -> RoleViolation (kind not allowed, probe/robot cap reached)
//   3. resource -> InsufficientPU (cost > ledger->available_for(role))
//   4. domain   -> InvalidTarget
ActionVerdict validate_action(Role role, const Action& action, const ValidationContext& ctx);

} // namespace shipcoord
