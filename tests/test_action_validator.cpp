#include <iostream>

#include "shipcoord/core/action_validator.h"
#include "shipcoord/core/resource_ledger.h"
#include "shipcoord/core/session_config.h"

#define SC_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

shipcoord::RejectReason reason(shipcoord::Role role, const shipcoord::Action& a,
                               const shipcoord::ValidationContext& ctx) {
  return shipcoord::validate_action(role, a, ctx).reason;
}

} // namespace

int test_action_validator() {
  using namespace shipcoord;

  SessionConfig cfg;
  ResourceLedger ledger(cfg.pu_per_round);

  ValidationContext ctx;
  ctx.config = &cfg;
  ctx.ledger = &ledger;
  ctx.status = SessionStatus::Running;
  ctx.current_round = 1;
  ctx.submitted_round = 1;
  ctx.stage = Stage::Action;
  ctx.location = Asteroid::Alpha;

  // Role permissions.
  SC_ASSERT(!role_may_submit(Role::Captain, ActionKind::NoOp));
  SC_ASSERT(role_may_submit(Role::Navigator, ActionKind::Travel));
  SC_ASSERT(role_may_submit(Role::Navigator, ActionKind::SendProbe));
  SC_ASSERT(!role_may_submit(Role::Navigator, ActionKind::Mine));
  SC_ASSERT(role_may_submit(Role::Driller, ActionKind::Mine));
  SC_ASSERT(role_may_submit(Role::Driller, ActionKind::DeployRobot));
  SC_ASSERT(!role_may_submit(Role::Driller, ActionKind::Travel));

  // Happy paths.
  SC_ASSERT(validate_action(Role::Navigator, Travel{Asteroid::Gamma}, ctx).accepted);
  SC_ASSERT(validate_action(Role::Navigator, SendProbe{}, ctx).accepted);
  SC_ASSERT(validate_action(Role::Driller, Mine{Depth::Deep, std::nullopt}, ctx).accepted);
  SC_ASSERT(validate_action(Role::Driller, NoOp{}, ctx).accepted);

  // Role checks.
  SC_ASSERT(reason(Role::Captain, NoOp{}, ctx) == RejectReason::RoleViolation);
  SC_ASSERT(reason(Role::Navigator, Mine{Depth::Shallow, std::nullopt}, ctx) == RejectReason::RoleViolation);
  SC_ASSERT(reason(Role::Driller, Travel{Asteroid::Beta}, ctx) == RejectReason::RoleViolation);

  // Stage checks come first: a Captain outside Action gets StageViolation.
  {
    ValidationContext c = ctx;
    c.stage = Stage::Briefing;
    SC_ASSERT(reason(Role::Captain, NoOp{}, c) == RejectReason::StageViolation);
    SC_ASSERT(reason(Role::Navigator, Travel{Asteroid::Beta}, c) == RejectReason::StageViolation);

    c.stage = Stage::Result;
    SC_ASSERT(reason(Role::Navigator, Travel{Asteroid::Beta}, c) == RejectReason::StageViolation);
    c.role_has_action = true;
    SC_ASSERT(reason(Role::Navigator, Travel{Asteroid::Beta}, c) == RejectReason::DuplicateAction);

    c = ctx;
    c.submitted_round = 2;
    SC_ASSERT(reason(Role::Navigator, Travel{Asteroid::Beta}, c) == RejectReason::StageViolation);
    c.current_round = 3;
    c.role_has_action = true;
    SC_ASSERT(reason(Role::Navigator, Travel{Asteroid::Beta}, c) == RejectReason::DuplicateAction);

    c = ctx;
    c.status = SessionStatus::Complete;
    SC_ASSERT(reason(Role::Navigator, Travel{Asteroid::Beta}, c) == RejectReason::StageViolation);
    c.status = SessionStatus::Pending;
    SC_ASSERT(reason(Role::Navigator, Travel{Asteroid::Beta}, c) == RejectReason::StageViolation);
  }

  // Caps are role violations.
  {
    ValidationContext c = ctx;
    c.probes_used = cfg.probe_cap.limit;
    SC_ASSERT(reason(Role::Navigator, SendProbe{}, c) == RejectReason::RoleViolation);
    c.robots_used = cfg.robot_cap.limit;
    SC_ASSERT(reason(Role::Driller, DeployRobot{}, c) == RejectReason::RoleViolation);
    // Mining is never capped.
    SC_ASSERT(validate_action(Role::Driller, Mine{Depth::Shallow, std::nullopt}, c).accepted);
  }

  // Resource checks use the other role's hold.
  {
    ResourceLedger l(4);
    l.hold(Role::Navigator, 3);
    ValidationContext c = ctx;
    c.ledger = &l;
    SC_ASSERT(reason(Role::Driller, Mine{Depth::Deep, std::nullopt}, c) == RejectReason::InsufficientPU);
    SC_ASSERT(validate_action(Role::Driller, Mine{Depth::Shallow, std::nullopt}, c).accepted);
    // The Navigator's own hold does not count against a replacement.
    SC_ASSERT(validate_action(Role::Navigator, Travel{Asteroid::Omega}, c).accepted);

    ResourceLedger tight(2);
    c.ledger = &tight;
    SC_ASSERT(reason(Role::Navigator, Travel{Asteroid::Omega}, c) == RejectReason::InsufficientPU);
    SC_ASSERT(validate_action(Role::Navigator, Travel{Asteroid::Gamma}, c).accepted);
  }

  // Resource is checked before domain.
  {
    ResourceLedger empty(0);
    ValidationContext c = ctx;
    c.ledger = &empty;
    SC_ASSERT(reason(Role::Driller, Mine{Depth::Shallow, Asteroid::Omega}, c) == RejectReason::InsufficientPU);
    SC_ASSERT(validate_action(Role::Driller, NoOp{}, c).accepted);
  }

  // Domain checks.
  {
    // Travelling home while at home is a zero-cost move.
    ResourceLedger empty(0);
    ValidationContext c = ctx;
    c.ledger = &empty;
    SC_ASSERT(c.location == Asteroid::Alpha);
    SC_ASSERT(action_cost(cfg, Travel{Asteroid::Alpha}) == 0);
    SC_ASSERT(validate_action(Role::Navigator, Travel{Asteroid::Alpha}, c).accepted);

    c.ledger = ctx.ledger;
    c.location = Asteroid::Beta;
    SC_ASSERT(reason(Role::Navigator, Travel{Asteroid::Beta}, c) == RejectReason::InvalidTarget);
    SC_ASSERT(validate_action(Role::Navigator, Travel{Asteroid::Alpha}, c).accepted);
  }
  SC_ASSERT(reason(Role::Navigator, SendProbe{Asteroid::Beta}, ctx) == RejectReason::InvalidTarget);
  SC_ASSERT(validate_action(Role::Navigator, SendProbe{Asteroid::Alpha}, ctx).accepted);
  SC_ASSERT(reason(Role::Driller, Mine{Depth::Deep, Asteroid::Gamma}, ctx) == RejectReason::InvalidTarget);
  SC_ASSERT(reason(Role::Driller, DeployRobot{Asteroid::Gamma}, ctx) == RejectReason::InvalidTarget);
  {
    ValidationContext c = ctx;
    c.mined[asteroid_index(Asteroid::Alpha)] = true;
    SC_ASSERT(reason(Role::Driller, Mine{Depth::Shallow, std::nullopt}, c) == RejectReason::InvalidTarget);
    SC_ASSERT(validate_action(Role::Driller, DeployRobot{}, c).accepted);

    SessionConfig repeat = cfg;
    repeat.allow_repeat_mining = true;
    c.config = &repeat;
    SC_ASSERT(validate_action(Role::Driller, Mine{Depth::Shallow, std::nullopt}, c).accepted);
  }

  // A missing config or ledger never validates.
  {
    ValidationContext c = ctx;
    c.ledger = nullptr;
    SC_ASSERT(!validate_action(Role::Navigator, NoOp{}, c).accepted);
  }

  return 0;
}
