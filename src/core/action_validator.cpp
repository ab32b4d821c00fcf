#include "shipcoord/core/action_validator.h"

#include "shipcoord/core/resource_ledger.h"
#include "shipcoord/core/session_config.h"

namespace shipcoord {
namespace {

RejectReason check_stage(const ValidationContext& ctx) {
  if (ctx.status != SessionStatus::Running) return RejectReason::StageViolation;

  if (ctx.submitted_round != ctx.current_round) {
    // An earlier round the role acted in is closed for good.
    if (ctx.submitted_round < ctx.current_round && ctx.role_has_action) return RejectReason::DuplicateAction;
    return RejectReason::StageViolation;
  }

  if (ctx.stage != Stage::Action) {
    if (ctx.stage == Stage::Result && ctx.role_has_action) return RejectReason::DuplicateAction;
    return RejectReason::StageViolation;
  }
  return RejectReason::None;
}

RejectReason check_role(Role role, const Action& action, const ValidationContext& ctx) {
  const ActionKind kind = action_kind(action);
  if (!role_may_submit(role, kind)) return RejectReason::RoleViolation;

  const SessionConfig& cfg = *ctx.config;
  if (kind == ActionKind::SendProbe && ctx.probes_used >= cfg.probe_cap.limit) return RejectReason::RoleViolation;
  if (kind == ActionKind::DeployRobot && ctx.robots_used >= cfg.robot_cap.limit) return RejectReason::RoleViolation;
  return RejectReason::None;
}

RejectReason check_resource(Role role, const Action& action, const ValidationContext& ctx) {
  const int cost = action_cost(*ctx.config, action);
  if (cost > ctx.ledger->available_for(role)) return RejectReason::InsufficientPU;
  return RejectReason::None;
}

RejectReason check_domain(const Action& action, const ValidationContext& ctx) {
  if (const auto* t = std::get_if<Travel>(&action)) {
    // Home stays reachable (at no cost) while the crew is already there.
    if (t->destination == ctx.location && t->destination != kHomeAsteroid) return RejectReason::InvalidTarget;
    return RejectReason::None;
  }

  if (const auto target = action_target(action)) {
    if (*target != ctx.location) return RejectReason::InvalidTarget;
  }

  if (std::holds_alternative<Mine>(action)) {
    if (ctx.mined[asteroid_index(ctx.location)] && !ctx.config->allow_repeat_mining) {
      return RejectReason::InvalidTarget;
    }
  }
  return RejectReason::None;
}

} // namespace

bool role_may_submit(Role role, ActionKind kind) {
  switch (role) {
    case Role::Captain:
      return false;
    case Role::Navigator:
      return kind == ActionKind::NoOp || kind == ActionKind::Travel || kind == ActionKind::SendProbe;
    case Role::Driller:
      return kind == ActionKind::NoOp || kind == ActionKind::DeployRobot || kind == ActionKind::Mine;
  }
  return false;
}

ActionVerdict validate_action(Role role, const Action& action, const ValidationContext& ctx) {
  if (!ctx.config || !ctx.ledger) return ActionVerdict::reject(RejectReason::StageViolation);

  RejectReason r = check_stage(ctx);
  if (r == RejectReason::None) r = check_role(role, action, ctx);
  if (r == RejectReason::None) r = check_resource(role, action, ctx);
  if (r == RejectReason::None) r = check_domain(action, ctx);

  if (r != RejectReason::None) return ActionVerdict::reject(r);
  return ActionVerdict::accept();
}

} // namespace shipcoord
