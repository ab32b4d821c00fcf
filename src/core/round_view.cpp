#include "shipcoord/core/round_view.h"

#include <algorithm>

#include "shipcoord/core/session_state.h"

namespace shipcoord {

bool message_visible_to(const ChatMessage& m, Role role) {
  if (!m.to) return true;
  return m.from == role || *m.to == role;
}

RoundView build_round_view(const SessionState& s, Role role, TimeMs now) {
  const SessionConfig& cfg = s.config;
  const RoundState& r = s.round;

  RoundView v;
  v.crew_id = s.crew_id;
  v.role = role;
  v.round = r.number;
  v.training = cfg.rounds.training && r.number == 0;
  v.last_round = cfg.last_round();
  v.status = s.status;
  v.stage = r.stage;
  v.stage_entered_ms = r.stage_entered_ms;
  v.deadline_ms = r.deadline_ms;
  v.remaining_ms = s.status == SessionStatus::Running ? std::max<TimeMs>(0, r.deadline_ms - now) : 0;

  v.pu_per_round = r.ledger.per_round();
  v.pu_remaining = r.ledger.remaining();
  v.pu_available = r.ledger.available_for(role);
  v.location = s.location;

  v.own_action = r.actions[role_index(role)];
  v.can_act = s.status == SessionStatus::Running && r.stage == Stage::Action && role != Role::Captain;

  const int probes_used = cfg.probe_cap.scope == CapScope::Session ? s.probes_total : r.probes;
  const int robots_used = cfg.robot_cap.scope == CapScope::Session ? s.robots_total : r.robots;
  v.probes_left = std::max(0, cfg.probe_cap.limit - probes_used);
  v.robots_left = std::max(0, cfg.robot_cap.limit - robots_used);

  v.cumulative_minerals = s.cumulative_minerals;
  if (!s.outcomes.empty()) v.last_outcome = s.outcomes.back();

  for (Asteroid a : kAllAsteroids) {
    RoundView::AsteroidRow& row = v.asteroids[asteroid_index(a)];
    row.asteroid = a;
    row.travel_cost = cfg.travel_cost(a);
    row.here = a == s.location;
    row.mined = s.mined[asteroid_index(a)];
    row.max_minerals = s.intel.known_value(role, a, IntelKind::MaxMinerals, r.number);
    row.shallow_cost = s.intel.known_value(role, a, IntelKind::ShallowCost, r.number);
    row.deep_cost = s.intel.known_value(role, a, IntelKind::DeepCost, r.number);
  }

  v.intel = s.intel.visible_facts(role, r.number);

  for (const auto& m : r.messages) {
    if (message_visible_to(m, role)) v.messages.push_back(m);
  }
  return v;
}

} // namespace shipcoord
