#include "shipcoord/core/round_machine.h"

#include <sstream>
#include <utility>

#include "shipcoord/core/enum_strings.h"
#include "shipcoord/util/log.h"
#include "shipcoord/util/strings.h"

namespace shipcoord {

bool RoundMachine::is_training(int round_no) const { return s_.config.rounds.training && round_no == 0; }

std::string RoundMachine::tag() const {
  return "crew " + std::to_string(s_.crew_id) + " round " + std::to_string(s_.round.number) + ": ";
}

void RoundMachine::record_event(EventLevel level, EventCategory category, const std::string& message, TimeMs at) {
  SessionEvent ev;
  ev.seq = s_.next_event_seq;
  s_.next_event_seq += 1;
  if (s_.next_event_seq == 0) s_.next_event_seq = 1;

  ev.round = s_.round.number;
  ev.time_ms = at;
  ev.level = level;
  ev.category = category;
  ev.message = message;
  s_.events.push_back(std::move(ev));

  const int max_events = s_.config.max_events;
  if (max_events > 0 && static_cast<int>(s_.events.size()) > max_events) {
    const std::size_t cut = s_.events.size() - static_cast<std::size_t>(max_events);
    s_.events.erase(s_.events.begin(), s_.events.begin() + static_cast<std::ptrdiff_t>(cut));
  }
}

bool RoundMachine::start(TimeMs now) {
  if (s_.status != SessionStatus::Pending) return false;
  s_.status = SessionStatus::Running;
  s_.started_ms = now;
  begin_round(s_.config.first_round(), now);
  record_event(EventLevel::Info, EventCategory::Session, "session started", now);
  log::info(tag() + "session started");
  return true;
}

void RoundMachine::begin_round(int number, TimeMs entered) {
  RoundState r;
  r.number = number;
  r.stage = Stage::Briefing;
  r.stage_entered_ms = entered;
  r.deadline_ms = entered + s_.config.briefing_ms();
  r.ledger.reset(s_.config.pu_per_round);
  s_.round = std::move(r);

  record_event(EventLevel::Info, EventCategory::Stage,
               std::string(is_training(number) ? "training round" : "round") + " " + std::to_string(number) +
                   " briefing",
               entered);
  log::debug(tag() + "-> briefing");
}

void RoundMachine::enter_action(TimeMs entered) {
  s_.round.stage = Stage::Action;
  s_.round.stage_entered_ms = entered;
  s_.round.deadline_ms = entered + s_.config.durations.action_ms;
  record_event(EventLevel::Info, EventCategory::Stage, "action stage", entered);
  log::debug(tag() + "-> action");
}

void RoundMachine::close_action(TimeMs at, bool timed_out) {
  for (Role r : {Role::Navigator, Role::Driller}) {
    auto& slot = s_.round.actions[role_index(r)];
    if (slot) continue;
    slot = Action{NoOp{true}};
    const std::string msg = std::string(role_to_string(r)) + " did not act before the deadline; no-op substituted";
    record_event(EventLevel::Warn, EventCategory::Timeout, msg, at);
    log::warn(tag() + msg);
  }
  if (!timed_out) log::debug(tag() + "all crew actions received; closing action stage early");
  enter_result(at);
}

void RoundMachine::enter_result(TimeMs entered) {
  s_.round.stage = Stage::Result;
  s_.round.stage_entered_ms = entered;
  s_.round.deadline_ms = entered + s_.config.durations.result_ms;
  log::debug(tag() + "-> result");
  resolve_round(entered);
}

bool RoundMachine::spend(Role role, int cost, TimeMs now) {
  RoundState& r = s_.round;
  if (!r.ledger.reserve(role, cost)) {
    r.ledger.release_hold(role);
    const std::string msg = std::string(role_to_string(role)) + " action could not be paid (" +
                            std::to_string(cost) + " PU, " + std::to_string(r.ledger.remaining()) +
                            " remaining); treated as no-op";
    record_event(EventLevel::Warn, EventCategory::Skipped, msg, now);
    log::warn(tag() + msg);
    return false;
  }
  if (!is_training(r.number)) {
    s_.pu_spent_by_role[role_index(role)] += cost;
    s_.cumulative_pu_spent += cost;
  }
  return true;
}

void RoundMachine::resolve_round(TimeMs now) {
  RoundState& r = s_.round;
  const SessionConfig& cfg = s_.config;
  const int n = r.number;
  const bool training = is_training(n);

  RoundResolvedEvent ev;
  ev.round = n;
  ev.training = training;
  ev.location_before = s_.location;
  ev.steps[role_index(Role::Captain)] = ResolvedStep{Action{NoOp{}}, true, 0};

  // Navigator first: travel, then probe at the (possibly new) location.
  const Action nav = r.actions[role_index(Role::Navigator)].value_or(Action{NoOp{true}});
  ResolvedStep& ns = ev.steps[role_index(Role::Navigator)];
  ns.action = nav;

  if (const auto* t = std::get_if<Travel>(&nav)) {
    const int cost = cfg.travel_cost(t->destination);
    if (spend(Role::Navigator, cost, now)) {
      s_.location = t->destination;
      ns.applied = true;
      ns.cost = cost;
      record_event(EventLevel::Info, EventCategory::Stage,
                   std::string("crew travelled to ") + asteroid_to_string(s_.location), now);
    }
  } else if (std::holds_alternative<SendProbe>(nav)) {
    const int cost = cfg.costs.probe;
    if (spend(Role::Navigator, cost, now)) {
      const AsteroidProfile& p = s_.field[asteroid_index(s_.location)];
      IntelFact f{s_.location, IntelKind::MaxMinerals, p.max_minerals, Role::Navigator, n};
      if (s_.intel.record(f)) ev.discovered.push_back(f);
      r.probes += 1;
      s_.probes_total += 1;
      ns.applied = true;
      ns.cost = cost;
      record_event(EventLevel::Info, EventCategory::Intel,
                   std::string("navigator probed ") + asteroid_to_string(s_.location) + ": max minerals " +
                       std::to_string(p.max_minerals),
                   now);
    }
  } else {
    ns.applied = true;
  }

  // Driller second: robot, then mine.
  const Action drl = r.actions[role_index(Role::Driller)].value_or(Action{NoOp{true}});
  ResolvedStep& ds = ev.steps[role_index(Role::Driller)];
  ds.action = drl;

  if (std::holds_alternative<DeployRobot>(drl)) {
    const int cost = cfg.costs.robot;
    if (spend(Role::Driller, cost, now)) {
      const AsteroidProfile& p = s_.field[asteroid_index(s_.location)];
      const IntelFact shallow{s_.location, IntelKind::ShallowCost, p.shallow_cost, Role::Driller, n};
      const IntelFact deep{s_.location, IntelKind::DeepCost, p.deep_cost, Role::Driller, n};
      if (s_.intel.record(shallow)) ev.discovered.push_back(shallow);
      if (s_.intel.record(deep)) ev.discovered.push_back(deep);
      r.robots += 1;
      s_.robots_total += 1;
      ds.applied = true;
      ds.cost = cost;
      record_event(EventLevel::Info, EventCategory::Intel,
                   std::string("driller deployed a robot at ") + asteroid_to_string(s_.location) + ": shallow " +
                       std::to_string(p.shallow_cost) + ", deep " + std::to_string(p.deep_cost),
                   now);
    }
  } else if (const auto* m = std::get_if<Mine>(&drl)) {
    const Asteroid loc = s_.location;
    const std::size_t li = asteroid_index(loc);
    if (s_.mined[li] && !cfg.allow_repeat_mining) {
      // Reachable when the crew travelled onto an asteroid mined earlier.
      r.ledger.release_hold(Role::Driller);
      const std::string msg = std::string("mine skipped: ") + asteroid_to_string(loc) + " was already mined";
      record_event(EventLevel::Warn, EventCategory::Skipped, msg, now);
      log::warn(tag() + msg);
    } else {
      const int cost = cfg.mine_cost(m->depth);
      if (spend(Role::Driller, cost, now)) {
        const IntelState state = s_.intel.intel_state_for(Role::Driller, loc, n);
        int yield = cfg.unprobed_yield == UnprobedYield::TrueValue ? s_.field[li].max_minerals
                                                                    : cfg.fallback_minerals;
        if (const auto known = s_.intel.known_value(Role::Driller, loc, IntelKind::MaxMinerals, n)) yield = *known;

        MiningOutcome out = ProbabilityResolver(cfg.probabilities).resolve(m->depth, state, yield, s_.rng);
        out.round = n;
        out.asteroid = loc;
        out.cost = cost;

        s_.mined[li] = true;
        s_.outcomes.push_back(out);
        if (training) {
          s_.training_minerals += out.minerals;
        } else {
          s_.cumulative_minerals += out.minerals;
        }
        ev.outcome = out;
        ds.applied = true;
        ds.cost = cost;

        std::ostringstream ss;
        ss << "mine " << depth_to_string(m->depth) << " at " << asteroid_to_string(loc) << " ("
           << intel_state_to_string(state) << ", p=" << out.probability << ", draw=" << out.draw << "): "
           << (out.success ? "success, +" + std::to_string(out.minerals) + " minerals" : "failure");
        record_event(EventLevel::Info, EventCategory::Mining, ss.str(), now);
      }
    }
  } else {
    ds.applied = true;
  }

  r.ledger.release_hold(Role::Navigator);
  r.ledger.release_hold(Role::Driller);
  r.resolved = true;

  ev.location_after = s_.location;
  ev.pu_remaining = r.ledger.remaining();
  ev.pu_spent_round = r.ledger.spent();
  ev.cumulative_minerals = s_.cumulative_minerals;
  ev.cumulative_pu_spent = s_.cumulative_pu_spent;
  ev.cumulative_pu_by_role = s_.pu_spent_by_role;
  ev.session_complete = n >= cfg.last_round();
  ev.next_round = ev.session_complete ? -1 : n + 1;
  ev.resolved_at_ms = now;
  s_.resolved.push_back(ev);

  std::ostringstream ss;
  ss << "resolved: navigator " << action_to_string(nav) << ", driller " << action_to_string(drl) << ", PU left "
     << ev.pu_remaining << ", minerals " << ev.cumulative_minerals;
  log::info(tag() + ss.str());
}

void RoundMachine::finish_round(TimeMs at) {
  const int n = s_.round.number;
  s_.archive.push_back(s_.round);

  if (n >= s_.config.last_round()) {
    s_.status = SessionStatus::Complete;
    s_.ended_ms = at;
    record_event(EventLevel::Info, EventCategory::Session,
                 "session complete with " + std::to_string(s_.cumulative_minerals) + " minerals", at);
    log::info(tag() + "session complete");
    return;
  }

  if (is_training(n) && s_.config.rounds.reset_after_training) reset_after_training(at);
  begin_round(n + 1, at);
}

void RoundMachine::reset_after_training(TimeMs at) {
  s_.location = kHomeAsteroid;
  s_.mined.fill(false);
  s_.intel.clear();
  s_.probes_total = 0;
  s_.robots_total = 0;
  record_event(EventLevel::Info, EventCategory::Session,
               "training complete; crew returned to " + std::string(asteroid_to_string(kHomeAsteroid)), at);
}

void RoundMachine::advance(TimeMs now) {
  while (s_.status == SessionStatus::Running && now >= s_.round.deadline_ms) {
    const TimeMs at = s_.round.deadline_ms;
    switch (s_.round.stage) {
      case Stage::Briefing:
        enter_action(at);
        break;
      case Stage::Action:
        close_action(at, true);
        break;
      case Stage::Result:
        finish_round(at);
        break;
    }
  }
}

ValidationContext RoundMachine::context_for(Role role, int round_no) const {
  ValidationContext ctx;
  ctx.config = &s_.config;
  ctx.ledger = &s_.round.ledger;
  ctx.status = s_.status;
  ctx.current_round = s_.round.number;
  ctx.stage = s_.round.stage;
  ctx.submitted_round = round_no;
  ctx.location = s_.location;
  ctx.mined = s_.mined;

  if (round_no == s_.round.number) {
    ctx.role_has_action = s_.round.actions[role_index(role)].has_value();
  } else {
    for (const auto& past : s_.archive) {
      if (past.number == round_no && past.actions[role_index(role)]) ctx.role_has_action = true;
    }
  }

  ctx.probes_used = s_.config.probe_cap.scope == CapScope::Session ? s_.probes_total : s_.round.probes;
  ctx.robots_used = s_.config.robot_cap.scope == CapScope::Session ? s_.robots_total : s_.round.robots;
  return ctx;
}

ActionVerdict RoundMachine::submit(int round_no, Role role, const Action& action, TimeMs now) {
  const ActionVerdict v = validate_action(role, action, context_for(role, round_no));
  if (!v.accepted) {
    log::debug(tag() + role_to_string(role) + " " + action_to_string(action) + " rejected: " +
               reject_reason_to_string(v.reason));
    return v;
  }

  RoundState& r = s_.round;
  r.ledger.release_hold(role);
  r.ledger.hold(role, action_cost(s_.config, action));
  r.actions[role_index(role)] = action;
  log::debug(tag() + role_to_string(role) + " " + action_to_string(action) + " accepted");

  if (r.actions[role_index(Role::Navigator)] && r.actions[role_index(Role::Driller)]) close_action(now, false);
  return v;
}

RejectReason RoundMachine::post_message(int round_no, Role from, std::optional<Role> to, const std::string& text,
                                        TimeMs now) {
  if (s_.status != SessionStatus::Running) return RejectReason::StageViolation;
  if (round_no != s_.round.number || s_.round.stage != Stage::Briefing) return RejectReason::StageViolation;
  if (trim(text).empty()) return RejectReason::InvalidTarget;
  if (to && *to == from) return RejectReason::InvalidTarget;

  ChatMessage m;
  m.round = round_no;
  m.from = from;
  m.to = to;
  m.text = text;
  m.sent_at_ms = now;
  s_.round.messages.push_back(std::move(m));

  record_event(EventLevel::Info, EventCategory::Chat,
               std::string(role_to_string(from)) + " -> " + (to ? role_to_string(*to) : "crew"), now);
  return RejectReason::None;
}

bool RoundMachine::abort(TimeMs now, const std::string& reason) {
  if (s_.status == SessionStatus::Complete || s_.status == SessionStatus::Aborted) return false;

  // The partial round is dropped: no resolution, no archive entry.
  s_.round.actions = {};
  s_.round.ledger.reset(s_.config.pu_per_round);
  s_.status = SessionStatus::Aborted;
  s_.ended_ms = now;

  const std::string msg = "session aborted" + (reason.empty() ? std::string() : ": " + reason);
  record_event(EventLevel::Warn, EventCategory::Abort, msg, now);
  log::info(tag() + msg);
  return true;
}

} // namespace shipcoord
