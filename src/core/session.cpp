#include "shipcoord/core/session.h"

#include <algorithm>
#include <exception>
#include <string>
#include <utility>

#include "shipcoord/core/enum_strings.h"
#include "shipcoord/core/serialization.h"
#include "shipcoord/util/log.h"

namespace shipcoord {
namespace {

std::vector<std::string> collect_setup_errors(CrewId crew_id, const SessionConfig& cfg, const Crew& crew) {
  std::vector<std::string> errors = validate_session_config(cfg);
  for (auto& e : validate_crew(crew, cfg.captain_type)) errors.push_back(std::move(e));
  if (crew_id == kInvalidCrewId) errors.push_back("crew id must be non-zero");
  return errors;
}

} // namespace

Session::Session(CrewId crew_id, const SessionConfig& cfg, const Crew& crew, TimeMs now) {
  auto errors = collect_setup_errors(crew_id, cfg, crew);
  if (!errors.empty()) throw ConfigurationError(std::move(errors));

  state_.crew_id = crew_id;
  state_.config = cfg;
  state_.crew = crew;
  state_.field = resolve_asteroid_field(cfg);
  state_.intel = IntelStore(cfg.complexity);
  state_.rng = make_mining_rng(cfg.seed);
  state_.status = SessionStatus::Pending;
  state_.location = kHomeAsteroid;
  state_.created_ms = now;
  state_.round.number = cfg.first_round();
  state_.round.ledger.reset(cfg.pu_per_round);

  log::info("crew " + std::to_string(crew_id) + ": session created (pressure " + pressure_to_string(cfg.pressure) +
            ", complexity " + complexity_to_string(cfg.complexity) + ", captain " +
            captain_type_to_string(cfg.captain_type) + ", seed " + std::to_string(cfg.seed) + ")");
}

Session::Session(SessionState state) : state_(std::move(state)), notified_(state_.resolved.size()) {}

Session Session::restore(SessionState snapshot, TimeMs saved_at_ms, TimeMs now) {
  auto errors = collect_setup_errors(snapshot.crew_id, snapshot.config, snapshot.crew);
  if (!errors.empty()) throw ConfigurationError(std::move(errors));
  check_restored_state(snapshot);

  if (snapshot.status == SessionStatus::Running) {
    const TimeMs downtime = std::max<TimeMs>(0, now - saved_at_ms);
    snapshot.round.stage_entered_ms += downtime;
    snapshot.round.deadline_ms += downtime;
  }

  log::info("crew " + std::to_string(snapshot.crew_id) + ": session restored at round " +
            std::to_string(snapshot.round.number) + " (" + stage_to_string(snapshot.round.stage) + ")");
  return Session(std::move(snapshot));
}

bool Session::start(TimeMs now) {
  const bool ok = machine().start(now);
  if (!ok) log::warn("crew " + std::to_string(state_.crew_id) + ": start ignored, session is " +
                     session_status_to_string(state_.status));
  return ok;
}

void Session::tick(TimeMs now) {
  machine().advance(now);
  notify();
}

ActionVerdict Session::submit_action(int round_no, Role role, const Action& action, TimeMs now) {
  machine().advance(now);
  const ActionVerdict v = machine().submit(round_no, role, action, now);
  notify();
  return v;
}

ActionVerdict Session::submit_action_as(const std::string& participant_id, int round_no, const Action& action,
                                        TimeMs now) {
  const auto role = state_.crew.role_of(participant_id);
  if (!role) return ActionVerdict::reject(RejectReason::RoleViolation);
  return submit_action(round_no, *role, action, now);
}

RejectReason Session::post_message(int round_no, Role from, std::optional<Role> to, const std::string& text,
                                   TimeMs now) {
  tick(now);
  return machine().post_message(round_no, from, to, text, now);
}

RoundView Session::round_view(Role role, TimeMs now) const { return build_round_view(state_, role, now); }

bool Session::abort(TimeMs now, const std::string& reason) { return machine().abort(now, reason); }

std::optional<TimeMs> Session::next_deadline() const {
  if (state_.status != SessionStatus::Running) return std::nullopt;
  return state_.round.deadline_ms;
}

void Session::notify() {
  while (notified_ < state_.resolved.size()) {
    // Copy: the listener may call back into the session.
    const RoundResolvedEvent ev = state_.resolved[notified_];
    ++notified_;
    if (!listener_) continue;
    try {
      listener_(ev);
    } catch (const std::exception& e) {
      // The round stays resolved.
      log::error("crew " + std::to_string(state_.crew_id) + ": round " + std::to_string(ev.round) +
                 " listener failed: " + e.what());
    }
  }
}

} // namespace shipcoord
