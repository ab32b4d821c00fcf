#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>

#include "shipcoord/core/action.h"
#include "shipcoord/core/crew.h"
#include "shipcoord/core/events.h"
#include "shipcoord/core/round_machine.h"
#include "shipcoord/core/round_view.h"
#include "shipcoord/core/session_config.h"
#include "shipcoord/core/session_state.h"

namespace shipcoord {

// Session orchestrator for one crew: owns the SessionState and exposes the
// engine operations.
//
// Not thread-safe. Every call takes the caller's notion of "now" so a host
// can drive it from a real clock and tests from a manual one.
class Session {
 public:
  using ResolvedListener = std::function<void(const RoundResolvedEvent&)>;

  // Validates configuration and crew; throws ConfigurationError listing every
  // problem. The session starts Pending.
  Session(CrewId crew_id, const SessionConfig& cfg, const Crew& crew, TimeMs now);

  // Rebuild a session from a snapshot taken at saved_at_ms. A running stage
  // keeps the time it had left: its deadline moves forward by the downtime.
  static Session restore(SessionState snapshot, TimeMs saved_at_ms, TimeMs now);

  CrewId crew_id() const { return state_.crew_id; }
  const SessionState& state() const { return state_; }
  const SessionConfig& config() const { return state_.config; }
  SessionStatus status() const { return state_.status; }
  int current_round() const { return state_.round.number; }
  Stage stage() const { return state_.round.stage; }

  // Enter Briefing of the first round. Returns false unless Pending.
  bool start(TimeMs now);

  // Apply every deadline transition due at `now`.
  void tick(TimeMs now);

  ActionVerdict submit_action(int round_no, Role role, const Action& action, TimeMs now);

  // Same, addressed by participant id. Unknown participants are a RoleViolation.
  ActionVerdict submit_action_as(const std::string& participant_id, int round_no, const Action& action, TimeMs now);

  RejectReason post_message(int round_no, Role from, std::optional<Role> to, const std::string& text, TimeMs now);

  RoundView round_view(Role role, TimeMs now) const;

  bool abort(TimeMs now, const std::string& reason);

  // Called once per resolved round, after the state is updated.
  void set_resolved_listener(ResolvedListener listener) { listener_ = std::move(listener); }

  // Deadline of the current stage while Running.
  std::optional<TimeMs> next_deadline() const;

 private:
  explicit Session(SessionState state);

  RoundMachine machine() { return RoundMachine(state_); }
  void notify();

  SessionState state_;
  ResolvedListener listener_;
  std::size_t notified_{0};
};

} // namespace shipcoord
