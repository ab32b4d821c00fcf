#pragma once

#include <optional>
#include <string>

#include "shipcoord/core/action.h"
#include "shipcoord/core/action_validator.h"
#include "shipcoord/core/session_state.h"

namespace shipcoord {

// Briefing -> Action -> Result state machine for one crew.
//
// Operates on a SessionState owned elsewhere. Not thread-safe; the owner
// serializes every call (see CrewHost).
//
// Timer-driven transitions use the expired deadline as the entry time of the
// next stage, so advance() called late replays the same schedule an on-time
// call would have produced. Event-driven transitions (both crew actions in)
// use the submission time.
class RoundMachine {
 public:
  explicit RoundMachine(SessionState& state) : s_(state) {}

  // Pending -> Running; enters Briefing of the first round at `now`.
  // Returns false if the session is not Pending.
  bool start(TimeMs now);

  // Validate and, if accepted, record the action as the role's pending action
  // (replacing any earlier one). Rejections have no side effects.
  ActionVerdict submit(int round_no, Role role, const Action& action, TimeMs now);

  // Briefing chat. Returns RejectReason::None when stored.
  RejectReason post_message(int round_no, Role from, std::optional<Role> to, const std::string& text,
                            TimeMs now);

  // Run every transition whose deadline is <= now.
  void advance(TimeMs now);

  // Discard the current round without resolving it and end the session.
  // Returns false if the session already ended.
  bool abort(TimeMs now, const std::string& reason);

  ValidationContext context_for(Role role, int round_no) const;

  bool is_training(int round_no) const;

 private:
  void begin_round(int number, TimeMs entered);
  void enter_action(TimeMs entered);
  void close_action(TimeMs at, bool timed_out);
  void enter_result(TimeMs entered);
  void resolve_round(TimeMs now);
  void finish_round(TimeMs at);
  void reset_after_training(TimeMs at);

  // Debit for a resolution step. On failure the step degrades to a no-op.
  bool spend(Role role, int cost, TimeMs now);

  void record_event(EventLevel level, EventCategory category, const std::string& message, TimeMs at);
  std::string tag() const;

  SessionState& s_;
};

} // namespace shipcoord
