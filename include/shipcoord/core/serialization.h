#pragma once

#include <string>

#include "shipcoord/core/action.h"
#include "shipcoord/core/events.h"
#include "shipcoord/core/round_view.h"
#include "shipcoord/core/session_state.h"
#include "shipcoord/util/json.h"

namespace shipcoord {

// A session snapshot plus the wall-clock time it was taken.
struct SessionSnapshot {
  SessionState state;
  TimeMs saved_at_ms{0};
};

// Serialize everything needed to resume a session after a restart
// (configuration, crew, hidden field, intel, RNG position, current round with
// its deadline, archive and event log).
json::Value serialize_session_to_json_value(const SessionState& state, TimeMs saved_at_ms);
std::string serialize_session_to_json(const SessionState& state, TimeMs saved_at_ms);

// Parse a snapshot. Throws std::runtime_error (or ConfigurationError for an
// invalid embedded configuration) on malformed input.
SessionSnapshot deserialize_session_from_json(const std::string& json_text);

// Throws std::runtime_error if a restored state has a round number outside
// the configured rounds or a ledger that could not have come from play.
void check_restored_state(const SessionState& state);

// --- transport-facing renderings ---

json::Value action_to_json(const Action& action);

// Parse an action object such as {"kind": "travel", "destination": "Beta"} or
// {"kind": "mine", "depth": "deep"}.
// Returns false on unknown kinds, asteroids or depths.
bool action_from_json(const json::Value& v, Action* out, std::string* error = nullptr);

json::Value intel_fact_to_json(const IntelFact& f);
json::Value mining_outcome_to_json(const MiningOutcome& o);
json::Value chat_message_to_json(const ChatMessage& m);
json::Value session_event_to_json(const SessionEvent& e);
json::Value round_resolved_event_to_json(const RoundResolvedEvent& ev);
json::Value round_view_to_json(const RoundView& v);

} // namespace shipcoord
