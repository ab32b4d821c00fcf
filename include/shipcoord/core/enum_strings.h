#pragma once

#include <string>

#include "shipcoord/core/types.h"

namespace shipcoord {

// Shared string <-> enum conversion helpers.
//
// These are used by configuration loading, serialization, the CLI and the UI.
// Keeping them in one place avoids drift between file-format strings and labels.
//
// The *_from_string() parsers return false for unknown strings and leave *out
// untouched; parsing is case-insensitive.

const char* role_to_string(Role r);
bool role_from_string(const std::string& s, Role* out);

// Capitalized asteroid names ("Alpha") as used in configuration files.
const char* asteroid_to_string(Asteroid a);
bool asteroid_from_string(const std::string& s, Asteroid* out);

const char* pressure_to_string(Pressure p);
bool pressure_from_string(const std::string& s, Pressure* out);

const char* complexity_to_string(Complexity c);
bool complexity_from_string(const std::string& s, Complexity* out);

const char* captain_type_to_string(CaptainType c);
bool captain_type_from_string(const std::string& s, CaptainType* out);

const char* stage_to_string(Stage s);
bool stage_from_string(const std::string& s, Stage* out);

const char* session_status_to_string(SessionStatus s);
bool session_status_from_string(const std::string& s, SessionStatus* out);

const char* action_kind_to_string(ActionKind k);
bool action_kind_from_string(const std::string& s, ActionKind* out);

const char* depth_to_string(Depth d);
bool depth_from_string(const std::string& s, Depth* out);

const char* reject_reason_to_string(RejectReason r);

const char* intel_kind_to_string(IntelKind k);
bool intel_kind_from_string(const std::string& s, IntelKind* out);

const char* intel_state_to_string(IntelState s);
bool intel_state_from_string(const std::string& s, IntelState* out);

const char* cap_scope_to_string(CapScope s);
bool cap_scope_from_string(const std::string& s, CapScope* out);

const char* unprobed_yield_to_string(UnprobedYield y);
bool unprobed_yield_from_string(const std::string& s, UnprobedYield* out);

const char* event_level_to_string(EventLevel l);
bool event_level_from_string(const std::string& s, EventLevel* out);

const char* event_category_to_string(EventCategory c);
bool event_category_from_string(const std::string& s, EventCategory* out);

} // namespace shipcoord
