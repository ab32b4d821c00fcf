#pragma once

#include <string>
#include <vector>

#include "shipcoord/core/events.h"

namespace shipcoord {

// Format session log events as CSV.
//
// Columns: crew_id,seq,round,time_ms,level,category,message
// Events are exported in the order provided. Output ends with a trailing newline.
std::string events_to_csv(CrewId crew_id, const std::vector<SessionEvent>& events);

// Format session log events as JSON Lines (one object per line).
//
// Fields match events_to_csv(). Output ends with a trailing newline.
std::string events_to_jsonl(CrewId crew_id, const std::vector<SessionEvent>& events);

// One analytics row per resolved round.
//
// Columns: crew_id,round,training,location_before,location_after,
//   navigator_action,navigator_applied,driller_action,driller_applied,
//   pu_remaining,pu_spent_round,mine_asteroid,mine_depth,intel_state,
//   probability,draw,success,minerals,cumulative_minerals,cumulative_pu_spent,
//   navigator_pu,driller_pu
//
// Mining columns are empty for rounds without a mining attempt.
std::string rounds_to_csv(CrewId crew_id, const std::vector<RoundResolvedEvent>& rounds);

// Round-resolved events as JSON Lines, using round_resolved_event_to_json().
std::string rounds_to_jsonl(CrewId crew_id, const std::vector<RoundResolvedEvent>& rounds);

// Counts by level and category, as a JSON object:
//   { "count": N, "levels": {...}, "categories": {...} }
std::string events_summary_to_json(const std::vector<SessionEvent>& events);

} // namespace shipcoord
