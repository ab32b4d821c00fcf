#include "shipcoord/util/event_export.h"

#include <map>
#include <sstream>

#include "shipcoord/core/enum_strings.h"
#include "shipcoord/core/serialization.h"
#include "shipcoord/util/json.h"
#include "shipcoord/util/strings.h"

namespace shipcoord {
namespace {

std::string fmt_double(double x) {
  std::ostringstream ss;
  ss.precision(6);
  ss << x;
  return ss.str();
}

json::Value event_row(CrewId crew_id, const SessionEvent& e) {
  json::Object o = session_event_to_json(e).object();
  o["crew_id"] = std::to_string(crew_id);
  return o;
}

} // namespace

std::string events_to_csv(CrewId crew_id, const std::vector<SessionEvent>& events) {
  std::ostringstream out;
  out << "crew_id,seq,round,time_ms,level,category,message\n";
  for (const auto& e : events) {
    out << crew_id << ',' << e.seq << ',' << e.round << ',' << e.time_ms << ',' << event_level_to_string(e.level)
        << ',' << event_category_to_string(e.category) << ',' << csv_escape(e.message) << '\n';
  }
  return out.str();
}

std::string events_to_jsonl(CrewId crew_id, const std::vector<SessionEvent>& events) {
  std::string out;
  for (const auto& e : events) {
    out += json::stringify(event_row(crew_id, e), 0);
    out += '\n';
  }
  return out;
}

std::string rounds_to_csv(CrewId crew_id, const std::vector<RoundResolvedEvent>& rounds) {
  std::ostringstream out;
  out << "crew_id,round,training,location_before,location_after,navigator_action,navigator_applied,"
         "driller_action,driller_applied,pu_remaining,pu_spent_round,mine_asteroid,mine_depth,intel_state,"
         "probability,draw,success,minerals,cumulative_minerals,cumulative_pu_spent,navigator_pu,driller_pu\n";

  for (const auto& ev : rounds) {
    const ResolvedStep& nav = ev.steps[role_index(Role::Navigator)];
    const ResolvedStep& drl = ev.steps[role_index(Role::Driller)];

    out << crew_id << ',' << ev.round << ',' << (ev.training ? 1 : 0) << ','
        << asteroid_to_string(ev.location_before) << ',' << asteroid_to_string(ev.location_after) << ','
        << csv_escape(action_to_string(nav.action)) << ',' << (nav.applied ? 1 : 0) << ','
        << csv_escape(action_to_string(drl.action)) << ',' << (drl.applied ? 1 : 0) << ',' << ev.pu_remaining << ','
        << ev.pu_spent_round << ',';

    if (ev.outcome) {
      const MiningOutcome& m = *ev.outcome;
      out << asteroid_to_string(m.asteroid) << ',' << depth_to_string(m.depth) << ','
          << intel_state_to_string(m.intel_state) << ',' << fmt_double(m.probability) << ',' << fmt_double(m.draw)
          << ',' << (m.success ? 1 : 0) << ',' << m.minerals << ',';
    } else {
      out << ",,,,,,0,";
    }

    out << ev.cumulative_minerals << ',' << ev.cumulative_pu_spent << ','
        << ev.cumulative_pu_by_role[role_index(Role::Navigator)] << ','
        << ev.cumulative_pu_by_role[role_index(Role::Driller)] << '\n';
  }
  return out.str();
}

std::string rounds_to_jsonl(CrewId crew_id, const std::vector<RoundResolvedEvent>& rounds) {
  std::string out;
  for (const auto& ev : rounds) {
    json::Object o = round_resolved_event_to_json(ev).object();
    o["crew_id"] = std::to_string(crew_id);
    out += json::stringify(o, 0);
    out += '\n';
  }
  return out;
}

std::string events_summary_to_json(const std::vector<SessionEvent>& events) {
  std::map<std::string, int> level_counts;
  for (EventLevel l : {EventLevel::Info, EventLevel::Warn}) level_counts[event_level_to_string(l)] = 0;

  std::map<std::string, int> category_counts;
  const EventCategory kCategories[] = {EventCategory::Session, EventCategory::Stage,   EventCategory::Timeout,
                                       EventCategory::Intel,   EventCategory::Mining,  EventCategory::Skipped,
                                       EventCategory::Chat,    EventCategory::Abort};
  for (EventCategory c : kCategories) category_counts[event_category_to_string(c)] = 0;

  for (const auto& e : events) {
    level_counts[event_level_to_string(e.level)] += 1;
    category_counts[event_category_to_string(e.category)] += 1;
  }

  json::Object levels;
  for (const auto& [k, n] : level_counts) levels[k] = static_cast<double>(n);
  json::Object categories;
  for (const auto& [k, n] : category_counts) categories[k] = static_cast<double>(n);

  json::Object root;
  root["count"] = static_cast<double>(events.size());
  root["levels"] = levels;
  root["categories"] = categories;
  return json::stringify(root, 2) + "\n";
}

} // namespace shipcoord
