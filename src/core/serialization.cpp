#include "shipcoord/core/serialization.h"

#include <stdexcept>
#include <utility>

#include "shipcoord/core/enum_strings.h"
#include "shipcoord/core/session_config.h"
#include "shipcoord/util/strings.h"

namespace shipcoord {
namespace {

using json::Array;
using json::Object;
using json::Value;

constexpr int kCurrentSnapshotVersion = 1;
constexpr const char* kSnapshotFormat = "shipcoord-session";

template <typename Enum>
Enum parse_enum(const Value& v, bool (*parse)(const std::string&, Enum*), const char* what) {
  Enum e{};
  const std::string s = v.string_value();
  if (!parse(s, &e)) throw std::runtime_error(std::string("Unknown ") + what + ": '" + s + "'");
  return e;
}

// 64-bit values (seeds, RNG state) do not fit a double; store them as decimal text.
Value u64_to_json(std::uint64_t x) { return std::to_string(x); }

std::uint64_t u64_from_json(const Value& v) {
  if (v.is_number()) return static_cast<std::uint64_t>(v.number_value());
  try {
    return std::stoull(v.string_value());
  } catch (const std::exception&) {
    throw std::runtime_error("Invalid 64-bit integer: '" + v.string_value() + "'");
  }
}

Value num(std::int64_t x) { return static_cast<double>(x); }

int int_at(const Value& o, const std::string& key) { return static_cast<int>(o.at(key).int_value()); }

Value role_array_to_json(const std::array<int, kRoleCount>& a) {
  Object o;
  for (Role r : kAllRoles) o[role_to_string(r)] = static_cast<double>(a[role_index(r)]);
  return o;
}

std::array<int, kRoleCount> role_array_from_json(const Value& v) {
  std::array<int, kRoleCount> a{};
  for (Role r : kAllRoles) {
    if (const Value* x = v.find(role_to_string(r))) a[role_index(r)] = static_cast<int>(x->int_value());
  }
  return a;
}

Value optional_int_to_json(const std::optional<int>& v) {
  if (!v) return nullptr;
  return static_cast<double>(*v);
}

// --- intel / outcomes / chat ---

IntelFact intel_fact_from_json(const Value& v) {
  IntelFact f;
  f.asteroid = parse_enum(v.at("asteroid"), &asteroid_from_string, "asteroid");
  f.kind = parse_enum(v.at("kind"), &intel_kind_from_string, "intel kind");
  f.value = int_at(v, "value");
  f.discoverer = parse_enum(v.at("discoverer"), &role_from_string, "role");
  f.round = int_at(v, "round");
  return f;
}

MiningOutcome mining_outcome_from_json(const Value& v) {
  MiningOutcome o;
  o.round = int_at(v, "round");
  o.asteroid = parse_enum(v.at("asteroid"), &asteroid_from_string, "asteroid");
  o.depth = parse_enum(v.at("depth"), &depth_from_string, "depth");
  o.intel_state = parse_enum(v.at("intel_state"), &intel_state_from_string, "intel state");
  o.probability = v.at("probability").number_value();
  o.draw = v.at("draw").number_value();
  o.draw_index = u64_from_json(v.at("draw_index"));
  o.success = v.at("success").bool_value();
  o.minerals = int_at(v, "minerals");
  o.cost = int_at(v, "cost");
  return o;
}

ChatMessage chat_message_from_json(const Value& v) {
  ChatMessage m;
  m.round = int_at(v, "round");
  m.from = parse_enum(v.at("from"), &role_from_string, "role");
  if (const Value* to = v.find("to"); to && !to->is_null()) m.to = parse_enum(*to, &role_from_string, "role");
  m.text = v.at("text").string_value();
  m.sent_at_ms = v.at("sent_at_ms").int_value();
  return m;
}

SessionEvent session_event_from_json(const Value& v) {
  SessionEvent e;
  e.seq = u64_from_json(v.at("seq"));
  e.round = int_at(v, "round");
  e.time_ms = v.at("time_ms").int_value();
  e.level = parse_enum(v.at("level"), &event_level_from_string, "event level");
  e.category = parse_enum(v.at("category"), &event_category_from_string, "event category");
  e.message = v.at("message").string_value();
  return e;
}

Action action_from_json_or_throw(const Value& v) {
  Action a;
  std::string err;
  if (!action_from_json(v, &a, &err)) throw std::runtime_error("Invalid action: " + err);
  return a;
}

// --- resolved events ---

RoundResolvedEvent round_resolved_event_from_json(const Value& v) {
  RoundResolvedEvent ev;
  ev.round = int_at(v, "round");
  ev.training = v.at("training").bool_value();
  ev.location_before = parse_enum(v.at("location_before"), &asteroid_from_string, "asteroid");
  ev.location_after = parse_enum(v.at("location_after"), &asteroid_from_string, "asteroid");

  const Value& steps = v.at("steps");
  for (Role r : kAllRoles) {
    const Value* s = steps.find(role_to_string(r));
    if (!s) continue;
    ResolvedStep& st = ev.steps[role_index(r)];
    st.action = action_from_json_or_throw(s->at("action"));
    st.applied = s->at("applied").bool_value();
    st.cost = int_at(*s, "cost");
  }

  if (const Value* o = v.find("outcome"); o && !o->is_null()) ev.outcome = mining_outcome_from_json(*o);
  for (const auto& f : v.at("discovered").array()) ev.discovered.push_back(intel_fact_from_json(f));

  ev.pu_remaining = int_at(v, "pu_remaining");
  ev.pu_spent_round = int_at(v, "pu_spent_round");
  ev.cumulative_minerals = int_at(v, "cumulative_minerals");
  ev.cumulative_pu_spent = int_at(v, "cumulative_pu_spent");
  ev.cumulative_pu_by_role = role_array_from_json(v.at("cumulative_pu_by_role"));
  ev.session_complete = v.at("session_complete").bool_value();
  ev.next_round = int_at(v, "next_round");
  ev.resolved_at_ms = v.at("resolved_at_ms").int_value();
  return ev;
}

// --- rounds ---

Value round_to_json(const RoundState& r) {
  Object o;
  o["number"] = static_cast<double>(r.number);
  o["stage"] = std::string(stage_to_string(r.stage));
  o["stage_entered_ms"] = num(r.stage_entered_ms);
  o["deadline_ms"] = num(r.deadline_ms);

  Object actions;
  for (Role role : kAllRoles) {
    const auto& a = r.actions[role_index(role)];
    actions[role_to_string(role)] = a ? action_to_json(*a) : Value(nullptr);
  }
  o["actions"] = actions;

  Object ledger;
  ledger["per_round"] = static_cast<double>(r.ledger.per_round());
  ledger["remaining"] = static_cast<double>(r.ledger.remaining());
  ledger["holds"] = role_array_to_json(r.ledger.holds());
  ledger["spent"] = role_array_to_json(r.ledger.spent_by_role());
  o["ledger"] = ledger;

  Array messages;
  for (const auto& m : r.messages) messages.push_back(chat_message_to_json(m));
  o["messages"] = messages;

  o["probes"] = static_cast<double>(r.probes);
  o["robots"] = static_cast<double>(r.robots);
  o["resolved"] = r.resolved;
  return o;
}

RoundState round_from_json(const Value& v) {
  RoundState r;
  r.number = int_at(v, "number");
  r.stage = parse_enum(v.at("stage"), &stage_from_string, "stage");
  r.stage_entered_ms = v.at("stage_entered_ms").int_value();
  r.deadline_ms = v.at("deadline_ms").int_value();

  const Value& actions = v.at("actions");
  for (Role role : kAllRoles) {
    const Value* a = actions.find(role_to_string(role));
    if (a && !a->is_null()) r.actions[role_index(role)] = action_from_json_or_throw(*a);
  }

  const Value& ledger = v.at("ledger");
  r.ledger.load(int_at(ledger, "per_round"), int_at(ledger, "remaining"), role_array_from_json(ledger.at("holds")),
                role_array_from_json(ledger.at("spent")));

  for (const auto& m : v.at("messages").array()) r.messages.push_back(chat_message_from_json(m));

  r.probes = int_at(v, "probes");
  r.robots = int_at(v, "robots");
  r.resolved = v.at("resolved").bool_value();
  return r;
}

// --- crew / field ---

Value crew_to_json(const Crew& crew) {
  Object o;
  for (Role r : kAllRoles) {
    Object slot;
    slot["participant_id"] = crew.slot(r).participant_id;
    slot["ai"] = crew.slot(r).ai;
    o[role_to_string(r)] = slot;
  }
  return o;
}

Crew crew_from_json(const Value& v) {
  Crew c;
  for (Role r : kAllRoles) {
    const Value& slot = v.at(role_to_string(r));
    c.slot(r).participant_id = slot.at("participant_id").string_value();
    c.slot(r).ai = slot.at("ai").bool_value();
  }
  return c;
}

Value field_to_json(const AsteroidField& f) {
  Object o;
  for (Asteroid a : kAllAsteroids) {
    const AsteroidProfile& p = f[asteroid_index(a)];
    Object po;
    po["max_minerals"] = static_cast<double>(p.max_minerals);
    po["shallow_cost"] = static_cast<double>(p.shallow_cost);
    po["deep_cost"] = static_cast<double>(p.deep_cost);
    o[asteroid_to_string(a)] = po;
  }
  return o;
}

AsteroidField field_from_json(const Value& v) {
  AsteroidField f{};
  for (Asteroid a : kAllAsteroids) {
    const Value& p = v.at(asteroid_to_string(a));
    f[asteroid_index(a)] = AsteroidProfile{int_at(p, "max_minerals"), int_at(p, "shallow_cost"), int_at(p, "deep_cost")};
  }
  return f;
}

} // namespace

// --- public renderings ---

Value action_to_json(const Action& action) {
  Object o;
  o["kind"] = std::string(action_kind_to_string(action_kind(action)));
  if (const auto* n = std::get_if<NoOp>(&action)) {
    if (n->implicit) o["implicit"] = true;
  } else if (const auto* t = std::get_if<Travel>(&action)) {
    o["destination"] = std::string(asteroid_to_string(t->destination));
  } else if (const auto* m = std::get_if<Mine>(&action)) {
    o["depth"] = std::string(depth_to_string(m->depth));
  }
  if (const auto target = action_target(action)) o["target"] = std::string(asteroid_to_string(*target));
  return o;
}

bool action_from_json(const Value& v, Action* out, std::string* error) {
  auto fail = [&](const std::string& msg) {
    if (error) *error = msg;
    return false;
  };
  if (!v.is_object()) return fail("action must be a JSON object");

  const Value* kind_v = v.find("kind");
  if (!kind_v || !kind_v->is_string()) return fail("action is missing 'kind'");
  const std::string kind_s = to_lower(kind_v->string_value());

  // "mine_shallow" / "mine_deep" carry the depth in the kind.
  std::optional<Depth> kind_depth;
  ActionKind kind = ActionKind::NoOp;
  if (kind_s == "mine_shallow" || kind_s == "mine_deep") {
    kind = ActionKind::Mine;
    kind_depth = kind_s == "mine_shallow" ? Depth::Shallow : Depth::Deep;
  } else if (!action_kind_from_string(kind_s, &kind)) {
    return fail("unknown action kind '" + kind_v->string_value() + "'");
  }

  std::optional<Asteroid> target;
  if (const Value* t = v.find("target"); t && !t->is_null()) {
    Asteroid a{};
    if (!t->is_string() || !asteroid_from_string(t->string_value(), &a)) {
      return fail("unknown asteroid '" + t->string_value() + "'");
    }
    target = a;
  }

  switch (kind) {
    case ActionKind::NoOp:
      *out = NoOp{v.find("implicit") ? v.find("implicit")->bool_value() : false};
      return true;
    case ActionKind::Travel: {
      const Value* d = v.find("destination");
      if (!d) d = v.find("target");
      Asteroid a{};
      if (!d || !d->is_string()) return fail("travel needs a 'destination'");
      if (!asteroid_from_string(d->string_value(), &a)) return fail("unknown asteroid '" + d->string_value() + "'");
      *out = Travel{a};
      return true;
    }
    case ActionKind::SendProbe:
      *out = SendProbe{target};
      return true;
    case ActionKind::DeployRobot:
      *out = DeployRobot{target};
      return true;
    case ActionKind::Mine: {
      Depth depth = Depth::Shallow;
      if (kind_depth) {
        depth = *kind_depth;
      } else {
        const Value* d = v.find("depth");
        if (!d || !d->is_string()) return fail("mine needs a 'depth'");
        if (!depth_from_string(d->string_value(), &depth)) return fail("unknown depth '" + d->string_value() + "'");
      }
      *out = Mine{depth, target};
      return true;
    }
  }
  return fail("unknown action kind");
}

Value intel_fact_to_json(const IntelFact& f) {
  Object o;
  o["asteroid"] = std::string(asteroid_to_string(f.asteroid));
  o["kind"] = std::string(intel_kind_to_string(f.kind));
  o["value"] = static_cast<double>(f.value);
  o["discoverer"] = std::string(role_to_string(f.discoverer));
  o["round"] = static_cast<double>(f.round);
  return o;
}

Value mining_outcome_to_json(const MiningOutcome& m) {
  Object o;
  o["round"] = static_cast<double>(m.round);
  o["asteroid"] = std::string(asteroid_to_string(m.asteroid));
  o["depth"] = std::string(depth_to_string(m.depth));
  o["intel_state"] = std::string(intel_state_to_string(m.intel_state));
  o["probability"] = m.probability;
  o["draw"] = m.draw;
  o["draw_index"] = u64_to_json(m.draw_index);
  o["success"] = m.success;
  o["minerals"] = static_cast<double>(m.minerals);
  o["cost"] = static_cast<double>(m.cost);
  return o;
}

Value chat_message_to_json(const ChatMessage& m) {
  Object o;
  o["round"] = static_cast<double>(m.round);
  o["from"] = std::string(role_to_string(m.from));
  o["to"] = m.to ? Value(std::string(role_to_string(*m.to))) : Value(nullptr);
  o["text"] = m.text;
  o["sent_at_ms"] = num(m.sent_at_ms);
  return o;
}

Value session_event_to_json(const SessionEvent& e) {
  Object o;
  o["seq"] = u64_to_json(e.seq);
  o["round"] = static_cast<double>(e.round);
  o["time_ms"] = num(e.time_ms);
  o["level"] = std::string(event_level_to_string(e.level));
  o["category"] = std::string(event_category_to_string(e.category));
  o["message"] = e.message;
  return o;
}

Value round_resolved_event_to_json(const RoundResolvedEvent& ev) {
  Object o;
  o["round"] = static_cast<double>(ev.round);
  o["training"] = ev.training;
  o["location_before"] = std::string(asteroid_to_string(ev.location_before));
  o["location_after"] = std::string(asteroid_to_string(ev.location_after));

  Object steps;
  for (Role r : kAllRoles) {
    const ResolvedStep& st = ev.steps[role_index(r)];
    Object so;
    so["action"] = action_to_json(st.action);
    so["applied"] = st.applied;
    so["cost"] = static_cast<double>(st.cost);
    steps[role_to_string(r)] = so;
  }
  o["steps"] = steps;

  o["outcome"] = ev.outcome ? mining_outcome_to_json(*ev.outcome) : Value(nullptr);
  Array discovered;
  for (const auto& f : ev.discovered) discovered.push_back(intel_fact_to_json(f));
  o["discovered"] = discovered;

  o["pu_remaining"] = static_cast<double>(ev.pu_remaining);
  o["pu_spent_round"] = static_cast<double>(ev.pu_spent_round);
  o["cumulative_minerals"] = static_cast<double>(ev.cumulative_minerals);
  o["cumulative_pu_spent"] = static_cast<double>(ev.cumulative_pu_spent);
  o["cumulative_pu_by_role"] = role_array_to_json(ev.cumulative_pu_by_role);
  o["session_complete"] = ev.session_complete;
  o["next_round"] = static_cast<double>(ev.next_round);
  o["resolved_at_ms"] = num(ev.resolved_at_ms);
  return o;
}

Value round_view_to_json(const RoundView& v) {
  Object o;
  o["crew_id"] = u64_to_json(v.crew_id);
  o["role"] = std::string(role_to_string(v.role));
  o["round"] = static_cast<double>(v.round);
  o["training"] = v.training;
  o["last_round"] = static_cast<double>(v.last_round);
  o["status"] = std::string(session_status_to_string(v.status));
  o["stage"] = std::string(stage_to_string(v.stage));
  o["stage_entered_ms"] = num(v.stage_entered_ms);
  o["deadline_ms"] = num(v.deadline_ms);
  o["remaining_ms"] = num(v.remaining_ms);
  o["pu_per_round"] = static_cast<double>(v.pu_per_round);
  o["pu_remaining"] = static_cast<double>(v.pu_remaining);
  o["pu_available"] = static_cast<double>(v.pu_available);
  o["location"] = std::string(asteroid_to_string(v.location));
  o["own_action"] = v.own_action ? action_to_json(*v.own_action) : Value(nullptr);
  o["can_act"] = v.can_act;
  o["probes_left"] = static_cast<double>(v.probes_left);
  o["robots_left"] = static_cast<double>(v.robots_left);
  o["cumulative_minerals"] = static_cast<double>(v.cumulative_minerals);
  o["last_outcome"] = v.last_outcome ? mining_outcome_to_json(*v.last_outcome) : Value(nullptr);

  Array rows;
  for (const auto& row : v.asteroids) {
    Object ro;
    ro["asteroid"] = std::string(asteroid_to_string(row.asteroid));
    ro["travel_cost"] = static_cast<double>(row.travel_cost);
    ro["here"] = row.here;
    ro["mined"] = row.mined;
    ro["max_minerals"] = optional_int_to_json(row.max_minerals);
    ro["shallow_cost"] = optional_int_to_json(row.shallow_cost);
    ro["deep_cost"] = optional_int_to_json(row.deep_cost);
    rows.push_back(ro);
  }
  o["asteroids"] = rows;

  Array intel;
  for (const auto& f : v.intel) intel.push_back(intel_fact_to_json(f));
  o["intel"] = intel;

  Array messages;
  for (const auto& m : v.messages) messages.push_back(chat_message_to_json(m));
  o["messages"] = messages;
  return o;
}

// --- session snapshot ---

Value serialize_session_to_json_value(const SessionState& s, TimeMs saved_at_ms) {
  Object root;
  root["format"] = std::string(kSnapshotFormat);
  root["snapshot_version"] = static_cast<double>(kCurrentSnapshotVersion);
  root["saved_at_ms"] = num(saved_at_ms);

  root["crew_id"] = u64_to_json(s.crew_id);
  root["config"] = session_config_to_json_value(s.config);
  root["crew"] = crew_to_json(s.crew);
  root["field"] = field_to_json(s.field);

  root["status"] = std::string(session_status_to_string(s.status));
  root["location"] = std::string(asteroid_to_string(s.location));

  Array mined;
  for (Asteroid a : kAllAsteroids) {
    if (s.mined[asteroid_index(a)]) mined.push_back(std::string(asteroid_to_string(a)));
  }
  root["mined"] = mined;

  Array intel;
  for (const auto& f : s.intel.facts()) intel.push_back(intel_fact_to_json(f));
  root["intel"] = intel;

  Object rng;
  rng["state"] = u64_to_json(s.rng.s);
  rng["draws"] = u64_to_json(s.rng.draws);
  root["rng"] = rng;

  root["round"] = round_to_json(s.round);
  Array archive;
  for (const auto& r : s.archive) archive.push_back(round_to_json(r));
  root["archive"] = archive;

  Array outcomes;
  for (const auto& o : s.outcomes) outcomes.push_back(mining_outcome_to_json(o));
  root["outcomes"] = outcomes;

  Array resolved;
  for (const auto& ev : s.resolved) resolved.push_back(round_resolved_event_to_json(ev));
  root["resolved"] = resolved;

  Array events;
  for (const auto& e : s.events) events.push_back(session_event_to_json(e));
  root["events"] = events;
  root["next_event_seq"] = u64_to_json(s.next_event_seq);

  root["probes_total"] = static_cast<double>(s.probes_total);
  root["robots_total"] = static_cast<double>(s.robots_total);
  root["cumulative_minerals"] = static_cast<double>(s.cumulative_minerals);
  root["training_minerals"] = static_cast<double>(s.training_minerals);
  root["cumulative_pu_spent"] = static_cast<double>(s.cumulative_pu_spent);
  root["pu_spent_by_role"] = role_array_to_json(s.pu_spent_by_role);

  root["created_ms"] = num(s.created_ms);
  root["started_ms"] = num(s.started_ms);
  root["ended_ms"] = num(s.ended_ms);
  return root;
}

std::string serialize_session_to_json(const SessionState& s, TimeMs saved_at_ms) {
  return json::stringify(serialize_session_to_json_value(s, saved_at_ms), 2);
}

SessionSnapshot deserialize_session_from_json(const std::string& json_text) {
  const Value root = json::parse(json_text);
  if (!root.is_object()) throw std::runtime_error("Session snapshot must be a JSON object");

  const Value* format = root.find("format");
  if (!format || format->string_value() != kSnapshotFormat) {
    throw std::runtime_error("Not a shipcoord session snapshot (missing or wrong 'format')");
  }
  const int version = static_cast<int>(root.at("snapshot_version").int_value());
  if (version > kCurrentSnapshotVersion) {
    throw std::runtime_error("Session snapshot version " + std::to_string(version) + " is newer than supported (" +
                             std::to_string(kCurrentSnapshotVersion) + ")");
  }

  SessionSnapshot snap;
  snap.saved_at_ms = root.at("saved_at_ms").int_value();

  SessionState& s = snap.state;
  s.crew_id = u64_from_json(root.at("crew_id"));
  s.config = session_config_from_json(root.at("config"));
  s.crew = crew_from_json(root.at("crew"));
  s.field = field_from_json(root.at("field"));

  s.status = parse_enum(root.at("status"), &session_status_from_string, "session status");
  s.location = parse_enum(root.at("location"), &asteroid_from_string, "asteroid");
  for (const auto& m : root.at("mined").array()) {
    s.mined[asteroid_index(parse_enum(m, &asteroid_from_string, "asteroid"))] = true;
  }

  s.intel = IntelStore(s.config.complexity);
  for (const auto& f : root.at("intel").array()) s.intel.record(intel_fact_from_json(f));

  const Value& rng = root.at("rng");
  s.rng.s = u64_from_json(rng.at("state"));
  s.rng.draws = u64_from_json(rng.at("draws"));

  s.round = round_from_json(root.at("round"));
  for (const auto& r : root.at("archive").array()) s.archive.push_back(round_from_json(r));
  for (const auto& o : root.at("outcomes").array()) s.outcomes.push_back(mining_outcome_from_json(o));
  for (const auto& ev : root.at("resolved").array()) s.resolved.push_back(round_resolved_event_from_json(ev));
  for (const auto& e : root.at("events").array()) s.events.push_back(session_event_from_json(e));
  s.next_event_seq = u64_from_json(root.at("next_event_seq"));

  s.probes_total = int_at(root, "probes_total");
  s.robots_total = int_at(root, "robots_total");
  s.cumulative_minerals = int_at(root, "cumulative_minerals");
  s.training_minerals = int_at(root, "training_minerals");
  s.cumulative_pu_spent = int_at(root, "cumulative_pu_spent");
  s.pu_spent_by_role = role_array_from_json(root.at("pu_spent_by_role"));

  s.created_ms = root.at("created_ms").int_value();
  s.started_ms = root.at("started_ms").int_value();
  s.ended_ms = root.at("ended_ms").int_value();

  check_restored_state(s);
  return snap;
}

void check_restored_state(const SessionState& state) {
  const SessionConfig& cfg = state.config;
  const auto check_round = [&cfg](const RoundState& r, const std::string& what) {
    if (r.number < cfg.first_round() || r.number > cfg.last_round()) {
      throw std::runtime_error("Session snapshot " + what + " number " + std::to_string(r.number) +
                               " is outside " + std::to_string(cfg.first_round()) + ".." +
                               std::to_string(cfg.last_round()));
    }
    if (r.ledger.per_round() != cfg.pu_per_round) {
      throw std::runtime_error("Session snapshot " + what + " ledger has per_round " +
                               std::to_string(r.ledger.per_round()) + ", config says " +
                               std::to_string(cfg.pu_per_round));
    }
    std::string err;
    if (!r.ledger.consistent(&err)) throw std::runtime_error("Session snapshot " + what + " ledger: " + err);
  };

  check_round(state.round, "round");
  for (const auto& r : state.archive) check_round(r, "archived round");
}

} // namespace shipcoord
