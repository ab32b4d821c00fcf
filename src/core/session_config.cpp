#include "shipcoord/core/session_config.h"

#include <cmath>
#include <sstream>
#include <utility>

#include "shipcoord/core/enum_strings.h"
#include "shipcoord/util/file_io.h"
#include "shipcoord/util/hash_rng.h"
#include "shipcoord/util/strings.h"

namespace shipcoord {
namespace {

using json::Object;
using json::Value;

constexpr std::uint64_t kFieldStreamTag = 0xA57E501DULL;

std::string summarize(const std::vector<std::string>& errors) {
  std::ostringstream ss;
  ss << "Invalid session configuration (" << errors.size() << " problem" << (errors.size() == 1 ? "" : "s") << "): ";
  ss << join(errors, "; ");
  return ss.str();
}

const IntelState kStates[] = {IntelState::None, IntelState::ProbeOnly, IntelState::RobotOnly,
                              IntelState::ProbePlusRobot};

// Collects errors while reading so one pass reports every missing key.
struct Reader {
  std::vector<std::string> errors;

  const Value* object_at(const Value& parent, const std::string& key, const std::string& path, bool required) {
    const Value* v = parent.find(key);
    if (!v) {
      if (required) errors.push_back("missing key '" + path + "'");
      return nullptr;
    }
    if (!v->is_object()) {
      errors.push_back("'" + path + "' must be an object");
      return nullptr;
    }
    return v;
  }

  bool number(const Value& parent, const std::string& key, const std::string& path, bool required, double* out) {
    const Value* v = parent.find(key);
    if (!v) {
      if (required) errors.push_back("missing key '" + path + "'");
      return false;
    }
    if (!v->is_number()) {
      errors.push_back("'" + path + "' must be a number");
      return false;
    }
    *out = v->number_value();
    return true;
  }

  bool integer(const Value& parent, const std::string& key, const std::string& path, bool required, int* out) {
    double d = 0.0;
    if (!number(parent, key, path, required, &d)) return false;
    if (std::floor(d) != d) {
      errors.push_back("'" + path + "' must be an integer");
      return false;
    }
    *out = static_cast<int>(d);
    return true;
  }

  bool boolean(const Value& parent, const std::string& key, const std::string& path, bool* out) {
    const Value* v = parent.find(key);
    if (!v) return false;
    if (!v->is_bool()) {
      errors.push_back("'" + path + "' must be true or false");
      return false;
    }
    *out = v->bool_value();
    return true;
  }

  template <typename Enum>
  void enumeration(const Value& parent, const std::string& key, bool required,
                   bool (*parse)(const std::string&, Enum*), Enum* out) {
    const Value* v = parent.find(key);
    if (!v) {
      if (required) errors.push_back("missing key '" + key + "'");
      return;
    }
    if (!v->is_string() || !parse(v->string_value(), out)) {
      errors.push_back("'" + key + "' has an unrecognized value");
    }
  }

  void cap(const Value& parent, const std::string& key, UsageCap* out) {
    const std::string path = "caps." + key;
    const Value* c = object_at(parent, key, path, false);
    if (!c) return;
    integer(*c, "limit", path + ".limit", false, &out->limit);
    if (const Value* s = c->find("scope")) {
      if (!s->is_string() || !cap_scope_from_string(s->string_value(), &out->scope)) {
        errors.push_back("'" + path + ".scope' must be \"round\" or \"session\"");
      }
    }
  }
};

Value matrix_row_to_json(const std::array<double, kIntelStateCount>& row) {
  Object o;
  for (IntelState s : kStates) o[intel_state_to_string(s)] = row[static_cast<std::size_t>(s)];
  return o;
}

} // namespace

ConfigurationError::ConfigurationError(std::vector<std::string> errors)
    : std::runtime_error(summarize(errors)), errors_(std::move(errors)) {}

std::vector<std::string> validate_session_config(const SessionConfig& cfg) {
  std::vector<std::string> errors;

  if (cfg.pu_per_round <= 0) errors.push_back("pu_per_round must be positive");

  for (Asteroid a : kAllAsteroids) {
    const int c = cfg.travel_cost(a);
    if (c < 0) errors.push_back(std::string("travel cost for ") + asteroid_to_string(a) + " must be >= 0");
  }
  if (cfg.travel_cost(kHomeAsteroid) != 0) {
    errors.push_back(std::string("travel cost for ") + asteroid_to_string(kHomeAsteroid) + " must be 0");
  }

  const std::pair<const char*, int> costs[] = {
      {"probe", cfg.costs.probe},
      {"robot", cfg.costs.robot},
      {"mine_shallow", cfg.costs.mine_shallow},
      {"mine_deep", cfg.costs.mine_deep},
  };
  for (const auto& [name, c] : costs) {
    if (c < 0) errors.push_back(std::string("action cost '") + name + "' must be >= 0");
  }

  const std::pair<const char*, TimeMs> durations[] = {
      {"briefing_high_pressure", cfg.durations.briefing_high_pressure_ms},
      {"briefing_low_pressure", cfg.durations.briefing_low_pressure_ms},
      {"action", cfg.durations.action_ms},
      {"result", cfg.durations.result_ms},
  };
  for (const auto& [name, ms] : durations) {
    if (ms <= 0) errors.push_back(std::string("stage duration '") + name + "' must be positive");
  }

  for (Depth d : {Depth::Shallow, Depth::Deep}) {
    for (IntelState s : kStates) {
      const double p = cfg.probabilities.at(d, s);
      if (!std::isfinite(p) || p < 0.0 || p > 1.0) {
        errors.push_back(std::string("probability ") + depth_to_string(d) + "/" + intel_state_to_string(s) +
                         " must be within [0, 1]");
      }
    }
  }

  if (cfg.rounds.scored < 1) errors.push_back("rounds.scored must be at least 1");
  if (cfg.probe_cap.limit < 0) errors.push_back("caps.probes.limit must be >= 0");
  if (cfg.robot_cap.limit < 0) errors.push_back("caps.robots.limit must be >= 0");
  if (cfg.unprobed_yield == UnprobedYield::Fixed && cfg.fallback_minerals < 0) {
    errors.push_back("yield.fallback_minerals must be >= 0");
  }
  if (cfg.max_events < 0) errors.push_back("max_events must be >= 0");

  if (cfg.asteroids) {
    for (Asteroid a : kAllAsteroids) {
      const AsteroidProfile& p = (*cfg.asteroids)[asteroid_index(a)];
      if (p.max_minerals < 0 || p.shallow_cost < 0 || p.deep_cost < 0) {
        errors.push_back(std::string("asteroid ") + asteroid_to_string(a) + " has negative values");
      }
    }
  }

  return errors;
}

void require_valid_session_config(const SessionConfig& cfg) {
  auto errors = validate_session_config(cfg);
  if (!errors.empty()) throw ConfigurationError(std::move(errors));
}

SessionConfig session_config_from_json(const Value& v) {
  if (!v.is_object()) throw ConfigurationError({"session configuration must be a JSON object"});

  SessionConfig cfg;
  Reader r;

  r.enumeration(v, "pressure", true, &pressure_from_string, &cfg.pressure);
  r.enumeration(v, "complexity", true, &complexity_from_string, &cfg.complexity);
  r.enumeration(v, "captain_type", true, &captain_type_from_string, &cfg.captain_type);

  if (const Value* seed = v.find("seed")) {
    if (seed->is_number() && seed->number_value() >= 0.0) {
      cfg.seed = static_cast<std::uint64_t>(seed->number_value());
    } else if (seed->is_string()) {
      try {
        cfg.seed = std::stoull(seed->string_value());
      } catch (const std::exception&) {
        r.errors.push_back("'seed' must be a non-negative integer");
      }
    } else {
      r.errors.push_back("'seed' must be a non-negative integer");
    }
  }

  r.integer(v, "pu_per_round", "pu_per_round", true, &cfg.pu_per_round);

  if (const Value* travel = r.object_at(v, "travel_costs", "travel_costs", true)) {
    for (Asteroid a : kAllAsteroids) {
      const std::string name = asteroid_to_string(a);
      r.integer(*travel, name, "travel_costs." + name, true, &cfg.travel_costs[asteroid_index(a)]);
    }
  }

  if (const Value* costs = r.object_at(v, "action_costs", "action_costs", true)) {
    r.integer(*costs, "probe", "action_costs.probe", true, &cfg.costs.probe);
    r.integer(*costs, "robot", "action_costs.robot", true, &cfg.costs.robot);
    r.integer(*costs, "mine_shallow", "action_costs.mine_shallow", true, &cfg.costs.mine_shallow);
    r.integer(*costs, "mine_deep", "action_costs.mine_deep", true, &cfg.costs.mine_deep);
  }

  if (const Value* d = r.object_at(v, "stage_durations_s", "stage_durations_s", true)) {
    const std::pair<const char*, TimeMs*> fields[] = {
        {"briefing_high_pressure", &cfg.durations.briefing_high_pressure_ms},
        {"briefing_low_pressure", &cfg.durations.briefing_low_pressure_ms},
        {"action", &cfg.durations.action_ms},
        {"result", &cfg.durations.result_ms},
    };
    for (const auto& [key, dst] : fields) {
      double seconds = 0.0;
      if (r.number(*d, key, std::string("stage_durations_s.") + key, true, &seconds)) *dst = seconds_to_ms(seconds);
    }
  }

  if (const Value* m = r.object_at(v, "probability_matrix", "probability_matrix", true)) {
    for (Depth depth : {Depth::Shallow, Depth::Deep}) {
      const std::string dname = depth_to_string(depth);
      const Value* row = r.object_at(*m, dname, "probability_matrix." + dname, true);
      if (!row) continue;
      for (IntelState s : kStates) {
        const std::string sname = intel_state_to_string(s);
        r.number(*row, sname, "probability_matrix." + dname + "." + sname, true, &cfg.probabilities.at(depth, s));
      }
    }
  }

  if (const Value* rounds = r.object_at(v, "rounds", "rounds", false)) {
    r.boolean(*rounds, "training", "rounds.training", &cfg.rounds.training);
    r.integer(*rounds, "scored", "rounds.scored", false, &cfg.rounds.scored);
    r.boolean(*rounds, "reset_after_training", "rounds.reset_after_training", &cfg.rounds.reset_after_training);
  }

  if (const Value* caps = r.object_at(v, "caps", "caps", false)) {
    r.cap(*caps, "probes", &cfg.probe_cap);
    r.cap(*caps, "robots", &cfg.robot_cap);
  }

  if (const Value* y = r.object_at(v, "yield", "yield", false)) {
    if (const Value* mode = y->find("unprobed")) {
      if (!mode->is_string() || !unprobed_yield_from_string(mode->string_value(), &cfg.unprobed_yield)) {
        r.errors.push_back("'yield.unprobed' must be \"true_value\" or \"fixed\"");
      }
    }
    r.integer(*y, "fallback_minerals", "yield.fallback_minerals", false, &cfg.fallback_minerals);
  }

  if (const Value* mining = r.object_at(v, "mining", "mining", false)) {
    r.boolean(*mining, "allow_repeat", "mining.allow_repeat", &cfg.allow_repeat_mining);
  }

  if (const Value* field = r.object_at(v, "asteroids", "asteroids", false)) {
    AsteroidField f{};
    for (Asteroid a : kAllAsteroids) {
      const std::string name = asteroid_to_string(a);
      const Value* p = r.object_at(*field, name, "asteroids." + name, true);
      if (!p) continue;
      AsteroidProfile& dst = f[asteroid_index(a)];
      r.integer(*p, "max_minerals", "asteroids." + name + ".max_minerals", true, &dst.max_minerals);
      r.integer(*p, "shallow_cost", "asteroids." + name + ".shallow_cost", true, &dst.shallow_cost);
      r.integer(*p, "deep_cost", "asteroids." + name + ".deep_cost", true, &dst.deep_cost);
    }
    cfg.asteroids = f;
  }

  r.integer(v, "max_events", "max_events", false, &cfg.max_events);

  if (!r.errors.empty()) throw ConfigurationError(std::move(r.errors));
  require_valid_session_config(cfg);
  return cfg;
}

SessionConfig load_session_config_from_json(const std::string& json_text) {
  Value v;
  try {
    v = json::parse(json_text);
  } catch (const std::runtime_error& e) {
    throw ConfigurationError({e.what()});
  }
  return session_config_from_json(v);
}

SessionConfig load_session_config_from_file(const std::string& path) {
  return load_session_config_from_json(read_text_file(path));
}

json::Value session_config_to_json_value(const SessionConfig& cfg) {
  Object o;
  o["pressure"] = std::string(pressure_to_string(cfg.pressure));
  o["complexity"] = std::string(complexity_to_string(cfg.complexity));
  o["captain_type"] = std::string(captain_type_to_string(cfg.captain_type));
  // Seeds may exceed 2^53; keep them exact as decimal strings.
  o["seed"] = std::to_string(cfg.seed);
  o["pu_per_round"] = static_cast<double>(cfg.pu_per_round);

  Object travel;
  for (Asteroid a : kAllAsteroids) travel[asteroid_to_string(a)] = static_cast<double>(cfg.travel_cost(a));
  o["travel_costs"] = travel;

  Object costs;
  costs["probe"] = static_cast<double>(cfg.costs.probe);
  costs["robot"] = static_cast<double>(cfg.costs.robot);
  costs["mine_shallow"] = static_cast<double>(cfg.costs.mine_shallow);
  costs["mine_deep"] = static_cast<double>(cfg.costs.mine_deep);
  o["action_costs"] = costs;

  Object durations;
  durations["briefing_high_pressure"] = static_cast<double>(cfg.durations.briefing_high_pressure_ms) / 1000.0;
  durations["briefing_low_pressure"] = static_cast<double>(cfg.durations.briefing_low_pressure_ms) / 1000.0;
  durations["action"] = static_cast<double>(cfg.durations.action_ms) / 1000.0;
  durations["result"] = static_cast<double>(cfg.durations.result_ms) / 1000.0;
  o["stage_durations_s"] = durations;

  Object matrix;
  matrix["shallow"] = matrix_row_to_json(cfg.probabilities.shallow);
  matrix["deep"] = matrix_row_to_json(cfg.probabilities.deep);
  o["probability_matrix"] = matrix;

  Object rounds;
  rounds["training"] = cfg.rounds.training;
  rounds["scored"] = static_cast<double>(cfg.rounds.scored);
  rounds["reset_after_training"] = cfg.rounds.reset_after_training;
  o["rounds"] = rounds;

  const auto cap_to_json = [](const UsageCap& c) {
    Object co;
    co["limit"] = static_cast<double>(c.limit);
    co["scope"] = std::string(cap_scope_to_string(c.scope));
    return Value(co);
  };
  Object caps;
  caps["probes"] = cap_to_json(cfg.probe_cap);
  caps["robots"] = cap_to_json(cfg.robot_cap);
  o["caps"] = caps;

  Object yield;
  yield["unprobed"] = std::string(unprobed_yield_to_string(cfg.unprobed_yield));
  yield["fallback_minerals"] = static_cast<double>(cfg.fallback_minerals);
  o["yield"] = yield;

  Object mining;
  mining["allow_repeat"] = cfg.allow_repeat_mining;
  o["mining"] = mining;

  if (cfg.asteroids) {
    Object field;
    for (Asteroid a : kAllAsteroids) {
      const AsteroidProfile& p = (*cfg.asteroids)[asteroid_index(a)];
      Object po;
      po["max_minerals"] = static_cast<double>(p.max_minerals);
      po["shallow_cost"] = static_cast<double>(p.shallow_cost);
      po["deep_cost"] = static_cast<double>(p.deep_cost);
      field[asteroid_to_string(a)] = po;
    }
    o["asteroids"] = field;
  }

  o["max_events"] = static_cast<double>(cfg.max_events);
  return o;
}

AsteroidField generate_asteroid_field(std::uint64_t seed) {
  util::HashRng rng(util::derive_stream_seed(seed, kFieldStreamTag));
  AsteroidField f{};

  f[asteroid_index(Asteroid::Alpha)] = AsteroidProfile{rng.range_int(50, 100), 1, 2};

  struct Range {
    Asteroid a;
    int lo;
    int hi;
  };
  const Range ranges[] = {
      {Asteroid::Beta, 60, 120},
      {Asteroid::Gamma, 70, 140},
      {Asteroid::Omega, 80, 160},
  };
  for (const auto& r : ranges) {
    AsteroidProfile p;
    p.max_minerals = rng.range_int(r.lo, r.hi);
    p.shallow_cost = rng.range_int(1, 3);
    p.deep_cost = rng.range_int(2, 4);
    f[asteroid_index(r.a)] = p;
  }
  return f;
}

AsteroidField resolve_asteroid_field(const SessionConfig& cfg) {
  return cfg.asteroids ? *cfg.asteroids : generate_asteroid_field(cfg.seed);
}

} // namespace shipcoord
