#include <iostream>
#include <string>

#include "shipcoord/core/session_config.h"
#include "shipcoord/util/json.h"

#define SC_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

const char* kMinimal = R"({
  "pressure": "low",
  "complexity": "low",
  "captain_type": "llm",
  "pu_per_round": 6,
  "travel_costs": { "Alpha": 0, "Beta": 2, "Gamma": 3, "Omega": 4 },
  "action_costs": { "probe": 1, "robot": 2, "mine_shallow": 1, "mine_deep": 3 },
  "stage_durations_s": {
    "briefing_high_pressure": 60, "briefing_low_pressure": 120, "action": 10, "result": 5.5
  },
  "probability_matrix": {
    "shallow": { "none": 0.1, "probe_only": 0.2, "robot_only": 0.3, "probe_plus_robot": 0.4 },
    "deep":    { "none": 0.5, "probe_only": 0.6, "robot_only": 0.7, "probe_plus_robot": 0.9 }
  }
})";

bool throws_config_error(const std::string& text, std::size_t* problems = nullptr) {
  try {
    (void)shipcoord::load_session_config_from_json(text);
  } catch (const shipcoord::ConfigurationError& e) {
    if (problems) *problems = e.errors().size();
    return true;
  }
  return false;
}

} // namespace

int test_session_config() {
  using namespace shipcoord;

  // The shipped default file matches the built-in defaults.
  {
    const SessionConfig cfg =
        load_session_config_from_file(std::string(SHIPCOORD_SOURCE_DIR) + "/data/config/default_session.json");
    const SessionConfig def;
    SC_ASSERT(cfg.pressure == Pressure::High);
    SC_ASSERT(cfg.complexity == Complexity::High);
    SC_ASSERT(cfg.captain_type == CaptainType::Human);
    SC_ASSERT(cfg.pu_per_round == 4);
    SC_ASSERT(cfg.travel_costs == def.travel_costs);
    SC_ASSERT(cfg.costs.mine_deep == 2);
    SC_ASSERT(cfg.durations.briefing_high_pressure_ms == 90'000);
    SC_ASSERT(cfg.durations.briefing_low_pressure_ms == 180'000);
    SC_ASSERT(cfg.durations.action_ms == 15'000);
    SC_ASSERT(cfg.probabilities.at(Depth::Shallow, IntelState::None) == 0.15);
    SC_ASSERT(cfg.probabilities.at(Depth::Deep, IntelState::ProbePlusRobot) == 0.80);
    SC_ASSERT(cfg.rounds.training);
    SC_ASSERT(cfg.rounds.scored == 5);
    SC_ASSERT(cfg.probe_cap.limit == 2 && cfg.probe_cap.scope == CapScope::Session);
    SC_ASSERT(cfg.robot_cap.limit == 1 && cfg.robot_cap.scope == CapScope::Round);
    SC_ASSERT(cfg.unprobed_yield == UnprobedYield::TrueValue);
    SC_ASSERT(!cfg.allow_repeat_mining);
    SC_ASSERT(!cfg.asteroids.has_value());
    SC_ASSERT(cfg.max_events == 1000);
    SC_ASSERT(validate_session_config(cfg).empty());
  }

  // Required keys only; optional sections keep their defaults.
  {
    const SessionConfig cfg = load_session_config_from_json(kMinimal);
    SC_ASSERT(cfg.pressure == Pressure::Low);
    SC_ASSERT(cfg.complexity == Complexity::Low);
    SC_ASSERT(cfg.captain_type == CaptainType::Llm);
    SC_ASSERT(cfg.briefing_ms() == 120'000);
    SC_ASSERT(cfg.durations.result_ms == 5'500);
    SC_ASSERT(cfg.travel_cost(Asteroid::Omega) == 4);
    SC_ASSERT(cfg.mine_cost(Depth::Deep) == 3);
    SC_ASSERT(cfg.probabilities.at(Depth::Deep, IntelState::RobotOnly) == 0.7);
    SC_ASSERT(cfg.seed == 1);
    SC_ASSERT(cfg.rounds.scored == 5);
    SC_ASSERT(cfg.first_round() == 0);
    SC_ASSERT(cfg.last_round() == 5);

    // Serialized form loads back to the same values.
    const SessionConfig again = session_config_from_json(session_config_to_json_value(cfg));
    SC_ASSERT(again.pu_per_round == 6);
    SC_ASSERT(again.durations.result_ms == 5'500);
    SC_ASSERT(again.costs.robot == 2);
    SC_ASSERT(again.probabilities.at(Depth::Shallow, IntelState::ProbePlusRobot) == 0.4);
    SC_ASSERT(again.captain_type == CaptainType::Llm);
  }

  // Every missing required key is reported at once.
  {
    std::size_t n = 0;
    SC_ASSERT(throws_config_error("{}", &n));
    SC_ASSERT(n == 8);
    SC_ASSERT(throws_config_error("[1, 2]"));
    SC_ASSERT(throws_config_error("{ \"pressure\": "));
  }

  // Type and value problems.
  {
    json::Object o = json::parse(kMinimal).object();
    o["pressure"] = std::string("extreme");
    o["pu_per_round"] = 2.5;
    o["max_events"] = -1.0;
    std::size_t n = 0;
    SC_ASSERT(throws_config_error(json::stringify(o, 0), &n));
    SC_ASSERT(n == 2);

    json::Object w = json::parse(kMinimal).object();
    w["pu_per_round"] = 0.0;
    bool threw = false;
    try {
      (void)session_config_from_json(w);
    } catch (const ConfigurationError& e) {
      threw = true;
      SC_ASSERT(std::string(e.what()).find("pu_per_round") != std::string::npos);
    }
    SC_ASSERT(threw);
  }

  // Validation of a hand-built config.
  {
    SessionConfig cfg;
    SC_ASSERT(validate_session_config(cfg).empty());
    cfg.probabilities.at(Depth::Deep, IntelState::None) = 1.5;
    cfg.travel_costs[asteroid_index(Asteroid::Alpha)] = 1;
    cfg.rounds.scored = 0;
    SC_ASSERT(validate_session_config(cfg).size() == 3);
    bool threw = false;
    try {
      require_valid_session_config(cfg);
    } catch (const ConfigurationError& e) {
      threw = true;
      SC_ASSERT(e.errors().size() == 3);
    }
    SC_ASSERT(threw);
  }

  // Large seeds survive as strings; explicit fields override generation.
  {
    json::Object v = json::parse(kMinimal).object();
    v["seed"] = std::string("18446744073709551615");
    json::Object field;
    for (const char* name : {"Alpha", "Beta", "Gamma", "Omega"}) {
      json::Object p;
      p["max_minerals"] = 77.0;
      p["shallow_cost"] = 1.0;
      p["deep_cost"] = 2.0;
      field[name] = p;
    }
    v["asteroids"] = field;
    const SessionConfig cfg = session_config_from_json(v);
    SC_ASSERT(cfg.seed == 18446744073709551615ULL);
    SC_ASSERT(cfg.asteroids.has_value());
    SC_ASSERT(resolve_asteroid_field(cfg)[asteroid_index(Asteroid::Gamma)].max_minerals == 77);
  }

  // Generated fields are deterministic and within range.
  {
    const AsteroidField a = generate_asteroid_field(99);
    const AsteroidField b = generate_asteroid_field(99);
    for (std::size_t i = 0; i < kAsteroidCount; ++i) {
      SC_ASSERT(a[i].max_minerals == b[i].max_minerals);
      SC_ASSERT(a[i].shallow_cost == b[i].shallow_cost);
      SC_ASSERT(a[i].deep_cost == b[i].deep_cost);
    }
    const AsteroidProfile& alpha = a[asteroid_index(Asteroid::Alpha)];
    SC_ASSERT(alpha.max_minerals >= 50 && alpha.max_minerals <= 100);
    SC_ASSERT(alpha.shallow_cost == 1 && alpha.deep_cost == 2);
    const AsteroidProfile& omega = a[asteroid_index(Asteroid::Omega)];
    SC_ASSERT(omega.max_minerals >= 80 && omega.max_minerals <= 160);
    SC_ASSERT(omega.shallow_cost >= 1 && omega.shallow_cost <= 3);
    SC_ASSERT(omega.deep_cost >= 2 && omega.deep_cost <= 4);
  }

  return 0;
}
