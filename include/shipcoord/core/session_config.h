#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "shipcoord/core/types.h"
#include "shipcoord/util/json.h"

namespace shipcoord {

struct StageDurations {
  TimeMs briefing_high_pressure_ms{90'000};
  TimeMs briefing_low_pressure_ms{180'000};
  TimeMs action_ms{15'000};
  TimeMs result_ms{15'000};
};

struct ActionCosts {
  int probe{1};
  int robot{1};
  int mine_shallow{1};
  int mine_deep{2};
};

// Success probability of a mine attempt, keyed by depth x intel state.
// Indexed by IntelState (None, ProbeOnly, RobotOnly, ProbePlusRobot).
struct ProbabilityMatrix {
  std::array<double, kIntelStateCount> shallow{0.15, 0.35, 0.30, 0.55};
  std::array<double, kIntelStateCount> deep{0.30, 0.55, 0.50, 0.80};

  double at(Depth d, IntelState s) const {
    const auto& row = (d == Depth::Shallow) ? shallow : deep;
    return row[static_cast<std::size_t>(s)];
  }
  double& at(Depth d, IntelState s) {
    auto& row = (d == Depth::Shallow) ? shallow : deep;
    return row[static_cast<std::size_t>(s)];
  }
};

struct UsageCap {
  int limit{1};
  CapScope scope{CapScope::Round};
};

// Hidden true values of one asteroid. Knowable only through intel.
struct AsteroidProfile {
  int max_minerals{0};
  int shallow_cost{0};
  int deep_cost{0};
};

using AsteroidField = std::array<AsteroidProfile, kAsteroidCount>;

struct RoundPlan {
  // Round 0 is a training round that precedes the scored rounds.
  bool training{true};
  // Scored rounds are numbered 1..scored.
  int scored{5};
  // After the training round the crew returns home and all intel, mined
  // flags and cap counters are cleared so scored rounds start fresh.
  bool reset_after_training{true};
};

// Immutable per-session configuration.
//
// Defaults match data/config/default_session.json.
struct SessionConfig {
  Pressure pressure{Pressure::High};
  Complexity complexity{Complexity::High};
  CaptainType captain_type{CaptainType::Human};

  // Seeds both the asteroid field (when not given explicitly) and the
  // mining draw stream.
  std::uint64_t seed{1};

  int pu_per_round{4};

  // Cost to travel to each asteroid, indexed by Asteroid.
  std::array<int, kAsteroidCount> travel_costs{0, 1, 2, 3};

  ActionCosts costs;
  StageDurations durations;
  ProbabilityMatrix probabilities;
  RoundPlan rounds;

  UsageCap probe_cap{2, CapScope::Session};
  UsageCap robot_cap{1, CapScope::Round};

  UnprobedYield unprobed_yield{UnprobedYield::TrueValue};
  // Yield of a successful mine when unprobed_yield == Fixed.
  int fallback_minerals{0};

  // When false an asteroid can be mined at most once per session.
  bool allow_repeat_mining{false};

  // Explicit hidden asteroid values. When unset the field is generated from
  // the seed (see generate_asteroid_field).
  std::optional<AsteroidField> asteroids;

  // Maximum number of session events kept in SessionState::events (0 = unlimited).
  int max_events{1000};

  TimeMs briefing_ms() const {
    return pressure == Pressure::High ? durations.briefing_high_pressure_ms : durations.briefing_low_pressure_ms;
  }
  int travel_cost(Asteroid a) const { return travel_costs[asteroid_index(a)]; }
  int mine_cost(Depth d) const { return d == Depth::Shallow ? costs.mine_shallow : costs.mine_deep; }
  int first_round() const { return rounds.training ? 0 : 1; }
  int last_round() const { return rounds.scored; }
};

// Fatal configuration problem. Raised only while loading a configuration or
// creating a session; a session never starts with an invalid configuration.
class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(std::vector<std::string> errors);

  const std::vector<std::string>& errors() const { return errors_; }

 private:
  std::vector<std::string> errors_;
};

// Validate a SessionConfig for internal consistency.
//
// Returns a list of human-readable error strings. An empty list means "valid".
std::vector<std::string> validate_session_config(const SessionConfig& cfg);

// Throws ConfigurationError listing every problem found by validate_session_config().
void require_valid_session_config(const SessionConfig& cfg);

// Build a SessionConfig from a JSON document.
//
// Required keys: pressure, complexity, captain_type, pu_per_round,
// travel_costs (all four asteroids), action_costs, stage_durations_s and
// probability_matrix (both depths, all four intel states). Everything else is
// optional and falls back to the SessionConfig defaults.
//
// Missing/mistyped keys and failed validation throw ConfigurationError with
// every problem found, not just the first.
SessionConfig session_config_from_json(const json::Value& v);
SessionConfig load_session_config_from_json(const std::string& json_text);
SessionConfig load_session_config_from_file(const std::string& path);

json::Value session_config_to_json_value(const SessionConfig& cfg);

// Deterministically roll hidden asteroid values from a seed.
//
// Alpha: max minerals 50-100, shallow 1, deep 2.
// Beta/Gamma/Omega: max minerals 60-120 / 70-140 / 80-160, shallow 1-3, deep 2-4.
AsteroidField generate_asteroid_field(std::uint64_t seed);

// cfg.asteroids if set, otherwise generate_asteroid_field(cfg.seed).
AsteroidField resolve_asteroid_field(const SessionConfig& cfg);

} // namespace shipcoord
