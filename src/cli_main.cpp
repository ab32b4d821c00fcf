#include <algorithm>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "shipcoord/core/enum_strings.h"
#include "shipcoord/core/serialization.h"
#include "shipcoord/core/session.h"
#include "shipcoord/core/session_config.h"
#include "shipcoord/util/event_export.h"
#include "shipcoord/util/file_io.h"
#include "shipcoord/util/json.h"
#include "shipcoord/util/log.h"
#include "shipcoord/util/strings.h"

using namespace shipcoord;

namespace {

#ifndef SHIPCOORD_VERSION
#define SHIPCOORD_VERSION "unknown"
#endif

int get_int_arg(int argc, char** argv, const std::string& key, int def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return std::stoi(argv[i + 1]);
  }
  return def;
}

std::string get_str_arg(int argc, char** argv, const std::string& key, const std::string& def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return argv[i + 1];
  }
  return def;
}

bool has_flag(int argc, char** argv, const std::string& flag) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] == flag) return true;
  }
  return false;
}

void print_usage(const char* exe) {
  std::cout << "shipcoord CLI v" << SHIPCOORD_VERSION << "\n\n";
  std::cout << "Runs a crew session with scripted participants on a simulated clock.\n\n";
  std::cout << "Usage: " << (exe ? exe : "shipcoord_cli") << " [options]\n\n";
  std::cout << "Options:\n";
  std::cout << "  --config PATH      Session config JSON (default: data/config/default_session.json)\n";
  std::cout << "  --seed N           Override the config seed\n";
  std::cout << "  --pressure P       Override pressure (high|low)\n";
  std::cout << "  --complexity C     Override complexity (high|low)\n";
  std::cout << "  --captain T        Override captain type (human|llm)\n";
  std::cout << "  --rounds N         Override the number of scored rounds\n";
  std::cout << "  --no-training      Skip the training round\n";
  std::cout << "  --strategy NAME    Crew behaviour: scout|greedy|idle (default: scout)\n";
  std::cout << "  --stop-after N     Stop after round N resolves (use with --save to resume later)\n";
  std::cout << "  --load PATH        Resume a session snapshot instead of starting a new session\n";
  std::cout << "  --save PATH        Write a session snapshot when the run stops\n";
  std::cout << "  --events-csv PATH     Export the session event log as CSV\n";
  std::cout << "  --events-jsonl PATH   Export the session event log as JSON Lines\n";
  std::cout << "  --rounds-csv PATH     Export one analytics row per resolved round as CSV\n";
  std::cout << "  --rounds-jsonl PATH   Export round-resolved events as JSON Lines\n";
  std::cout << "  --append-rounds PATH  Append round-resolved events to a JSON Lines file shared across runs\n";
  std::cout << "  --events-summary   Print event counts by level/category\n";
  std::cout << "  --validate-config  Validate the config file and exit\n";
  std::cout << "  --dump-config      Print the effective config JSON and exit\n";
  std::cout << "  --log-level L      debug|info|warn|error|off (default: warn)\n";
  std::cout << "  --quiet            Suppress per-round output\n";
  std::cout << "  -h, --help         Show this help\n";
  std::cout << "  --version          Print version and exit\n";
}

enum class Strategy { Scout, Greedy, Idle };

bool strategy_from_string(const std::string& s, Strategy* out) {
  const std::string v = to_lower(s);
  if (v == "scout") {
    *out = Strategy::Scout;
  } else if (v == "greedy") {
    *out = Strategy::Greedy;
  } else if (v == "idle") {
    *out = Strategy::Idle;
  } else {
    return false;
  }
  return true;
}

// Cheapest affordable unmined asteroid other than the current one.
std::optional<Asteroid> pick_destination(const RoundView& v) {
  std::optional<Asteroid> best;
  int best_cost = 0;
  for (const auto& row : v.asteroids) {
    if (row.here || row.mined || row.travel_cost > v.pu_available) continue;
    if (!best || row.travel_cost < best_cost) {
      best = row.asteroid;
      best_cost = row.travel_cost;
    }
  }
  return best;
}

std::optional<Action> navigator_move(Strategy strategy, const RoundView& v, const SessionConfig& cfg) {
  if (strategy == Strategy::Idle) return std::nullopt;
  const RoundView::AsteroidRow& here = v.asteroids[asteroid_index(v.location)];

  if (here.mined) {
    if (const auto dest = pick_destination(v)) return Action{Travel{*dest}};
    return Action{NoOp{}};
  }
  if (strategy == Strategy::Scout && !here.max_minerals && v.probes_left > 0 && v.pu_available >= cfg.costs.probe) {
    return Action{SendProbe{}};
  }
  return Action{NoOp{}};
}

std::optional<Action> driller_move(Strategy strategy, const RoundView& v, const SessionConfig& cfg) {
  if (strategy == Strategy::Idle) return std::nullopt;
  const RoundView::AsteroidRow& here = v.asteroids[asteroid_index(v.location)];

  if (here.mined && !cfg.allow_repeat_mining) return Action{NoOp{}};
  if (strategy == Strategy::Scout && !here.shallow_cost && v.robots_left > 0 && v.pu_available >= cfg.costs.robot) {
    return Action{DeployRobot{}};
  }
  // The Navigator acts at the same time; leave enough PU for a probe.
  const int reserve = strategy == Strategy::Scout ? cfg.costs.probe : 0;
  if (v.pu_available - reserve >= cfg.costs.mine_deep) return Action{Mine{Depth::Deep, std::nullopt}};
  if (v.pu_available >= cfg.costs.mine_shallow) return Action{Mine{Depth::Shallow, std::nullopt}};
  return Action{NoOp{}};
}

void submit_with_fallback(Session& session, Role role, const Action& action, TimeMs now, bool quiet) {
  const ActionVerdict v = session.submit_action(session.current_round(), role, action, now);
  if (v.accepted) return;
  if (!quiet) {
    std::cout << "  " << role_to_string(role) << " " << action_to_string(action)
              << " rejected: " << reject_reason_to_string(v.reason) << "\n";
  }
  if (session.stage() == Stage::Action) {
    (void)session.submit_action(session.current_round(), role, Action{NoOp{}}, now);
  }
}

void print_round(const RoundResolvedEvent& ev) {
  const auto& nav = ev.steps[role_index(Role::Navigator)];
  const auto& drl = ev.steps[role_index(Role::Driller)];
  std::cout << (ev.training ? "Training round " : "Round ") << ev.round << ": navigator "
            << action_to_string(nav.action) << (nav.applied ? "" : " [skipped]") << ", driller "
            << action_to_string(drl.action) << (drl.applied ? "" : " [skipped]") << " @ "
            << asteroid_to_string(ev.location_after);
  if (ev.outcome) {
    const MiningOutcome& m = *ev.outcome;
    std::cout << " -> " << (m.success ? "success" : "failure") << " (" << intel_state_to_string(m.intel_state)
              << ", p=" << m.probability << ", draw=" << m.draw << ", +" << m.minerals << ")";
  }
  for (const auto& f : ev.discovered) {
    std::cout << "\n    intel: " << asteroid_to_string(f.asteroid) << " " << intel_kind_to_string(f.kind) << " = "
              << f.value << " (" << role_to_string(f.discoverer) << ")";
  }
  std::cout << "\n    PU left " << ev.pu_remaining << "/" << (ev.pu_remaining + ev.pu_spent_round)
            << ", total minerals " << ev.cumulative_minerals << "\n";
}

} // namespace

int main(int argc, char** argv) {
  try {
    if (has_flag(argc, argv, "--version")) {
      std::cout << SHIPCOORD_VERSION << "\n";
      return 0;
    }
    if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
      print_usage(argv[0]);
      return 0;
    }

    log::Level level = log::Level::Warn;
    const std::string level_s = get_str_arg(argc, argv, "--log-level", "warn");
    if (!log::level_from_string(level_s, &level)) {
      std::cerr << "Unknown --log-level: '" << level_s << "'\n\n";
      print_usage(argv[0]);
      return 2;
    }
    log::set_level(level);

    const bool quiet = has_flag(argc, argv, "--quiet");
    const std::string config_path = get_str_arg(argc, argv, "--config", "data/config/default_session.json");
    const std::string load_path = get_str_arg(argc, argv, "--load", "");
    const std::string save_path = get_str_arg(argc, argv, "--save", "");
    const int stop_after = get_int_arg(argc, argv, "--stop-after", -1);

    Strategy strategy = Strategy::Scout;
    const std::string strategy_s = get_str_arg(argc, argv, "--strategy", "scout");
    if (!strategy_from_string(strategy_s, &strategy)) {
      std::cerr << "Unknown --strategy: '" << strategy_s << "'\n\n";
      print_usage(argv[0]);
      return 2;
    }

    std::optional<Session> session;
    TimeMs now = wall_clock_ms();

    if (!load_path.empty()) {
      SessionSnapshot snap = deserialize_session_from_json(read_text_file(load_path));
      // Simulated clock: resume exactly where the snapshot left off.
      now = snap.saved_at_ms;
      session.emplace(Session::restore(std::move(snap.state), now, now));
    } else {
      SessionConfig cfg;
      try {
        cfg = load_session_config_from_file(config_path);
      } catch (const ConfigurationError& e) {
        std::cerr << "Config validation failed (" << config_path << "):\n";
        for (const auto& err : e.errors()) std::cerr << "  - " << err << "\n";
        return 1;
      }

      const std::string seed_s = get_str_arg(argc, argv, "--seed", "");
      if (!seed_s.empty()) cfg.seed = std::stoull(seed_s);

      const std::string pressure_s = get_str_arg(argc, argv, "--pressure", "");
      if (!pressure_s.empty() && !pressure_from_string(pressure_s, &cfg.pressure)) {
        std::cerr << "Unknown --pressure: '" << pressure_s << "'\n";
        return 2;
      }
      const std::string complexity_s = get_str_arg(argc, argv, "--complexity", "");
      if (!complexity_s.empty() && !complexity_from_string(complexity_s, &cfg.complexity)) {
        std::cerr << "Unknown --complexity: '" << complexity_s << "'\n";
        return 2;
      }
      const std::string captain_s = get_str_arg(argc, argv, "--captain", "");
      if (!captain_s.empty() && !captain_type_from_string(captain_s, &cfg.captain_type)) {
        std::cerr << "Unknown --captain: '" << captain_s << "'\n";
        return 2;
      }
      cfg.rounds.scored = get_int_arg(argc, argv, "--rounds", cfg.rounds.scored);
      if (has_flag(argc, argv, "--no-training")) cfg.rounds.training = false;

      if (has_flag(argc, argv, "--validate-config") || has_flag(argc, argv, "--dump-config")) {
        const auto errors = validate_session_config(cfg);
        if (!errors.empty()) {
          std::cerr << "Config validation failed:\n";
          for (const auto& e : errors) std::cerr << "  - " << e << "\n";
          return 1;
        }
        if (has_flag(argc, argv, "--dump-config")) {
          std::cout << json::stringify(session_config_to_json_value(cfg), 2) << "\n";
        } else if (!quiet) {
          std::cout << "Config OK\n";
        }
        return 0;
      }

      const Crew crew = make_crew("captain", "navigator", "driller", cfg.captain_type == CaptainType::Llm);
      session.emplace(1, cfg, crew, now);
      session->start(now);
    }

    Session& s = *session;
    const SessionConfig& cfg = s.config();
    if (!quiet) s.set_resolved_listener(print_round);

    while (s.status() == SessionStatus::Running) {
      const int round = s.current_round();
      switch (s.stage()) {
        case Stage::Briefing:
          if (s.state().round.messages.empty()) {
            const RejectReason r = s.post_message(round, Role::Captain, std::nullopt,
                                                  "Round " + std::to_string(round) + ": stay efficient.", now);
            if (r != RejectReason::None) log::warn(std::string("captain message rejected: ") + reject_reason_to_string(r));
          }
          now = s.state().round.deadline_ms;
          s.tick(now);
          break;

        case Stage::Action: {
          // Each participant decides from its own filtered view.
          const RoundView nav_view = s.round_view(Role::Navigator, now);
          const RoundView drl_view = s.round_view(Role::Driller, now);
          if (const auto a = navigator_move(strategy, nav_view, cfg)) submit_with_fallback(s, Role::Navigator, *a, now, quiet);
          if (s.stage() == Stage::Action) {
            if (const auto a = driller_move(strategy, drl_view, cfg)) submit_with_fallback(s, Role::Driller, *a, now, quiet);
          }
          if (s.stage() == Stage::Action) {
            now = s.state().round.deadline_ms;
            s.tick(now);
          }
          break;
        }

        case Stage::Result:
          if (stop_after >= 0 && round >= stop_after) break;
          now = s.state().round.deadline_ms;
          s.tick(now);
          break;
      }
      if (stop_after >= 0 && s.stage() == Stage::Result && s.current_round() >= stop_after) {
        if (!quiet) std::cout << "\nStopped after round " << s.current_round() << "\n";
        break;
      }
    }

    const SessionState& st = s.state();
    if (!quiet && st.status == SessionStatus::Complete) {
      std::cout << "\nSession complete: " << st.cumulative_minerals << " minerals, " << st.cumulative_pu_spent
                << " PU spent over " << cfg.rounds.scored << " scored rounds";
      if (cfg.rounds.training) std::cout << " (training minerals: " << st.training_minerals << ")";
      std::cout << "\n";
    }

    const std::string events_csv = get_str_arg(argc, argv, "--events-csv", "");
    if (!events_csv.empty()) write_text_file(events_csv, events_to_csv(st.crew_id, st.events));
    const std::string events_jsonl = get_str_arg(argc, argv, "--events-jsonl", "");
    if (!events_jsonl.empty()) write_text_file(events_jsonl, events_to_jsonl(st.crew_id, st.events));
    const std::string rounds_csv = get_str_arg(argc, argv, "--rounds-csv", "");
    if (!rounds_csv.empty()) write_text_file(rounds_csv, rounds_to_csv(st.crew_id, st.resolved));
    const std::string rounds_jsonl = get_str_arg(argc, argv, "--rounds-jsonl", "");
    if (!rounds_jsonl.empty()) write_text_file(rounds_jsonl, rounds_to_jsonl(st.crew_id, st.resolved));
    const std::string append_rounds = get_str_arg(argc, argv, "--append-rounds", "");
    if (!append_rounds.empty()) append_text_file(append_rounds, rounds_to_jsonl(st.crew_id, st.resolved));

    if (has_flag(argc, argv, "--events-summary")) std::cout << events_summary_to_json(st.events);

    if (!save_path.empty()) {
      write_text_file(save_path, serialize_session_to_json(st, now));
      if (!quiet) std::cout << "Saved to " << save_path << "\n";
    }

    return 0;
  } catch (const std::exception& e) {
    log::error(std::string("Fatal: ") + e.what());
    return 1;
  }
}
