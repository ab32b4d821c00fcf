#include <iostream>
#include <string>
#include <vector>

#include "shipcoord/core/session.h"

#include "test.h"

#define SC_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_session() {
  using namespace shipcoord;

  constexpr TimeMs t0 = 50'000;

  // Construction validates config and crew together.
  {
    SessionConfig bad = test::basic_config();
    bad.pu_per_round = 0;
    bool threw = false;
    try {
      Session s(1, bad, make_crew("a", "a", "b"), t0);
    } catch (const ConfigurationError& e) {
      threw = true;
      SC_ASSERT(e.errors().size() == 2);
    }
    SC_ASSERT(threw);

    threw = false;
    try {
      Session s(kInvalidCrewId, test::basic_config(), test::basic_crew(), t0);
    } catch (const ConfigurationError&) {
      threw = true;
    }
    SC_ASSERT(threw);
  }

  // Training round, reset, one scored round.
  {
    SessionConfig cfg = test::basic_config(1);
    cfg.rounds.training = true;
    cfg.rounds.reset_after_training = true;
    cfg.probabilities.at(Depth::Deep, IntelState::None) = 1.0;

    Session s(3, cfg, test::basic_crew(), t0);
    SC_ASSERT(s.status() == SessionStatus::Pending);
    SC_ASSERT(!s.next_deadline().has_value());

    std::vector<RoundResolvedEvent> seen;
    s.set_resolved_listener([&](const RoundResolvedEvent& ev) { seen.push_back(ev); });

    SC_ASSERT(s.start(t0));
    SC_ASSERT(!s.start(t0));
    SC_ASSERT(s.current_round() == 0);
    SC_ASSERT(s.next_deadline().value_or(0) == t0 + test::kBriefingMs);

    const RoundView brief = s.round_view(Role::Navigator, t0 + 1'000);
    SC_ASSERT(brief.training);
    SC_ASSERT(!brief.can_act);
    SC_ASSERT(brief.remaining_ms == test::kBriefingMs - 1'000);
    SC_ASSERT(brief.asteroids[asteroid_index(Asteroid::Alpha)].here);

    // submit_action applies the due transition first.
    const TimeMs a0 = t0 + test::kBriefingMs;
    SC_ASSERT(s.submit_action(0, Role::Navigator, Travel{Asteroid::Beta}, a0).accepted);
    SC_ASSERT(s.stage() == Stage::Action);
    SC_ASSERT(s.round_view(Role::Navigator, a0).own_action.has_value());
    SC_ASSERT(!s.round_view(Role::Driller, a0).own_action.has_value());
    SC_ASSERT(s.round_view(Role::Driller, a0).pu_available == 3);

    SC_ASSERT(s.submit_action(0, Role::Driller, DeployRobot{}, a0 + 10).accepted);
    SC_ASSERT(s.stage() == Stage::Result);
    SC_ASSERT(seen.size() == 1);
    SC_ASSERT(seen[0].training);
    SC_ASSERT(seen[0].location_after == Asteroid::Beta);
    SC_ASSERT(seen[0].discovered.size() == 2);

    // High complexity: only the Driller sees robot facts in the discovery round.
    {
      const RoundView drl = s.round_view(Role::Driller, a0 + 20);
      const RoundView nav = s.round_view(Role::Navigator, a0 + 20);
      SC_ASSERT(drl.asteroids[asteroid_index(Asteroid::Beta)].shallow_cost.value_or(-1) == 2);
      SC_ASSERT(drl.asteroids[asteroid_index(Asteroid::Beta)].deep_cost.value_or(-1) == 3);
      SC_ASSERT(!nav.asteroids[asteroid_index(Asteroid::Beta)].shallow_cost.has_value());
      SC_ASSERT(nav.intel.empty());
      SC_ASSERT(drl.intel.size() == 2);
      SC_ASSERT(drl.robots_left == 0);
    }

    // Training spend does not count toward the scored totals.
    SC_ASSERT(s.state().cumulative_pu_spent == 0);

    // Next round: home again with a clean slate.
    const TimeMs b1 = a0 + 10 + test::kResultMs;
    s.tick(b1);
    SC_ASSERT(s.current_round() == 1);
    SC_ASSERT(s.stage() == Stage::Briefing);
    SC_ASSERT(s.state().location == Asteroid::Alpha);
    SC_ASSERT(s.state().intel.facts().empty());
    SC_ASSERT(s.state().robots_total == 0);
    SC_ASSERT(s.round_view(Role::Driller, b1).robots_left == 1);
    SC_ASSERT(!s.round_view(Role::Driller, b1).training);

    // Chat goes through the session too.
    SC_ASSERT(s.post_message(1, Role::Captain, Role::Navigator, "head for Gamma", b1 + 5) == RejectReason::None);
    SC_ASSERT(s.round_view(Role::Navigator, b1 + 5).messages.size() == 1);
    SC_ASSERT(s.round_view(Role::Driller, b1 + 5).messages.empty());

    // Participants are mapped to their roles; strangers are refused.
    const TimeMs a1 = b1 + test::kBriefingMs;
    SC_ASSERT(s.submit_action_as("ghost", 1, NoOp{}, a1).reason == RejectReason::RoleViolation);
    SC_ASSERT(s.submit_action_as("cap", 1, NoOp{}, a1).reason == RejectReason::RoleViolation);
    SC_ASSERT(s.submit_action_as("nav", 1, Travel{Asteroid::Gamma}, a1).accepted);
    SC_ASSERT(s.submit_action_as("drl", 1, Mine{Depth::Deep, std::nullopt}, a1 + 1).accepted);

    SC_ASSERT(seen.size() == 2);
    const RoundResolvedEvent& last = seen[1];
    SC_ASSERT(!last.training);
    SC_ASSERT(last.session_complete);
    SC_ASSERT(last.outcome.has_value());
    SC_ASSERT(last.outcome->asteroid == Asteroid::Gamma);
    SC_ASSERT(last.outcome->success);
    SC_ASSERT(last.outcome->minerals == 120);
    SC_ASSERT(last.pu_remaining == 0);
    SC_ASSERT(last.cumulative_pu_spent == 4);

    s.tick(a1 + 1 + test::kResultMs);
    SC_ASSERT(s.status() == SessionStatus::Complete);
    SC_ASSERT(!s.next_deadline().has_value());
    SC_ASSERT(s.state().cumulative_minerals == 120);
    SC_ASSERT(!s.abort(a1 + 1 + test::kResultMs, "too late"));
    SC_ASSERT(seen.size() == 2);
  }

  // A listener that reads back into the session sees the updated state.
  {
    Session s(4, test::basic_config(1), test::basic_crew(), t0);
    int calls = 0;
    s.set_resolved_listener([&](const RoundResolvedEvent& ev) {
      ++calls;
      if (s.state().resolved.size() != 1 || ev.round != 1) calls = -100;
    });
    SC_ASSERT(s.start(t0));
    s.tick(t0 + test::kBriefingMs + test::kActionMs);
    SC_ASSERT(calls == 1);
    SC_ASSERT(s.stage() == Stage::Result);
  }

  // Abort from Pending.
  {
    Session s(5, test::basic_config(), test::basic_crew(), t0);
    SC_ASSERT(s.abort(t0, "crew never formed"));
    SC_ASSERT(s.status() == SessionStatus::Aborted);
    SC_ASSERT(!s.start(t0));
  }

  return 0;
}
