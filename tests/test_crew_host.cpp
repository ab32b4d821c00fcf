#include <atomic>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "shipcoord/core/crew_host.h"
#include "shipcoord/core/serialization.h"
#include "shipcoord/util/log.h"

#include "test.h"

#define SC_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_crew_host() {
  using namespace shipcoord;

  constexpr TimeMs t0 = 1'000'000;

  // One hosted crew on a manual clock.
  {
    std::atomic<TimeMs> now{t0};
    const Clock clock = [&now]() { return now.load(); };

    CrewHost host(11, test::basic_config(2), test::basic_crew(), clock);
    SC_ASSERT(host.crew_id() == 11);
    SC_ASSERT(host.status().get() == SessionStatus::Pending);

    std::atomic<int> resolved{0};
    host.set_resolved_listener([&resolved](const RoundResolvedEvent&) { resolved.fetch_add(1); }).get();

    SC_ASSERT(host.start().get());
    SC_ASSERT(!host.start().get());
    SC_ASSERT(host.post_message(1, Role::Captain, std::nullopt, "Beta, shallow").get() == RejectReason::None);

    // The deadline passes on the clock; the next command sees Action.
    now = t0 + test::kBriefingMs;
    host.tick().get();
    const RoundView v = host.round_view(Role::Navigator).get();
    SC_ASSERT(v.stage == Stage::Action);
    SC_ASSERT(v.can_act);
    SC_ASSERT(v.remaining_ms == test::kActionMs);

    SC_ASSERT(host.submit_action(1, Role::Navigator, Travel{Asteroid::Beta}).get().accepted);
    SC_ASSERT(host.submit_action(1, Role::Driller, Mine{Depth::Shallow, std::nullopt}).get().accepted);
    SC_ASSERT(resolved.load() == 1);
    SC_ASSERT(host.round_view(Role::Driller).get().location == Asteroid::Beta);

    // Late submissions are refused through the host as well.
    SC_ASSERT(host.submit_action(1, Role::Navigator, NoOp{}).get().reason == RejectReason::DuplicateAction);

    const SessionSnapshot snap = deserialize_session_from_json(host.snapshot().get());
    SC_ASSERT(snap.saved_at_ms == t0 + test::kBriefingMs);
    SC_ASSERT(snap.state.resolved.size() == 1);

    // Let round 2 time out entirely.
    now = t0 + 2 * (test::kBriefingMs + test::kActionMs + test::kResultMs);
    host.tick().get();
    SC_ASSERT(host.status().get() == SessionStatus::Complete);
    SC_ASSERT(resolved.load() == 2);
    SC_ASSERT(!host.abort("after the end").get());

    host.stop();
    host.stop();
    bool threw = false;
    try {
      (void)host.status().get();
    } catch (const std::runtime_error&) {
      threw = true;
    }
    SC_ASSERT(threw);
  }

  // Registry: ids, unknown crews, removal and adoption.
  {
    std::atomic<TimeMs> now{t0};
    CrewRegistry reg([&now]() { return now.load(); });

    const CrewId a = reg.create_crew(test::basic_config(), test::basic_crew());
    const CrewId b = reg.create_crew(test::basic_config(), make_crew("x", "y", "z"));
    SC_ASSERT(a == 1);
    SC_ASSERT(b == 2);
    SC_ASSERT(reg.size() == 2);
    SC_ASSERT((reg.crew_ids() == std::vector<CrewId>{1, 2}));

    SC_ASSERT(reg.submit_action(99, 1, Role::Navigator, NoOp{}).reason == RejectReason::UnknownCrew);
    SC_ASSERT(reg.post_message(99, 1, Role::Captain, std::nullopt, "hi") == RejectReason::UnknownCrew);
    SC_ASSERT(!reg.get_round_view(99, Role::Captain).has_value());
    SC_ASSERT(!reg.start(99));
    SC_ASSERT(!reg.abort(99, "none"));
    SC_ASSERT(!reg.remove(99));
    SC_ASSERT(reg.find(99) == nullptr);

    SC_ASSERT(reg.start(a));
    now = t0 + test::kBriefingMs;
    SC_ASSERT(reg.submit_action(a, 1, Role::Navigator, Travel{Asteroid::Gamma}).accepted);
    // Crew b was never started.
    SC_ASSERT(reg.submit_action(b, 1, Role::Navigator, Travel{Asteroid::Gamma}).reason ==
              RejectReason::StageViolation);
    SC_ASSERT(reg.get_round_view(a, Role::Navigator)->own_action.has_value());
    SC_ASSERT(!reg.get_round_view(b, Role::Navigator)->own_action.has_value());

    SC_ASSERT(reg.remove(b));
    SC_ASSERT(reg.size() == 1);

    bool threw = false;
    try {
      SessionConfig bad = test::basic_config();
      bad.rounds.scored = 0;
      (void)reg.create_crew(bad, test::basic_crew());
    } catch (const ConfigurationError&) {
      threw = true;
    }
    SC_ASSERT(threw);
    SC_ASSERT(reg.size() == 1);

    SC_ASSERT(!reg.adopt(Session(a, test::basic_config(), test::basic_crew(), now.load())));
    SC_ASSERT(reg.adopt(Session(7, test::basic_config(), test::basic_crew(), now.load())));
    SC_ASSERT(reg.find(7) != nullptr);
    SC_ASSERT(reg.create_crew(test::basic_config(), test::basic_crew()) == 8);
  }

  // Crews hosted side by side do not interfere.
  {
    std::atomic<TimeMs> now{t0};
    CrewRegistry reg([&now]() { return now.load(); });

    constexpr int kCrews = 6;
    std::vector<CrewId> ids;
    for (int i = 0; i < kCrews; ++i) {
      ids.push_back(reg.create_crew(test::basic_config(1), test::basic_crew()));
      SC_ASSERT(reg.start(ids.back()));
    }
    now = t0 + test::kBriefingMs;

    std::atomic<int> accepted{0};
    std::vector<std::thread> threads;
    for (CrewId id : ids) {
      threads.emplace_back([&reg, &accepted, id]() {
        if (reg.submit_action(id, 1, Role::Navigator, SendProbe{}).accepted) accepted.fetch_add(1);
        if (reg.submit_action(id, 1, Role::Driller, DeployRobot{}).accepted) accepted.fetch_add(1);
      });
    }
    for (auto& t : threads) t.join();
    SC_ASSERT(accepted.load() == 2 * kCrews);

    for (CrewId id : ids) {
      const auto v = reg.get_round_view(id, Role::Driller);
      SC_ASSERT(v.has_value());
      SC_ASSERT(v->stage == Stage::Result);
      SC_ASSERT(v->pu_remaining == 2);
      SC_ASSERT(v->intel.size() == 2);
    }
  }

  // A throwing resolved listener is logged. The verdict still reaches the
  // caller and the deadline timer keeps resolving rounds.
  {
    std::atomic<TimeMs> now{t0};
    const Clock clock = [&now]() { return now.load(); };
    std::atomic<int> listener_errors{0};
    log::set_sink([&listener_errors](log::Level l, const std::string& msg) {
      if (l == log::Level::Error && msg.find("listener failed") != std::string::npos) listener_errors.fetch_add(1);
    });

    CrewHost host(12, test::basic_config(2), test::basic_crew(), clock);
    std::atomic<int> calls{0};
    host.set_resolved_listener([&calls](const RoundResolvedEvent&) {
          calls.fetch_add(1);
          throw std::runtime_error("persistence down");
        }).get();

    const bool started = host.start().get();
    now = t0 + test::kBriefingMs;
    const bool nav_ok = host.submit_action(1, Role::Navigator, Travel{Asteroid::Beta}).get().accepted;
    const ActionVerdict drl = host.submit_action(1, Role::Driller, Mine{Depth::Shallow, std::nullopt}).get();
    const int calls_after_submit = calls.load();

    // Nobody acts in round 2; only the worker's timer resolves it.
    now = t0 + 2 * (test::kBriefingMs + test::kActionMs + test::kResultMs);
    host.tick().get();
    const SessionStatus status = host.status().get();
    const RoundView v = host.round_view(Role::Captain).get();
    host.stop();
    log::set_sink({});

    SC_ASSERT(started);
    SC_ASSERT(nav_ok);
    SC_ASSERT(drl.accepted);
    SC_ASSERT(drl.reason == RejectReason::None);
    SC_ASSERT(calls_after_submit == 1);
    SC_ASSERT(calls.load() == 2);
    SC_ASSERT(listener_errors.load() == 2);
    SC_ASSERT(status == SessionStatus::Complete);
    SC_ASSERT(v.location == Asteroid::Beta);
  }

  // A crew stopped after the registry lookup reads as unknown.
  {
    std::atomic<TimeMs> now{t0};
    CrewRegistry reg([&now]() { return now.load(); });
    const CrewId id = reg.create_crew(test::basic_config(), test::basic_crew());
    const auto host = reg.find(id);
    SC_ASSERT(host != nullptr);
    host->stop();

    SC_ASSERT(reg.find(id) != nullptr);
    SC_ASSERT(reg.submit_action(id, 1, Role::Navigator, NoOp{}).reason == RejectReason::UnknownCrew);
    SC_ASSERT(reg.post_message(id, 1, Role::Captain, std::nullopt, "hi") == RejectReason::UnknownCrew);
    SC_ASSERT(!reg.get_round_view(id, Role::Captain).has_value());
    SC_ASSERT(!reg.start(id));
    SC_ASSERT(!reg.abort(id, "gone"));
    SC_ASSERT(reg.remove(id));
  }

  return 0;
}
