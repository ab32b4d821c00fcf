#include <iostream>

#include "shipcoord/core/intel_store.h"

#define SC_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_intel_store() {
  using namespace shipcoord;

  const IntelFact probe{Asteroid::Beta, IntelKind::MaxMinerals, 100, Role::Navigator, 2};
  const IntelFact shallow{Asteroid::Beta, IntelKind::ShallowCost, 2, Role::Driller, 2};
  const IntelFact deep{Asteroid::Beta, IntelKind::DeepCost, 3, Role::Driller, 2};

  // High complexity: discoverer sees it at once, the rest of the crew next round.
  {
    IntelStore s(Complexity::High);
    SC_ASSERT(s.record(probe));
    SC_ASSERT(!s.record(probe));
    SC_ASSERT(s.facts().size() == 1);

    SC_ASSERT(s.visible_to(Role::Navigator, probe, 2));
    SC_ASSERT(!s.visible_to(Role::Captain, probe, 2));
    SC_ASSERT(!s.visible_to(Role::Driller, probe, 2));
    SC_ASSERT(s.visible_to(Role::Captain, probe, 3));
    SC_ASSERT(s.visible_to(Role::Driller, probe, 3));

    SC_ASSERT(s.visible_facts(Role::Driller, 2).empty());
    SC_ASSERT(s.visible_facts(Role::Driller, 3).size() == 1);

    SC_ASSERT(s.intel_state_for(Role::Driller, Asteroid::Beta, 2) == IntelState::None);
    SC_ASSERT(s.intel_state_for(Role::Driller, Asteroid::Beta, 3) == IntelState::ProbeOnly);
    SC_ASSERT(s.intel_state_for(Role::Navigator, Asteroid::Beta, 2) == IntelState::ProbeOnly);

    // Robot facts discovered by the Driller count for the Driller immediately.
    SC_ASSERT(s.record(shallow));
    SC_ASSERT(s.record(deep));
    SC_ASSERT(s.intel_state_for(Role::Driller, Asteroid::Beta, 2) == IntelState::RobotOnly);
    SC_ASSERT(s.intel_state_for(Role::Driller, Asteroid::Beta, 3) == IntelState::ProbePlusRobot);
    SC_ASSERT(s.intel_state_for(Role::Navigator, Asteroid::Beta, 2) == IntelState::ProbeOnly);

    // Other asteroids are unaffected.
    SC_ASSERT(s.intel_state_for(Role::Driller, Asteroid::Gamma, 5) == IntelState::None);

    SC_ASSERT(!s.known_value(Role::Captain, Asteroid::Beta, IntelKind::MaxMinerals, 2));
    SC_ASSERT(s.known_value(Role::Captain, Asteroid::Beta, IntelKind::MaxMinerals, 3).value_or(-1) == 100);
    SC_ASSERT(s.known_value(Role::Driller, Asteroid::Beta, IntelKind::DeepCost, 2).value_or(-1) == 3);

    s.clear();
    SC_ASSERT(s.facts().empty());
    SC_ASSERT(s.intel_state_for(Role::Driller, Asteroid::Beta, 9) == IntelState::None);
  }

  // Low complexity: every fact is visible to every role immediately.
  {
    IntelStore s(Complexity::Low);
    SC_ASSERT(s.record(probe));
    for (Role r : kAllRoles) {
      SC_ASSERT(s.visible_to(r, probe, 2));
      SC_ASSERT(s.intel_state_for(r, Asteroid::Beta, 2) == IntelState::ProbeOnly);
    }
  }

  // Latest visible value wins for the same (asteroid, kind).
  {
    IntelStore s(Complexity::High);
    SC_ASSERT(s.record(IntelFact{Asteroid::Gamma, IntelKind::MaxMinerals, 90, Role::Navigator, 1}));
    SC_ASSERT(s.record(IntelFact{Asteroid::Gamma, IntelKind::MaxMinerals, 95, Role::Navigator, 3}));
    SC_ASSERT(s.facts().size() == 2);
    SC_ASSERT(s.known_value(Role::Navigator, Asteroid::Gamma, IntelKind::MaxMinerals, 3).value_or(-1) == 95);
    // The Driller only sees the older fact during round 3.
    SC_ASSERT(s.known_value(Role::Driller, Asteroid::Gamma, IntelKind::MaxMinerals, 3).value_or(-1) == 90);
  }

  return 0;
}
