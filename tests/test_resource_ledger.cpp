#include <iostream>
#include <string>

#include "shipcoord/core/resource_ledger.h"

#define SC_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_resource_ledger() {
  using namespace shipcoord;

  ResourceLedger l(4);
  SC_ASSERT(l.per_round() == 4);
  SC_ASSERT(l.remaining() == 4);
  SC_ASSERT(l.spent() == 0);

  // Holds earmark PU against the other roles, not the holder.
  l.hold(Role::Navigator, 3);
  SC_ASSERT(l.total_held() == 3);
  SC_ASSERT(l.available_for(Role::Navigator) == 4);
  SC_ASSERT(l.available_for(Role::Driller) == 1);

  // Replacing a hold swaps the amount rather than adding.
  l.hold(Role::Navigator, 1);
  SC_ASSERT(l.held_by(Role::Navigator) == 1);
  SC_ASSERT(l.available_for(Role::Driller) == 3);

  // reserve debits and clears the hold.
  SC_ASSERT(l.reserve(Role::Navigator, 1));
  SC_ASSERT(l.remaining() == 3);
  SC_ASSERT(l.held_by(Role::Navigator) == 0);
  SC_ASSERT(l.spent_by(Role::Navigator) == 1);

  // Over-budget reserve fails and changes nothing.
  SC_ASSERT(!l.reserve(Role::Driller, 4));
  SC_ASSERT(l.remaining() == 3);
  SC_ASSERT(l.spent_by(Role::Driller) == 0);

  // Exact spend down to zero is allowed; remaining never goes negative.
  SC_ASSERT(l.reserve(Role::Driller, 3));
  SC_ASSERT(l.remaining() == 0);
  SC_ASSERT(!l.reserve(Role::Driller, 1));
  SC_ASSERT(l.remaining() == 0);
  SC_ASSERT(l.spent() == 4);

  // Zero-cost reserve always succeeds; negative costs are refused.
  SC_ASSERT(l.reserve(Role::Navigator, 0));
  SC_ASSERT(!l.reserve(Role::Navigator, -1));

  // Reset restores the full budget and clears bookkeeping.
  l.hold(Role::Driller, 2);
  l.reset(2);
  SC_ASSERT(l.remaining() == 2);
  SC_ASSERT(l.total_held() == 0);
  SC_ASSERT(l.spent() == 0);
  SC_ASSERT(l.spent_by(Role::Driller) == 0);

  // Holds larger than the budget leave nothing for the other role.
  l.hold(Role::Navigator, 3);
  SC_ASSERT(l.available_for(Role::Driller) == 0);
  l.release_hold(Role::Navigator);
  SC_ASSERT(l.available_for(Role::Driller) == 2);

  // Loaded values are checked separately.
  SC_ASSERT(l.consistent());
  std::string why;
  ResourceLedger loaded;
  loaded.load(4, 5, {0, 0, 0}, {0, 0, 0});
  SC_ASSERT(!loaded.consistent(&why));
  SC_ASSERT(why.find("remaining") != std::string::npos);
  loaded.load(4, -1, {0, 0, 0}, {0, 2, 3});
  SC_ASSERT(!loaded.consistent());
  loaded.load(4, 2, {0, 0, 0}, {0, 1, 0});
  SC_ASSERT(!loaded.consistent());
  loaded.load(4, 2, {0, 0, 1}, {0, 1, 1});
  SC_ASSERT(loaded.consistent());

  return 0;
}
