#include <iostream>

#include "shipcoord/core/crew.h"

#define SC_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_crew() {
  using namespace shipcoord;

  const Crew c = make_crew("p1", "p2", "p3");
  SC_ASSERT(validate_crew(c, CaptainType::Human).empty());
  SC_ASSERT(c.role_of("p2").value_or(Role::Captain) == Role::Navigator);
  SC_ASSERT(c.role_of("p3").value_or(Role::Captain) == Role::Driller);
  SC_ASSERT(!c.role_of("nobody").has_value());
  SC_ASSERT(!c.role_of("").has_value());

  // LLM captain sessions need an AI in the Captain slot, and only there.
  SC_ASSERT(validate_crew(c, CaptainType::Llm).size() == 1);
  const Crew ai = make_crew("llm-1", "p2", "p3", true);
  SC_ASSERT(validate_crew(ai, CaptainType::Llm).empty());
  SC_ASSERT(validate_crew(ai, CaptainType::Human).size() == 1);

  {
    Crew bad = make_crew("p1", "p2", "p3");
    bad.slot(Role::Driller).ai = true;
    SC_ASSERT(validate_crew(bad, CaptainType::Human).size() == 1);
  }

  // Unbound slots and duplicate participants are each reported.
  {
    const Crew bad = make_crew("p1", "p1", "");
    const auto errors = validate_crew(bad, CaptainType::Human);
    SC_ASSERT(errors.size() == 2);
  }

  return 0;
}
