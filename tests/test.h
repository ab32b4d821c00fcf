#pragma once

// Minimal shared header for the test runner.
//
// Individual tests use their own local SC_ASSERT macro. Shared fixtures for
// the session tests live here so each file builds the same crew and field.

#include <cstdint>
#include <iostream>
#include <string>

#include "shipcoord/core/crew.h"
#include "shipcoord/core/session_config.h"

namespace shipcoord::test {

// Deterministic field: Alpha 80 (1/2), Beta 100 (2/3), Gamma 120 (1/4), Omega 150 (3/4).
inline AsteroidField fixed_field() {
  AsteroidField f{};
  f[asteroid_index(Asteroid::Alpha)] = AsteroidProfile{80, 1, 2};
  f[asteroid_index(Asteroid::Beta)] = AsteroidProfile{100, 2, 3};
  f[asteroid_index(Asteroid::Gamma)] = AsteroidProfile{120, 1, 4};
  f[asteroid_index(Asteroid::Omega)] = AsteroidProfile{150, 3, 4};
  return f;
}

// Default costs and matrix, no training round, explicit field.
inline SessionConfig basic_config(int scored_rounds = 3) {
  SessionConfig cfg;
  cfg.seed = 42;
  cfg.rounds.training = false;
  cfg.rounds.scored = scored_rounds;
  cfg.asteroids = fixed_field();
  return cfg;
}

inline Crew basic_crew() { return make_crew("cap", "nav", "drl"); }

// Stage durations of the default configuration under high pressure.
inline constexpr TimeMs kBriefingMs = 90'000;
inline constexpr TimeMs kActionMs = 15'000;
inline constexpr TimeMs kResultMs = 15'000;

} // namespace shipcoord::test
