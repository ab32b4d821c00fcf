#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

#include "shipcoord/util/time.h"

namespace shipcoord {

using CrewId = std::uint64_t;
inline constexpr CrewId kInvalidCrewId = 0;

// --- crew roles ---

enum class Role : std::uint8_t {
  Captain = 0,
  Navigator = 1,
  Driller = 2,
};

inline constexpr std::size_t kRoleCount = 3;
inline constexpr std::array<Role, kRoleCount> kAllRoles{Role::Captain, Role::Navigator, Role::Driller};

inline std::size_t role_index(Role r) { return static_cast<std::size_t>(r); }

// --- asteroid field ---

enum class Asteroid : std::uint8_t {
  Alpha = 0,
  Beta = 1,
  Gamma = 2,
  Omega = 3,
};

inline constexpr std::size_t kAsteroidCount = 4;
inline constexpr std::array<Asteroid, kAsteroidCount> kAllAsteroids{Asteroid::Alpha, Asteroid::Beta,
                                                                   Asteroid::Gamma, Asteroid::Omega};

inline std::size_t asteroid_index(Asteroid a) { return static_cast<std::size_t>(a); }

// The crew starts every session (and every post-training reset) here.
inline constexpr Asteroid kHomeAsteroid = Asteroid::Alpha;

// --- experimental conditions ---

enum class Pressure : std::uint8_t { High, Low };
enum class Complexity : std::uint8_t { High, Low };
enum class CaptainType : std::uint8_t { Human, Llm };

// --- round / session lifecycle ---

enum class Stage : std::uint8_t {
  Briefing,
  Action,
  Result,
};

enum class SessionStatus : std::uint8_t {
  Pending,
  Running,
  Complete,
  Aborted,
};

// --- actions ---

enum class ActionKind : std::uint8_t {
  NoOp,
  Travel,
  SendProbe,
  DeployRobot,
  Mine,
};

enum class Depth : std::uint8_t { Shallow, Deep };

// Why an action (or chat message) was refused.
//
// None means accepted. UnknownCrew is only produced by CrewRegistry when the
// transport names a crew that is not hosted.
enum class RejectReason : std::uint8_t {
  None,
  StageViolation,
  RoleViolation,
  InsufficientPU,
  InvalidTarget,
  DuplicateAction,
  UnknownCrew,
};

// --- intel ---

enum class IntelKind : std::uint8_t {
  MaxMinerals,
  ShallowCost,
  DeepCost,
};

enum class IntelState : std::uint8_t {
  None = 0,
  ProbeOnly = 1,
  RobotOnly = 2,
  ProbePlusRobot = 3,
};

inline constexpr std::size_t kIntelStateCount = 4;

inline IntelState make_intel_state(bool probe_known, bool robot_known) {
  if (probe_known && robot_known) return IntelState::ProbePlusRobot;
  if (probe_known) return IntelState::ProbeOnly;
  if (robot_known) return IntelState::RobotOnly;
  return IntelState::None;
}

// --- configuration enums ---

// Whether a usage cap counts per round or over the whole session.
enum class CapScope : std::uint8_t { Round, Session };

// Mineral yield of a successful mine when the Driller never saw a
// max-minerals fact for the asteroid.
enum class UnprobedYield : std::uint8_t {
  TrueValue,
  Fixed,
};

// --- session event log ---

enum class EventLevel : std::uint8_t { Info, Warn };

enum class EventCategory : std::uint8_t {
  Session,
  Stage,
  Timeout,
  Intel,
  Mining,
  Skipped,
  Chat,
  Abort,
};

} // namespace shipcoord
