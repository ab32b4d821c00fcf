#pragma once

#include <optional>
#include <string>
#include <variant>

#include "shipcoord/core/types.h"

namespace shipcoord {

struct SessionConfig;

// Do nothing this round.
//
// Submitted explicitly by a Navigator/Driller, or substituted by the round
// machine when the Action stage expires without a submission (implicit == true).
struct NoOp {
  bool implicit{false};
};

// Navigator: move the crew to another asteroid.
struct Travel {
  Asteroid destination{kHomeAsteroid};
};

// Navigator: reveal the max-minerals value of the crew's asteroid.
//
// target is optional; when given it must name the crew's current location.
struct SendProbe {
  std::optional<Asteroid> target;
};

// Driller: reveal the shallow/deep mining costs of the crew's asteroid.
struct DeployRobot {
  std::optional<Asteroid> target;
};

// Driller: attempt to mine the crew's asteroid at the given depth.
struct Mine {
  Depth depth{Depth::Shallow};
  std::optional<Asteroid> target;
};

using Action = std::variant<NoOp, Travel, SendProbe, DeployRobot, Mine>;

// Result of validating a submission. reason == None iff accepted.
struct ActionVerdict {
  bool accepted{false};
  RejectReason reason{RejectReason::None};

  static ActionVerdict accept() { return ActionVerdict{true, RejectReason::None}; }
  static ActionVerdict reject(RejectReason r) { return ActionVerdict{false, r}; }
};

ActionKind action_kind(const Action& action);

// Explicit target of a Probe/Robot/Mine action, if any.
std::optional<Asteroid> action_target(const Action& action);

// PU cost of an action under the given configuration.
int action_cost(const SessionConfig& cfg, const Action& action);

// Short human-readable label, e.g. "Travel(Beta)" or "Mine(deep)".
std::string action_to_string(const Action& action);

bool is_implicit_noop(const Action& action);

} // namespace shipcoord
