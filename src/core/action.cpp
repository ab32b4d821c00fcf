#include "shipcoord/core/action.h"

#include <sstream>
#include <type_traits>

#include "shipcoord/core/enum_strings.h"
#include "shipcoord/core/session_config.h"

namespace shipcoord {

ActionKind action_kind(const Action& action) {
  return std::visit(
      [](const auto& a) {
        using T = std::decay_t<decltype(a)>;
        if constexpr (std::is_same_v<T, Travel>) {
          return ActionKind::Travel;
        } else if constexpr (std::is_same_v<T, SendProbe>) {
          return ActionKind::SendProbe;
        } else if constexpr (std::is_same_v<T, DeployRobot>) {
          return ActionKind::DeployRobot;
        } else if constexpr (std::is_same_v<T, Mine>) {
          return ActionKind::Mine;
        } else {
          return ActionKind::NoOp;
        }
      },
      action);
}

std::optional<Asteroid> action_target(const Action& action) {
  if (const auto* p = std::get_if<SendProbe>(&action)) return p->target;
  if (const auto* r = std::get_if<DeployRobot>(&action)) return r->target;
  if (const auto* m = std::get_if<Mine>(&action)) return m->target;
  return std::nullopt;
}

int action_cost(const SessionConfig& cfg, const Action& action) {
  return std::visit(
      [&cfg](const auto& a) {
        using T = std::decay_t<decltype(a)>;
        if constexpr (std::is_same_v<T, Travel>) {
          return cfg.travel_cost(a.destination);
        } else if constexpr (std::is_same_v<T, SendProbe>) {
          return cfg.costs.probe;
        } else if constexpr (std::is_same_v<T, DeployRobot>) {
          return cfg.costs.robot;
        } else if constexpr (std::is_same_v<T, Mine>) {
          return cfg.mine_cost(a.depth);
        } else {
          return 0;
        }
      },
      action);
}

std::string action_to_string(const Action& action) {
  return std::visit(
      [](const auto& a) {
        using T = std::decay_t<decltype(a)>;
        std::ostringstream ss;
        if constexpr (std::is_same_v<T, NoOp>) {
          ss << (a.implicit ? "NoOp(timeout)" : "NoOp");
        } else if constexpr (std::is_same_v<T, Travel>) {
          ss << "Travel(" << asteroid_to_string(a.destination) << ")";
        } else if constexpr (std::is_same_v<T, SendProbe>) {
          ss << "SendProbe";
          if (a.target) ss << "(" << asteroid_to_string(*a.target) << ")";
        } else if constexpr (std::is_same_v<T, DeployRobot>) {
          ss << "DeployRobot";
          if (a.target) ss << "(" << asteroid_to_string(*a.target) << ")";
        } else if constexpr (std::is_same_v<T, Mine>) {
          ss << "Mine(" << depth_to_string(a.depth);
          if (a.target) ss << ", " << asteroid_to_string(*a.target);
          ss << ")";
        }
        return ss.str();
      },
      action);
}

bool is_implicit_noop(const Action& action) {
  const auto* n = std::get_if<NoOp>(&action);
  return n && n->implicit;
}

} // namespace shipcoord
