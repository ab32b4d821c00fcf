#include "shipcoord/core/enum_strings.h"

#include "shipcoord/util/strings.h"

namespace shipcoord {
namespace {

struct Alias {
  const char* text;
  int value;
};

template <typename Enum, std::size_t N>
bool parse_alias(const std::string& s, const Alias (&table)[N], Enum* out) {
  const std::string v = to_lower(s);
  for (const auto& a : table) {
    if (v == a.text) {
      if (out) *out = static_cast<Enum>(a.value);
      return true;
    }
  }
  return false;
}

} // namespace

const char* role_to_string(Role r) {
  switch (r) {
    case Role::Captain: return "captain";
    case Role::Navigator: return "navigator";
    case Role::Driller: return "driller";
  }
  return "captain";
}

bool role_from_string(const std::string& s, Role* out) {
  static const Alias kTable[] = {
      {"captain", static_cast<int>(Role::Captain)},
      {"navigator", static_cast<int>(Role::Navigator)},
      {"driller", static_cast<int>(Role::Driller)},
  };
  return parse_alias(s, kTable, out);
}

const char* asteroid_to_string(Asteroid a) {
  switch (a) {
    case Asteroid::Alpha: return "Alpha";
    case Asteroid::Beta: return "Beta";
    case Asteroid::Gamma: return "Gamma";
    case Asteroid::Omega: return "Omega";
  }
  return "Alpha";
}

bool asteroid_from_string(const std::string& s, Asteroid* out) {
  static const Alias kTable[] = {
      {"alpha", static_cast<int>(Asteroid::Alpha)},
      {"beta", static_cast<int>(Asteroid::Beta)},
      {"gamma", static_cast<int>(Asteroid::Gamma)},
      {"omega", static_cast<int>(Asteroid::Omega)},
  };
  return parse_alias(s, kTable, out);
}

const char* pressure_to_string(Pressure p) { return p == Pressure::High ? "high" : "low"; }

bool pressure_from_string(const std::string& s, Pressure* out) {
  static const Alias kTable[] = {
      {"high", static_cast<int>(Pressure::High)},
      {"low", static_cast<int>(Pressure::Low)},
  };
  return parse_alias(s, kTable, out);
}

const char* complexity_to_string(Complexity c) { return c == Complexity::High ? "high" : "low"; }

bool complexity_from_string(const std::string& s, Complexity* out) {
  static const Alias kTable[] = {
      {"high", static_cast<int>(Complexity::High)},
      {"low", static_cast<int>(Complexity::Low)},
  };
  return parse_alias(s, kTable, out);
}

const char* captain_type_to_string(CaptainType c) { return c == CaptainType::Human ? "human" : "llm"; }

bool captain_type_from_string(const std::string& s, CaptainType* out) {
  static const Alias kTable[] = {
      {"human", static_cast<int>(CaptainType::Human)},
      {"llm", static_cast<int>(CaptainType::Llm)},
      {"ai", static_cast<int>(CaptainType::Llm)},
  };
  return parse_alias(s, kTable, out);
}

const char* stage_to_string(Stage s) {
  switch (s) {
    case Stage::Briefing: return "briefing";
    case Stage::Action: return "action";
    case Stage::Result: return "result";
  }
  return "briefing";
}

bool stage_from_string(const std::string& s, Stage* out) {
  static const Alias kTable[] = {
      {"briefing", static_cast<int>(Stage::Briefing)},
      {"action", static_cast<int>(Stage::Action)},
      {"result", static_cast<int>(Stage::Result)},
  };
  return parse_alias(s, kTable, out);
}

const char* session_status_to_string(SessionStatus s) {
  switch (s) {
    case SessionStatus::Pending: return "pending";
    case SessionStatus::Running: return "running";
    case SessionStatus::Complete: return "complete";
    case SessionStatus::Aborted: return "aborted";
  }
  return "pending";
}

bool session_status_from_string(const std::string& s, SessionStatus* out) {
  static const Alias kTable[] = {
      {"pending", static_cast<int>(SessionStatus::Pending)},
      {"running", static_cast<int>(SessionStatus::Running)},
      {"complete", static_cast<int>(SessionStatus::Complete)},
      {"aborted", static_cast<int>(SessionStatus::Aborted)},
  };
  return parse_alias(s, kTable, out);
}

const char* action_kind_to_string(ActionKind k) {
  switch (k) {
    case ActionKind::NoOp: return "no_op";
    case ActionKind::Travel: return "travel";
    case ActionKind::SendProbe: return "send_probe";
    case ActionKind::DeployRobot: return "deploy_robot";
    case ActionKind::Mine: return "mine";
  }
  return "no_op";
}

bool action_kind_from_string(const std::string& s, ActionKind* out) {
  static const Alias kTable[] = {
      {"no_op", static_cast<int>(ActionKind::NoOp)},
      {"do_nothing", static_cast<int>(ActionKind::NoOp)},
      {"travel", static_cast<int>(ActionKind::Travel)},
      {"send_probe", static_cast<int>(ActionKind::SendProbe)},
      {"probe", static_cast<int>(ActionKind::SendProbe)},
      {"deploy_robot", static_cast<int>(ActionKind::DeployRobot)},
      {"robot", static_cast<int>(ActionKind::DeployRobot)},
      {"mine", static_cast<int>(ActionKind::Mine)},
  };
  return parse_alias(s, kTable, out);
}

const char* depth_to_string(Depth d) { return d == Depth::Shallow ? "shallow" : "deep"; }

bool depth_from_string(const std::string& s, Depth* out) {
  static const Alias kTable[] = {
      {"shallow", static_cast<int>(Depth::Shallow)},
      {"deep", static_cast<int>(Depth::Deep)},
  };
  return parse_alias(s, kTable, out);
}

const char* reject_reason_to_string(RejectReason r) {
  switch (r) {
    case RejectReason::None: return "accepted";
    case RejectReason::StageViolation: return "stage_violation";
    case RejectReason::RoleViolation: return "role_violation";
    case RejectReason::InsufficientPU: return "insufficient_pu";
    case RejectReason::InvalidTarget: return "invalid_target";
    case RejectReason::DuplicateAction: return "duplicate_action";
    case RejectReason::UnknownCrew: return "unknown_crew";
  }
  return "accepted";
}

const char* intel_kind_to_string(IntelKind k) {
  switch (k) {
    case IntelKind::MaxMinerals: return "max_minerals";
    case IntelKind::ShallowCost: return "shallow_cost";
    case IntelKind::DeepCost: return "deep_cost";
  }
  return "max_minerals";
}

bool intel_kind_from_string(const std::string& s, IntelKind* out) {
  static const Alias kTable[] = {
      {"max_minerals", static_cast<int>(IntelKind::MaxMinerals)},
      {"shallow_cost", static_cast<int>(IntelKind::ShallowCost)},
      {"deep_cost", static_cast<int>(IntelKind::DeepCost)},
  };
  return parse_alias(s, kTable, out);
}

const char* intel_state_to_string(IntelState s) {
  switch (s) {
    case IntelState::None: return "none";
    case IntelState::ProbeOnly: return "probe_only";
    case IntelState::RobotOnly: return "robot_only";
    case IntelState::ProbePlusRobot: return "probe_plus_robot";
  }
  return "none";
}

bool intel_state_from_string(const std::string& s, IntelState* out) {
  static const Alias kTable[] = {
      {"none", static_cast<int>(IntelState::None)},
      {"probe_only", static_cast<int>(IntelState::ProbeOnly)},
      {"robot_only", static_cast<int>(IntelState::RobotOnly)},
      {"probe_plus_robot", static_cast<int>(IntelState::ProbePlusRobot)},
  };
  return parse_alias(s, kTable, out);
}

const char* cap_scope_to_string(CapScope s) { return s == CapScope::Round ? "round" : "session"; }

bool cap_scope_from_string(const std::string& s, CapScope* out) {
  static const Alias kTable[] = {
      {"round", static_cast<int>(CapScope::Round)},
      {"session", static_cast<int>(CapScope::Session)},
  };
  return parse_alias(s, kTable, out);
}

const char* unprobed_yield_to_string(UnprobedYield y) { return y == UnprobedYield::TrueValue ? "true_value" : "fixed"; }

bool unprobed_yield_from_string(const std::string& s, UnprobedYield* out) {
  static const Alias kTable[] = {
      {"true_value", static_cast<int>(UnprobedYield::TrueValue)},
      {"fixed", static_cast<int>(UnprobedYield::Fixed)},
  };
  return parse_alias(s, kTable, out);
}

const char* event_level_to_string(EventLevel l) { return l == EventLevel::Warn ? "warn" : "info"; }

bool event_level_from_string(const std::string& s, EventLevel* out) {
  static const Alias kTable[] = {
      {"info", static_cast<int>(EventLevel::Info)},
      {"warn", static_cast<int>(EventLevel::Warn)},
      {"warning", static_cast<int>(EventLevel::Warn)},
  };
  return parse_alias(s, kTable, out);
}

const char* event_category_to_string(EventCategory c) {
  switch (c) {
    case EventCategory::Session: return "session";
    case EventCategory::Stage: return "stage";
    case EventCategory::Timeout: return "action_timeout";
    case EventCategory::Intel: return "intel";
    case EventCategory::Mining: return "mining";
    case EventCategory::Skipped: return "skipped";
    case EventCategory::Chat: return "chat";
    case EventCategory::Abort: return "abort";
  }
  return "session";
}

bool event_category_from_string(const std::string& s, EventCategory* out) {
  static const Alias kTable[] = {
      {"session", static_cast<int>(EventCategory::Session)},
      {"stage", static_cast<int>(EventCategory::Stage)},
      {"action_timeout", static_cast<int>(EventCategory::Timeout)},
      {"intel", static_cast<int>(EventCategory::Intel)},
      {"mining", static_cast<int>(EventCategory::Mining)},
      {"skipped", static_cast<int>(EventCategory::Skipped)},
      {"chat", static_cast<int>(EventCategory::Chat)},
      {"abort", static_cast<int>(EventCategory::Abort)},
  };
  return parse_alias(s, kTable, out);
}

} // namespace shipcoord
