#include "shipcoord/core/resource_ledger.h"

#include <algorithm>
#include <string>

namespace shipcoord {

void ResourceLedger::reset(int pu_per_round) {
  per_round_ = std::max(0, pu_per_round);
  remaining_ = per_round_;
  holds_.fill(0);
  spent_.fill(0);
}

void ResourceLedger::hold(Role role, int cost) { holds_[role_index(role)] = std::max(0, cost); }

void ResourceLedger::release_hold(Role role) { holds_[role_index(role)] = 0; }

int ResourceLedger::total_held() const {
  int total = 0;
  for (int h : holds_) total += h;
  return total;
}

int ResourceLedger::available_for(Role role) const {
  const int others = total_held() - holds_[role_index(role)];
  return std::max(0, remaining_ - others);
}

bool ResourceLedger::reserve(Role role, int cost) {
  if (cost < 0) return false;
  if (cost > available_for(role)) return false;
  remaining_ -= cost;
  spent_[role_index(role)] += cost;
  holds_[role_index(role)] = 0;
  return true;
}

void ResourceLedger::load(int pu_per_round, int remaining, const std::array<int, kRoleCount>& holds,
                          const std::array<int, kRoleCount>& spent) {
  per_round_ = pu_per_round;
  remaining_ = remaining;
  holds_ = holds;
  spent_ = spent;
}

bool ResourceLedger::consistent(std::string* error) const {
  const auto fail = [error](const std::string& why) {
    if (error) *error = why;
    return false;
  };
  if (per_round_ < 0) return fail("per_round is negative");
  if (remaining_ < 0 || remaining_ > per_round_) {
    return fail("remaining " + std::to_string(remaining_) + " is outside 0.." + std::to_string(per_round_));
  }
  int spent_total = 0;
  for (Role r : kAllRoles) {
    if (holds_[role_index(r)] < 0) return fail("negative hold");
    if (spent_[role_index(r)] < 0) return fail("negative spend");
    spent_total += spent_[role_index(r)];
  }
  if (remaining_ + spent_total != per_round_) return fail("remaining and spend do not add up to per_round");
  return true;
}

} // namespace shipcoord
