#pragma once

#include <array>
#include <string>

#include "shipcoord/core/types.h"

namespace shipcoord {

// Round-scoped Power Unit budget shared by the crew.
//
// Debit-only: reserve() is the single spend path and there is no refund.
// Holds earmark PU for accepted-but-unresolved actions so that validation
// against available_for() agrees with the debits made at resolution time.
class ResourceLedger {
 public:
  ResourceLedger() = default;
  explicit ResourceLedger(int pu_per_round) { reset(pu_per_round); }

  // Start of round: full budget, no holds, nothing spent.
  void reset(int pu_per_round);

  int per_round() const { return per_round_; }
  int remaining() const { return remaining_; }

  // Replace the hold of a role (one pending action per role).
  void hold(Role role, int cost);
  void release_hold(Role role);
  int held_by(Role role) const { return holds_[role_index(role)]; }
  int total_held() const;

  // PU the role may commit: remaining minus what the other roles hold.
  int available_for(Role role) const;

  // Check-and-debit. Clears the role's hold on success.
  // Returns false (and changes nothing) if cost exceeds available_for(role).
  bool reserve(Role role, int cost);

  int spent_by(Role role) const { return spent_[role_index(role)]; }
  int spent() const { return per_round_ - remaining_; }

  const std::array<int, kRoleCount>& holds() const { return holds_; }
  const std::array<int, kRoleCount>& spent_by_role() const { return spent_; }

  // Rebuild from a snapshot. Values are taken as given; check consistent() after.
  void load(int pu_per_round, int remaining, const std::array<int, kRoleCount>& holds,
            const std::array<int, kRoleCount>& spent);

  // False (with a reason) unless 0 <= remaining <= per_round, holds and spend
  // are non-negative and remaining plus spend adds up to per_round.
  bool consistent(std::string* error = nullptr) const;

 private:
  int per_round_{0};
  int remaining_{0};
  std::array<int, kRoleCount> holds_{};
  std::array<int, kRoleCount> spent_{};
};

} // namespace shipcoord
