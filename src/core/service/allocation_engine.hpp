#pragma once

#include <map>
#include <string>
#include <vector>

#include "core/model/types.hpp"

namespace tally {

struct AllocationInput {
  Period period;
  std::map<std::string, MonthlyTarget> monthly_targets;
  std::map<int, WeeklyDistributionEntry> distribution;
  std::map<int, std::map<Role, RoleWeight>> role_weights;
  std::vector<Membership> memberships;
};

struct AllocationOutput {
  std::vector<UserWeekTarget> rows;
  std::vector<UnallocatedTarget> unallocated;
  std::string digest;
};

// Turns monthly targets into per-user weekly targets. Rounding to cents happens once per
// boundary on the exact running position through weeks (by index) and roles (canonical
// order), so week and role totals always add back up to their parent amount. Role
// targets are split across members in ascending user id order; the first members absorb
// the leftover cents.
class AllocationEngine {
public:
  [[nodiscard]] AllocationOutput allocate(const AllocationInput& input) const;

  // Weekly targets of one monthly amount, in week order.
  [[nodiscard]] static std::vector<Decimal> weekly_targets(Decimal monthly, const Period& period,
                                                           const std::map<int, WeeklyDistributionEntry>& distribution);

  // Splits `total` into `members` shares: floor to the cent, leftover cents go to the first shares.
  [[nodiscard]] static std::vector<Decimal> split_evenly(Decimal total, std::size_t members);

  [[nodiscard]] static std::string digest(const std::vector<UserWeekTarget>& rows);
};

}  // namespace tally
