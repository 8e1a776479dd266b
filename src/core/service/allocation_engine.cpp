#include "core/service/allocation_engine.hpp"

#include <algorithm>
#include <cstdint>
#include <tuple>

#include <spdlog/spdlog.h>

#include "core/model/enum_names.hpp"
#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace tally {
namespace {

// Positions are expressed in 1e-8 cents: cents * pct_hundredths * pct_hundredths.
constexpr __int128 kPositionScale = 100000000;
constexpr __int128 kPercentScale = 10000;

std::int64_t to_cents(__int128 position) {
  return util::round_half_up_div(position, kPositionScale);
}

Decimal distribution_for(const std::map<int, WeeklyDistributionEntry>& distribution, int week_index) {
  const auto it = distribution.find(week_index);
  return it == distribution.end() ? Decimal{} : it->second.percentage;
}

std::map<Role, std::vector<std::string>> active_members_by_role(const std::vector<Membership>& memberships) {
  std::map<Role, std::vector<std::string>> by_role;
  for (const auto& membership : memberships) {
    if (membership.active) {
      by_role[membership.role].push_back(membership.user_id);
    }
  }
  for (auto& [role, users] : by_role) {
    std::ranges::sort(users);
    users.erase(std::unique(users.begin(), users.end()), users.end());
  }
  return by_role;
}

}  // namespace

AllocationOutput AllocationEngine::allocate(const AllocationInput& input) const {
  AllocationOutput output;
  const auto members = active_members_by_role(input.memberships);

  std::vector<Week> weeks = input.period.weeks;
  std::ranges::sort(weeks, {}, &Week::index);

  for (const auto& [category_id, target] : input.monthly_targets) {
    const __int128 monthly = target.target_value.cents();
    __int128 distributed_before = 0;

    for (const auto& week : weeks) {
      const std::int64_t week_pct = distribution_for(input.distribution, week.index).cents();
      const __int128 week_start = monthly * distributed_before * kPercentScale;
      distributed_before += week_pct;
      if (week_pct == 0) {
        continue;
      }

      const auto weights_it = input.role_weights.find(week.index);
      if (weights_it == input.role_weights.end()) {
        continue;
      }

      __int128 cumulative_weight = 0;
      std::int64_t previous_cents = to_cents(week_start);
      for (const Role role : kAllRoles) {
        const auto weight_it = weights_it->second.find(role);
        if (weight_it == weights_it->second.end() || weight_it->second.weight_percentage.cents() <= 0) {
          continue;
        }
        cumulative_weight += weight_it->second.weight_percentage.cents();
        const std::int64_t position_cents = to_cents(week_start + monthly * week_pct * cumulative_weight);
        const Decimal role_target = Decimal::from_cents(position_cents - previous_cents);
        previous_cents = position_cents;

        const auto users_it = members.find(role);
        if (users_it == members.end() || users_it->second.empty()) {
          spdlog::warn("period {} week {} category {}: {} of role {} left unallocated (no active members)",
                       input.period.period_id, week.index, category_id, role_target.to_string(), to_string(role));
          output.unallocated.push_back({
              .week_index = week.index,
              .role = role,
              .category_id = category_id,
              .amount = role_target,
          });
          continue;
        }

        const auto& users = users_it->second;
        const std::vector<Decimal> shares = split_evenly(role_target, users.size());
        for (std::size_t i = 0; i < users.size(); ++i) {
          output.rows.push_back({
              .week_index = week.index,
              .user_id = users[i],
              .category_id = category_id,
              .target_value = shares[i],
          });
        }
      }
    }
  }

  std::ranges::sort(output.rows, [](const UserWeekTarget& lhs, const UserWeekTarget& rhs) {
    return std::tie(lhs.week_index, lhs.category_id, lhs.user_id) <
           std::tie(rhs.week_index, rhs.category_id, rhs.user_id);
  });
  output.digest = digest(output.rows);

  spdlog::debug("allocation for period {}: {} rows, {} unallocated role targets", input.period.period_id,
                output.rows.size(), output.unallocated.size());
  return output;
}

std::vector<Decimal> AllocationEngine::weekly_targets(Decimal monthly, const Period& period,
                                                      const std::map<int, WeeklyDistributionEntry>& distribution) {
  std::vector<Week> weeks = period.weeks;
  std::ranges::sort(weeks, {}, &Week::index);

  std::vector<Decimal> out;
  out.reserve(weeks.size());
  __int128 distributed = 0;
  std::int64_t previous_cents = 0;
  for (const auto& week : weeks) {
    distributed += distribution_for(distribution, week.index).cents();
    const std::int64_t position_cents = to_cents(static_cast<__int128>(monthly.cents()) * distributed * kPercentScale);
    out.push_back(Decimal::from_cents(position_cents - previous_cents));
    previous_cents = position_cents;
  }
  return out;
}

std::vector<Decimal> AllocationEngine::split_evenly(Decimal total, std::size_t members) {
  if (members == 0) {
    return {};
  }
  const auto n = static_cast<std::int64_t>(members);
  const std::int64_t base = total.cents() / n;
  const std::int64_t remainder = total.cents() - base * n;

  std::vector<Decimal> shares(members, Decimal::from_cents(base));
  for (std::int64_t i = 0; i < remainder; ++i) {
    shares[static_cast<std::size_t>(i)] += Decimal::from_cents(1);
  }
  return shares;
}

std::string AllocationEngine::digest(const std::vector<UserWeekTarget>& rows) {
  std::string canonical;
  for (const auto& row : rows) {
    canonical += util::canonical_join({
        {"week", std::to_string(row.week_index)},
        {"category", row.category_id},
        {"user", row.user_id},
        {"value", row.target_value.to_string()},
    });
  }
  return util::sha256_hex(canonical);
}

}  // namespace tally
