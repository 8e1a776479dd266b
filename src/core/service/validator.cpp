#include "core/service/validator.hpp"

#include <algorithm>
#include <string>

namespace tally {
namespace {

bool has_week(const Period& period, int week_index) {
  return std::ranges::any_of(period.weeks, [week_index](const Week& week) { return week.index == week_index; });
}

std::string role_weights_field(int week_index) {
  return "role_weights[week=" + std::to_string(week_index) + "]";
}

}  // namespace

Result InvariantValidator::validate_percentage(Decimal value, std::string_view field) {
  if (value.is_negative() || value > util::kHundredPercent) {
    return Result::failure(ErrorKind::Validation,
                           "Percentage " + value.to_string() + " is outside 0.00..100.00.", std::string{field});
  }
  return Result::success();
}

Result InvariantValidator::check_sum(Decimal sum, ValidationMode mode, const std::string& field,
                                     const std::string& scope) const {
  if (mode == ValidationMode::WriteTime) {
    if (sum > util::kHundredPercent) {
      return Result::failure(ErrorKind::Validation,
                             scope + " sums to " + sum.to_string() + "%, which exceeds 100.00%.", field);
    }
    return Result::success();
  }

  if (!util::within_tolerance(sum, util::kHundredPercent, tolerance_)) {
    return Result::failure(ErrorKind::Validation,
                           scope + " sums to " + sum.to_string() + "%; 100.00% is required.", field);
  }
  return Result::success();
}

Result InvariantValidator::validate_distribution(const Period& period,
                                                 const std::map<int, WeeklyDistributionEntry>& entries,
                                                 ValidationMode mode) const {
  Decimal sum;
  for (const auto& [week_index, entry] : entries) {
    if (!has_week(period, week_index)) {
      return Result::failure(ErrorKind::Validation,
                             "Week " + std::to_string(week_index) + " does not exist in period " + period.period_id +
                                 ".",
                             "weekly_distribution");
    }
    const Result pct = validate_percentage(entry.percentage, "weekly_distribution");
    if (!pct.ok) {
      return pct;
    }
    sum += entry.percentage;
  }
  return check_sum(sum, mode, "weekly_distribution", "Weekly distribution of period " + period.period_id);
}

Result InvariantValidator::validate_role_weights(const Period& period, int week_index,
                                                 const std::map<Role, RoleWeight>& weights,
                                                 ValidationMode mode) const {
  const std::string field = role_weights_field(week_index);
  if (!has_week(period, week_index)) {
    return Result::failure(ErrorKind::Validation,
                           "Week " + std::to_string(week_index) + " does not exist in period " + period.period_id + ".",
                           field);
  }

  Decimal sum;
  for (const auto& [role, weight] : weights) {
    const Result pct = validate_percentage(weight.weight_percentage, field);
    if (!pct.ok) {
      return pct;
    }
    sum += weight.weight_percentage;
  }
  return check_sum(sum, mode, field,
                   "Role weights of week " + std::to_string(week_index) + " in period " + period.period_id);
}

Result InvariantValidator::validate_distribution(const Store::Tables& tables, std::string_view period_id,
                                                 ValidationMode mode) const {
  const auto period = tables.periods.find(std::string{period_id});
  if (period == tables.periods.end()) {
    return Result::failure(ErrorKind::NotFound, "Unknown period " + std::string{period_id} + ".", "period_id");
  }
  const auto entries = tables.distribution.find(std::string{period_id});
  if (entries == tables.distribution.end()) {
    return validate_distribution(period->second, {}, mode);
  }
  return validate_distribution(period->second, entries->second, mode);
}

Result InvariantValidator::validate_role_weights(const Store::Tables& tables, std::string_view period_id,
                                                 int week_index, ValidationMode mode) const {
  const auto period = tables.periods.find(std::string{period_id});
  if (period == tables.periods.end()) {
    return Result::failure(ErrorKind::NotFound, "Unknown period " + std::string{period_id} + ".", "period_id");
  }

  static const std::map<Role, RoleWeight> kNoWeights;
  const auto by_week = tables.role_weights.find(std::string{period_id});
  if (by_week == tables.role_weights.end()) {
    return validate_role_weights(period->second, week_index, kNoWeights, mode);
  }
  const auto weights = by_week->second.find(week_index);
  return validate_role_weights(period->second, week_index,
                               weights == by_week->second.end() ? kNoWeights : weights->second, mode);
}

Result InvariantValidator::validate_scope(const Store::Tables& tables, std::string_view period_id,
                                          const ValidationScope& scope, ValidationMode mode) const {
  switch (scope.kind) {
    case ValidationScopeKind::Distribution:
      return validate_distribution(tables, period_id, mode);
    case ValidationScopeKind::RoleWeights:
      return validate_role_weights(tables, period_id, scope.week_index, mode);
    case ValidationScopeKind::All:
      break;
  }

  const Result distribution = validate_distribution(tables, period_id, mode);
  if (!distribution.ok) {
    return distribution;
  }

  const Period& period = tables.periods.at(std::string{period_id});
  for (const auto& week : period.weeks) {
    const Result weights = validate_role_weights(tables, period_id, week.index, mode);
    if (!weights.ok) {
      return weights;
    }
  }
  return Result::success("Configuration of period " + period.period_id + " is consistent.");
}

}  // namespace tally
