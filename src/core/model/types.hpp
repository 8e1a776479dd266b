#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/util/decimal.hpp"

namespace tally {

using util::Decimal;

enum class ErrorKind {
  None,
  Validation,
  Recompute,
  NotComputed,
  Concurrency,
  NotFound,
  Conflict,
  Storage,
};

struct Result {
  bool ok = false;
  ErrorKind kind = ErrorKind::None;
  std::string message;
  std::string data;
  std::string field;

  static Result success(std::string msg = {}, std::string payload = {}) {
    return {true, ErrorKind::None, std::move(msg), std::move(payload), {}};
  }

  static Result failure(ErrorKind kind, std::string msg, std::string field = {}) {
    return {false, kind, std::move(msg), {}, std::move(field)};
  }

  [[nodiscard]] bool retryable() const {
    return kind == ErrorKind::Concurrency || kind == ErrorKind::Recompute || kind == ErrorKind::Storage;
  }
};

enum class PeriodStatus {
  Draft,
  Published,
  Locked,
  Archived,
};

enum class Role {
  Owner,
  Manager,
  SalesJunior,
  SalesSenior,
};

inline constexpr Role kAllRoles[] = {Role::Owner, Role::Manager, Role::SalesJunior, Role::SalesSenior};

enum class CategoryUnit {
  Count,
  Currency,
};

enum class AchievementSource {
  Manual,
  Import,
  Api,
};

enum class Trend {
  Up,
  Down,
  Flat,
};

struct Week {
  int index = 0;
  std::string start_date;
  std::string end_date;
  int day_count = 0;
};

struct Period {
  std::string period_id;
  std::string shop_id;
  int year = 0;
  unsigned month = 0;
  PeriodStatus status = PeriodStatus::Draft;
  std::int64_t created_unix = 0;
  std::vector<Week> weeks;

  [[nodiscard]] std::string start_date() const { return weeks.empty() ? std::string{} : weeks.front().start_date; }
  [[nodiscard]] std::string end_date() const { return weeks.empty() ? std::string{} : weeks.back().end_date; }
  [[nodiscard]] bool frozen() const {
    return status == PeriodStatus::Locked || status == PeriodStatus::Archived;
  }
};

struct Category {
  std::string shop_id;
  std::string category_id;
  std::string name;
  CategoryUnit unit = CategoryUnit::Count;
};

struct MonthlyTarget {
  std::string category_id;
  Decimal target_value;
};

struct WeeklyDistributionEntry {
  int week_index = 0;
  Decimal percentage;
};

struct RoleWeight {
  Role role = Role::SalesJunior;
  Decimal weight_percentage;
};

struct Membership {
  std::string shop_id;
  std::string user_id;
  Role role = Role::SalesJunior;
  bool active = true;
};

struct UserWeekTarget {
  int week_index = 0;
  std::string user_id;
  std::string category_id;
  Decimal target_value;
};

struct TargetSet {
  std::string period_id;
  std::int64_t computed_unix = 0;
  std::string digest;
  std::vector<UserWeekTarget> rows;
};

struct RecalcFlag {
  std::string period_id;
  bool dirty = false;
  std::string reason;
  std::uint64_t generation = 0;
  std::int64_t updated_unix = 0;
};

struct Achievement {
  std::string achievement_id;
  std::string shop_id;
  std::string user_id;
  std::string category_id;
  std::string occurred_on;
  Decimal achieved_value;
  AchievementSource source = AchievementSource::Manual;
  std::int64_t created_unix = 0;
  std::int64_t updated_unix = 0;
};

struct AchievementDraft {
  std::string shop_id;
  std::string user_id;
  std::string category_id;
  std::string occurred_on;
  std::string achieved_value;
  AchievementSource source = AchievementSource::Manual;
};

struct MonthlyTargetInput {
  std::string category_id;
  std::string target_value;
};

struct WeeklyDistributionInput {
  int week_index = 0;
  std::string percentage;
};

struct RoleWeightInput {
  Role role = Role::SalesJunior;
  std::string weight_percentage;
};

struct LeaderboardSnapshot {
  std::string snapshot_id;
  std::string period_id;
  std::string rules_version;
  std::int64_t computed_unix_ms = 0;
  std::uint64_t sequence = 0;
};

struct LeaderboardRow {
  std::string snapshot_id;
  std::string user_id;
  int rank = 0;
  Decimal score;
  Decimal achievement_pct;
  Decimal total_target;
  Trend trend = Trend::Flat;
  int streak_days = 0;
};

enum class ValidationScopeKind {
  Distribution,
  RoleWeights,
  All,
};

struct ValidationScope {
  ValidationScopeKind kind = ValidationScopeKind::All;
  int week_index = 0;
};

struct UnallocatedTarget {
  int week_index = 0;
  Role role = Role::SalesJunior;
  std::string category_id;
  Decimal amount;
};

struct RecomputeReport {
  std::string period_id;
  std::size_t row_count = 0;
  std::string digest;
  bool flag_cleared = false;
  std::vector<UnallocatedTarget> unallocated;
};

struct CategoryProgress {
  std::string category_id;
  std::string category_name;
  Decimal target_value;
  Decimal achieved_value;
  Decimal percentage;
};

struct UserWeeklyProgress {
  std::string user_id;
  std::optional<Role> role;
  std::vector<CategoryProgress> categories;
  Decimal total_target;
  Decimal total_achieved;
  Decimal percentage;
};

struct WeekProgress {
  Week week;
  std::vector<UserWeeklyProgress> users;
};

struct EngineConfig {
  std::string data_dir;
  std::string default_rules_version = "v1";
  Decimal trend_epsilon = Decimal::from_cents(0);
  Decimal percentage_tolerance = Decimal::from_cents(1);
  bool block_transition_when_dirty = false;
  std::uint32_t write_lock_timeout_ms = 250;
  std::string log_level = "info";
};

}  // namespace tally
