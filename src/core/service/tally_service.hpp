#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"
#include "core/service/allocation_engine.hpp"
#include "core/service/leaderboard_scorer.hpp"
#include "core/service/period_locks.hpp"
#include "core/service/validator.hpp"
#include "core/storage/store.hpp"

namespace tally {

class TallyService {
public:
  Result init(const EngineConfig& config);

  Result create_period(std::string_view shop_id, int year, unsigned month);
  [[nodiscard]] std::optional<Period> period(std::string_view period_id) const;
  [[nodiscard]] std::vector<Period> periods(std::string_view shop_id) const;
  [[nodiscard]] std::vector<Week> weeks(std::string_view period_id) const;

  Result register_category(const Category& category);
  [[nodiscard]] std::vector<Category> categories(std::string_view shop_id) const;

  Result upsert_monthly_targets(std::string_view period_id, const std::vector<MonthlyTargetInput>& items);
  Result upsert_weekly_distribution(std::string_view period_id, const std::vector<WeeklyDistributionInput>& items);
  Result upsert_role_weights(std::string_view period_id, int week_index, const std::vector<RoleWeightInput>& items);
  Result apply_default_configuration(std::string_view period_id);
  [[nodiscard]] std::vector<MonthlyTarget> monthly_targets(std::string_view period_id) const;
  [[nodiscard]] std::vector<WeeklyDistributionEntry> weekly_distribution(std::string_view period_id) const;
  [[nodiscard]] std::vector<RoleWeight> role_weights(std::string_view period_id, int week_index) const;

  Result upsert_membership(const Membership& membership);
  [[nodiscard]] std::vector<Membership> memberships(std::string_view shop_id) const;

  Result add_achievement(const AchievementDraft& draft);
  Result correct_achievement(std::string_view achievement_id, std::string_view achieved_value);
  Result delete_achievement(std::string_view achievement_id);
  // An empty `user_id` returns every user's achievements.
  [[nodiscard]] std::vector<Achievement> achievements(std::string_view shop_id, std::string_view user_id,
                                                      std::string_view from_date, std::string_view to_date) const;

  [[nodiscard]] Result validate_config(std::string_view period_id, const ValidationScope& scope) const;
  [[nodiscard]] Result validate_distribution(std::string_view period_id, ValidationMode mode) const;
  [[nodiscard]] Result validate_role_weights(std::string_view period_id, int week_index, ValidationMode mode) const;
  Result request_status_transition(std::string_view period_id, PeriodStatus new_status);

  Result recompute(std::string_view period_id);
  Result recompute(std::string_view period_id, RecomputeReport& report);
  [[nodiscard]] std::optional<TargetSet> user_week_targets(std::string_view period_id) const;
  [[nodiscard]] RecalcFlag recalc_flag(std::string_view period_id) const;

  Result compute_snapshot(std::string_view period_id, std::string_view rules_version);
  [[nodiscard]] std::vector<LeaderboardRow> leaderboard_rows(std::string_view snapshot_id) const;
  [[nodiscard]] std::vector<LeaderboardSnapshot> snapshots(std::string_view period_id) const;
  [[nodiscard]] std::vector<LeaderboardRow> current_leaderboard(std::string_view period_id) const;

  [[nodiscard]] std::vector<WeekProgress> weekly_progress(std::string_view period_id) const;
  [[nodiscard]] std::vector<CategoryProgress> category_performance(std::string_view period_id) const;

  [[nodiscard]] const EngineConfig& config() const { return config_; }
  // Per-period locks shared by recompute, configuration writes and status transitions.
  [[nodiscard]] PeriodLocks& period_locks() { return locks_; }

private:
  using ConfigMutation = std::function<Result(Store::Tables&, const Period&)>;

  Result ensure_initialized() const;
  Result write_period_config(std::string_view period_id, std::string reason, const ConfigMutation& mutation);

  EngineConfig config_;
  bool initialized_ = false;
  Store store_;
  PeriodLocks locks_;
  InvariantValidator validator_;
  AllocationEngine allocation_;
  LeaderboardScorer scorer_;
  std::atomic<std::uint64_t> achievement_counter_{0};
};

}  // namespace tally
