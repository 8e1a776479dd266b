#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"
#include "core/service/tally_service.hpp"

namespace tally {

class CoreApi {
public:
  Result init(const EngineConfig& config);

  Result validate_config(std::string_view period_id, const ValidationScope& scope) const;
  Result request_status_transition(std::string_view period_id, PeriodStatus new_status);
  Result recompute(std::string_view period_id);
  Result recompute(std::string_view period_id, RecomputeReport& report);
  Result compute_snapshot(std::string_view period_id, std::string_view rules_version);
  std::vector<LeaderboardRow> get_leaderboard_rows(std::string_view snapshot_id) const;

  Result create_period(std::string_view shop_id, int year, unsigned month);
  Result register_category(const Category& category);
  Result upsert_monthly_targets(std::string_view period_id, const std::vector<MonthlyTargetInput>& items);
  Result upsert_weekly_distribution(std::string_view period_id, const std::vector<WeeklyDistributionInput>& items);
  Result upsert_role_weights(std::string_view period_id, int week_index, const std::vector<RoleWeightInput>& items);
  Result apply_default_configuration(std::string_view period_id);
  Result upsert_membership(const Membership& membership);
  Result add_achievement(const AchievementDraft& draft);
  Result correct_achievement(std::string_view achievement_id, std::string_view achieved_value);
  Result delete_achievement(std::string_view achievement_id);

  std::optional<Period> period(std::string_view period_id) const;
  std::vector<Period> periods(std::string_view shop_id) const;
  std::vector<Week> weeks(std::string_view period_id) const;
  std::vector<Category> categories(std::string_view shop_id) const;
  std::vector<MonthlyTarget> monthly_targets(std::string_view period_id) const;
  std::vector<WeeklyDistributionEntry> weekly_distribution(std::string_view period_id) const;
  std::vector<RoleWeight> role_weights(std::string_view period_id, int week_index) const;
  std::vector<Membership> memberships(std::string_view shop_id) const;
  std::vector<Achievement> achievements(std::string_view shop_id, std::string_view user_id, std::string_view from_date,
                                        std::string_view to_date) const;

  RecalcFlag recalc_flag(std::string_view period_id) const;
  std::optional<TargetSet> user_week_targets(std::string_view period_id) const;
  std::vector<LeaderboardSnapshot> list_snapshots(std::string_view period_id) const;
  std::vector<LeaderboardRow> current_leaderboard(std::string_view period_id) const;
  std::vector<WeekProgress> weekly_progress(std::string_view period_id) const;
  std::vector<CategoryProgress> category_performance(std::string_view period_id) const;

  const EngineConfig& config() const;

private:
  TallyService service_;
};

}  // namespace tally
