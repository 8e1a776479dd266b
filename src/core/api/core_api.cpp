#include "core/api/core_api.hpp"

namespace tally {

Result CoreApi::init(const EngineConfig& config) {
  return service_.init(config);
}

Result CoreApi::validate_config(std::string_view period_id, const ValidationScope& scope) const {
  return service_.validate_config(period_id, scope);
}

Result CoreApi::request_status_transition(std::string_view period_id, PeriodStatus new_status) {
  return service_.request_status_transition(period_id, new_status);
}

Result CoreApi::recompute(std::string_view period_id) {
  return service_.recompute(period_id);
}

Result CoreApi::recompute(std::string_view period_id, RecomputeReport& report) {
  return service_.recompute(period_id, report);
}

Result CoreApi::compute_snapshot(std::string_view period_id, std::string_view rules_version) {
  return service_.compute_snapshot(period_id, rules_version);
}

std::vector<LeaderboardRow> CoreApi::get_leaderboard_rows(std::string_view snapshot_id) const {
  return service_.leaderboard_rows(snapshot_id);
}

Result CoreApi::create_period(std::string_view shop_id, int year, unsigned month) {
  return service_.create_period(shop_id, year, month);
}

Result CoreApi::register_category(const Category& category) {
  return service_.register_category(category);
}

Result CoreApi::upsert_monthly_targets(std::string_view period_id, const std::vector<MonthlyTargetInput>& items) {
  return service_.upsert_monthly_targets(period_id, items);
}

Result CoreApi::upsert_weekly_distribution(std::string_view period_id,
                                           const std::vector<WeeklyDistributionInput>& items) {
  return service_.upsert_weekly_distribution(period_id, items);
}

Result CoreApi::upsert_role_weights(std::string_view period_id, int week_index,
                                    const std::vector<RoleWeightInput>& items) {
  return service_.upsert_role_weights(period_id, week_index, items);
}

Result CoreApi::apply_default_configuration(std::string_view period_id) {
  return service_.apply_default_configuration(period_id);
}

Result CoreApi::upsert_membership(const Membership& membership) {
  return service_.upsert_membership(membership);
}

Result CoreApi::add_achievement(const AchievementDraft& draft) {
  return service_.add_achievement(draft);
}

Result CoreApi::correct_achievement(std::string_view achievement_id, std::string_view achieved_value) {
  return service_.correct_achievement(achievement_id, achieved_value);
}

Result CoreApi::delete_achievement(std::string_view achievement_id) {
  return service_.delete_achievement(achievement_id);
}

std::optional<Period> CoreApi::period(std::string_view period_id) const {
  return service_.period(period_id);
}

std::vector<Period> CoreApi::periods(std::string_view shop_id) const {
  return service_.periods(shop_id);
}

std::vector<Week> CoreApi::weeks(std::string_view period_id) const {
  return service_.weeks(period_id);
}

std::vector<Category> CoreApi::categories(std::string_view shop_id) const {
  return service_.categories(shop_id);
}

std::vector<MonthlyTarget> CoreApi::monthly_targets(std::string_view period_id) const {
  return service_.monthly_targets(period_id);
}

std::vector<WeeklyDistributionEntry> CoreApi::weekly_distribution(std::string_view period_id) const {
  return service_.weekly_distribution(period_id);
}

std::vector<RoleWeight> CoreApi::role_weights(std::string_view period_id, int week_index) const {
  return service_.role_weights(period_id, week_index);
}

std::vector<Membership> CoreApi::memberships(std::string_view shop_id) const {
  return service_.memberships(shop_id);
}

std::vector<Achievement> CoreApi::achievements(std::string_view shop_id, std::string_view user_id,
                                               std::string_view from_date, std::string_view to_date) const {
  return service_.achievements(shop_id, user_id, from_date, to_date);
}

RecalcFlag CoreApi::recalc_flag(std::string_view period_id) const {
  return service_.recalc_flag(period_id);
}

std::optional<TargetSet> CoreApi::user_week_targets(std::string_view period_id) const {
  return service_.user_week_targets(period_id);
}

std::vector<LeaderboardSnapshot> CoreApi::list_snapshots(std::string_view period_id) const {
  return service_.snapshots(period_id);
}

std::vector<LeaderboardRow> CoreApi::current_leaderboard(std::string_view period_id) const {
  return service_.current_leaderboard(period_id);
}

std::vector<WeekProgress> CoreApi::weekly_progress(std::string_view period_id) const {
  return service_.weekly_progress(period_id);
}

std::vector<CategoryProgress> CoreApi::category_performance(std::string_view period_id) const {
  return service_.category_performance(period_id);
}

const EngineConfig& CoreApi::config() const {
  return service_.config();
}

}  // namespace tally
