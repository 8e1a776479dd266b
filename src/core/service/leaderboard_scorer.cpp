#include "core/service/leaderboard_scorer.hpp"

#include <algorithm>
#include <iterator>
#include <map>
#include <set>
#include <unordered_map>
#include <utility>

#include "core/util/dates.hpp"

namespace tally {
namespace {

struct UserTotals {
  Decimal total_target;
  Decimal total_achieved;
  std::vector<std::string> days;
};

}  // namespace

std::vector<LeaderboardRow> LeaderboardScorer::score(const Period& period, const TargetSet& targets,
                                                     const std::vector<Achievement>& achievements,
                                                     const std::vector<LeaderboardRow>& prior_rows) const {
  const std::string start = period.start_date();
  const std::string end = period.end_date();

  std::map<std::string, UserTotals> by_user;
  for (const auto& row : targets.rows) {
    by_user[row.user_id].total_target += row.target_value;
  }
  for (const auto& achievement : achievements) {
    if (achievement.shop_id != period.shop_id || achievement.occurred_on < start || achievement.occurred_on > end) {
      continue;
    }
    UserTotals& totals = by_user[achievement.user_id];
    totals.total_achieved += achievement.achieved_value;
    totals.days.push_back(achievement.occurred_on);
  }

  std::unordered_map<std::string, Decimal> prior_pct;
  for (const auto& row : prior_rows) {
    prior_pct.emplace(row.user_id, row.achievement_pct);
  }

  std::vector<LeaderboardRow> rows;
  rows.reserve(by_user.size());
  for (auto& [user_id, totals] : by_user) {
    LeaderboardRow row;
    row.user_id = user_id;
    row.total_target = totals.total_target;
    row.score = totals.total_achieved;
    row.achievement_pct = totals.total_target > Decimal{}
                              ? util::percentage_of(totals.total_achieved, totals.total_target)
                              : Decimal{};
    const auto prior = prior_pct.find(user_id);
    row.trend = prior == prior_pct.end() ? Trend::Flat
                                         : trend_between(prior->second, row.achievement_pct, trend_epsilon_);
    row.streak_days = streak_days(std::move(totals.days), start);
    rows.push_back(std::move(row));
  }

  std::ranges::sort(rows, [](const LeaderboardRow& lhs, const LeaderboardRow& rhs) {
    if (lhs.achievement_pct != rhs.achievement_pct) {
      return lhs.achievement_pct > rhs.achievement_pct;
    }
    if (lhs.score != rhs.score) {
      return lhs.score > rhs.score;
    }
    return lhs.user_id < rhs.user_id;
  });

  int rank = 1;
  for (auto& row : rows) {
    row.rank = rank++;
  }
  return rows;
}

Trend LeaderboardScorer::trend_between(Decimal prior_pct, Decimal current_pct, Decimal epsilon) {
  if (current_pct - prior_pct > epsilon) {
    return Trend::Up;
  }
  if (prior_pct - current_pct > epsilon) {
    return Trend::Down;
  }
  return Trend::Flat;
}

int LeaderboardScorer::streak_days(std::vector<std::string> days, std::string_view period_start) {
  if (days.empty()) {
    return 0;
  }
  const std::set<std::string> logged(std::make_move_iterator(days.begin()), std::make_move_iterator(days.end()));

  int streak = 0;
  std::string day = *logged.rbegin();
  while (!day.empty() && day >= period_start && logged.contains(day)) {
    ++streak;
    day = util::previous_day(day);
  }
  return streak;
}

}  // namespace tally
