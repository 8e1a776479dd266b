#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"

namespace tally {

class LeaderboardScorer {
public:
  explicit LeaderboardScorer(Decimal trend_epsilon = Decimal{}) : trend_epsilon_(trend_epsilon) {}

  // Rows are returned in rank order. `prior_rows` belong to the latest earlier snapshot of
  // the same period, or are empty when there is none. The snapshot id is left blank.
  [[nodiscard]] std::vector<LeaderboardRow> score(const Period& period, const TargetSet& targets,
                                                  const std::vector<Achievement>& achievements,
                                                  const std::vector<LeaderboardRow>& prior_rows) const;

  [[nodiscard]] static Trend trend_between(Decimal prior_pct, Decimal current_pct, Decimal epsilon);

  // `days` are ISO dates; duplicates and ordering are handled here.
  [[nodiscard]] static int streak_days(std::vector<std::string> days, std::string_view period_start);

private:
  Decimal trend_epsilon_;
};

}  // namespace tally
