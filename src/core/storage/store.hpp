#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"

namespace tally {

// Tables are replaced as a whole on every commit: a mutation runs against a copy,
// constraints are checked, the copy is persisted, and only then swapped in.
class Store {
public:
  struct Tables {
    std::map<std::string, Period> periods;
    std::map<std::string, Category> categories;  // "<shop>|<category>"
    std::map<std::string, std::map<std::string, MonthlyTarget>> monthly_targets;
    std::map<std::string, std::map<int, WeeklyDistributionEntry>> distribution;
    std::map<std::string, std::map<int, std::map<Role, RoleWeight>>> role_weights;
    std::map<std::string, Membership> memberships;  // "<shop>|<user>"
    std::map<std::string, TargetSet> target_sets;
    std::map<std::string, RecalcFlag> recalc_flags;
    std::map<std::string, Achievement> achievements;
    std::vector<LeaderboardSnapshot> snapshots;
    std::map<std::string, std::vector<LeaderboardRow>> snapshot_rows;
    std::uint64_t next_sequence = 1;
  };

  using Mutation = std::function<Result(Tables&)>;
  using Reader = std::function<void(const Tables&)>;

  Result open(std::string_view data_dir);

  Result commit(const Mutation& mutation);
  void read(const Reader& reader) const;

  [[nodiscard]] std::optional<Period> period(std::string_view period_id) const;
  [[nodiscard]] std::vector<Period> periods_for_shop(std::string_view shop_id) const;
  [[nodiscard]] std::vector<Category> categories_for_shop(std::string_view shop_id) const;
  [[nodiscard]] std::vector<Membership> memberships_for_shop(std::string_view shop_id) const;
  [[nodiscard]] std::optional<TargetSet> target_set(std::string_view period_id) const;
  [[nodiscard]] std::optional<RecalcFlag> recalc_flag(std::string_view period_id) const;
  [[nodiscard]] std::optional<Achievement> achievement(std::string_view achievement_id) const;
  [[nodiscard]] std::vector<Achievement> achievements_in_range(std::string_view shop_id,
                                                               std::string_view from_date,
                                                               std::string_view to_date) const;
  [[nodiscard]] std::vector<LeaderboardSnapshot> snapshots_for_period(std::string_view period_id) const;
  [[nodiscard]] std::optional<LeaderboardSnapshot> snapshot(std::string_view snapshot_id) const;
  [[nodiscard]] std::vector<LeaderboardRow> snapshot_rows(std::string_view snapshot_id) const;

  [[nodiscard]] bool persistent() const { return !data_path_.empty(); }
  [[nodiscard]] const std::string& data_path() const { return data_path_; }

  static std::string membership_key(std::string_view shop_id, std::string_view user_id);
  static std::string category_key(std::string_view shop_id, std::string_view category_id);

private:
  Result load();
  Result persist(const Tables& tables) const;
  static Result check_constraints(const Tables& tables);

  mutable std::shared_mutex mutex_;
  Tables tables_;
  std::string data_dir_;
  std::string data_path_;
};

}  // namespace tally
