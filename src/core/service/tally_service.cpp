#include "core/service/tally_service.hpp"

#include <chrono>
#include <map>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "core/model/enum_names.hpp"
#include "core/service/recalc_tracker.hpp"
#include "core/util/canonical.hpp"
#include "core/util/dates.hpp"
#include "core/util/hash.hpp"
#include "core/util/logging.hpp"

namespace tally {
namespace {

constexpr std::int64_t kDefaultJuniorWeight = 4000;
constexpr std::int64_t kDefaultSeniorWeight = 6000;
constexpr std::int64_t kWholeWeight = 10000;
constexpr std::string_view kRulesSequenceMark = "#";

// Junior and senior weights in hundredths. A team with only one sales role gets the whole week.
std::pair<std::int64_t, std::int64_t> default_role_split(const Store::Tables& tables, std::string_view shop_id) {
  std::size_t juniors = 0;
  std::size_t seniors = 0;
  for (const auto& [key, membership] : tables.memberships) {
    if (membership.shop_id != shop_id || !membership.active) {
      continue;
    }
    if (membership.role == Role::SalesJunior) {
      ++juniors;
    } else if (membership.role == Role::SalesSenior) {
      ++seniors;
    }
  }
  if (juniors > 0 && seniors == 0) {
    return {kWholeWeight, 0};
  }
  if (seniors > 0 && juniors == 0) {
    return {0, kWholeWeight};
  }
  return {kDefaultJuniorWeight, kDefaultSeniorWeight};
}

Result unknown_period(std::string_view period_id) {
  return Result::failure(ErrorKind::NotFound, "Unknown period " + std::string{period_id} + ".", "period_id");
}

bool transition_allowed(PeriodStatus from, PeriodStatus to) {
  switch (from) {
    case PeriodStatus::Draft:
      return to == PeriodStatus::Published;
    case PeriodStatus::Published:
      return to == PeriodStatus::Draft || to == PeriodStatus::Locked;
    case PeriodStatus::Locked:
      return to == PeriodStatus::Archived;
    case PeriodStatus::Archived:
      return false;
  }
  return false;
}

bool category_registered(const Store::Tables& tables, std::string_view shop_id, std::string_view category_id) {
  return tables.categories.contains(Store::category_key(shop_id, category_id));
}

std::vector<Membership> shop_memberships(const Store::Tables& tables, std::string_view shop_id) {
  std::vector<Membership> out;
  for (const auto& [key, membership] : tables.memberships) {
    if (membership.shop_id == shop_id) {
      out.push_back(membership);
    }
  }
  return out;
}

std::vector<Achievement> shop_achievements(const Store::Tables& tables, std::string_view shop_id,
                                           std::string_view from_date, std::string_view to_date) {
  std::vector<Achievement> out;
  for (const auto& [id, achievement] : tables.achievements) {
    if (achievement.shop_id == shop_id && achievement.occurred_on >= from_date && achievement.occurred_on <= to_date) {
      out.push_back(achievement);
    }
  }
  return out;
}

const LeaderboardSnapshot* latest_snapshot(const Store::Tables& tables, std::string_view period_id) {
  const LeaderboardSnapshot* latest = nullptr;
  for (const auto& snapshot : tables.snapshots) {
    if (snapshot.period_id != period_id) {
      continue;
    }
    if (latest == nullptr || snapshot.computed_unix_ms > latest->computed_unix_ms ||
        (snapshot.computed_unix_ms == latest->computed_unix_ms && snapshot.sequence > latest->sequence)) {
      latest = &snapshot;
    }
  }
  return latest;
}

std::string category_name(const Store::Tables& tables, std::string_view shop_id, const std::string& category_id) {
  const auto it = tables.categories.find(Store::category_key(shop_id, category_id));
  return it == tables.categories.end() ? category_id : it->second.name;
}

}  // namespace

Result TallyService::init(const EngineConfig& config) {
  config_ = config;
  if (!util::configure_logging(config_.log_level)) {
    spdlog::warn("unknown log level '{}', keeping {}", config_.log_level,
                 spdlog::level::to_string_view(spdlog::get_level()));
  }

  if (!util::ensure_sodium()) {
    return Result::failure(ErrorKind::Storage, "libsodium initialization failed.");
  }

  validator_ = InvariantValidator{config_.percentage_tolerance};
  scorer_ = LeaderboardScorer{config_.trend_epsilon};

  const Result opened = store_.open(config_.data_dir);
  if (!opened.ok) {
    return opened;
  }

  initialized_ = true;
  spdlog::info("tally service ready (rules version {}, tolerance {}, trend epsilon {})",
               config_.default_rules_version, config_.percentage_tolerance.to_string(),
               config_.trend_epsilon.to_string());
  return Result::success("Service initialized.");
}

Result TallyService::ensure_initialized() const {
  if (!initialized_) {
    return Result::failure(ErrorKind::Storage, "Service is not initialized.");
  }
  return Result::success();
}

Result TallyService::create_period(std::string_view shop_id, int year, unsigned month) {
  const Result ready = ensure_initialized();
  if (!ready.ok) {
    return ready;
  }
  if (shop_id.empty()) {
    return Result::failure(ErrorKind::Validation, "Shop id is required.", "shop_id");
  }
  if (month < 1 || month > 12 || year < 1970 || year > 9999) {
    return Result::failure(ErrorKind::Validation,
                           "Invalid period month " + std::to_string(year) + "-" + std::to_string(month) + ".",
                           "month");
  }

  Period period;
  period.shop_id = std::string{shop_id};
  period.year = year;
  period.month = month;
  period.status = PeriodStatus::Draft;
  period.created_unix = util::unix_timestamp_now();
  period.period_id = util::content_id("per", util::canonical_join({
                                                 {"shop_id", period.shop_id},
                                                 {"year", std::to_string(year)},
                                                 {"month", std::to_string(month)},
                                             }));
  for (const auto& span : util::month_week_spans(year, month)) {
    period.weeks.push_back({
        .index = span.index,
        .start_date = span.start_date,
        .end_date = span.end_date,
        .day_count = span.day_count,
    });
  }

  const Result committed = store_.commit([&](Store::Tables& tables) {
    if (!tables.periods.emplace(period.period_id, period).second) {
      return Result::failure(ErrorKind::Conflict,
                             "A period already exists for shop " + period.shop_id + " " + std::to_string(year) + "-" +
                                 std::to_string(month) + ".",
                             "period");
    }
    recalc::mark_dirty(tables, period.period_id, "period created", period.created_unix);
    return Result::success("Period created.", period.period_id);
  });
  if (committed.ok) {
    spdlog::info("created period {} for shop {} ({}-{:02}, {} weeks)", period.period_id, period.shop_id, year, month,
                 period.weeks.size());
  }
  return committed;
}

std::optional<Period> TallyService::period(std::string_view period_id) const {
  return store_.period(period_id);
}

std::vector<Period> TallyService::periods(std::string_view shop_id) const {
  return store_.periods_for_shop(shop_id);
}

std::vector<Week> TallyService::weeks(std::string_view period_id) const {
  const auto found = store_.period(period_id);
  return found.has_value() ? found->weeks : std::vector<Week>{};
}

Result TallyService::register_category(const Category& category) {
  const Result ready = ensure_initialized();
  if (!ready.ok) {
    return ready;
  }
  if (category.shop_id.empty() || category.category_id.empty()) {
    return Result::failure(ErrorKind::Validation, "Category requires shop and category ids.", "category_id");
  }

  return store_.commit([&](Store::Tables& tables) {
    Category stored = category;
    if (stored.name.empty()) {
      stored.name = stored.category_id;
    }
    tables.categories[Store::category_key(stored.shop_id, stored.category_id)] = std::move(stored);
    return Result::success("Category registered.", category.category_id);
  });
}

std::vector<Category> TallyService::categories(std::string_view shop_id) const {
  return store_.categories_for_shop(shop_id);
}

Result TallyService::write_period_config(std::string_view period_id, std::string reason,
                                         const ConfigMutation& mutation) {
  const Result ready = ensure_initialized();
  if (!ready.ok) {
    return ready;
  }

  const PeriodLocks::Guard guard =
      locks_.acquire_for(period_id, std::chrono::milliseconds{config_.write_lock_timeout_ms});
  if (!guard.owns_lock()) {
    spdlog::warn("configuration write to period {} rejected: recompute in flight", period_id);
    return Result::failure(ErrorKind::Concurrency,
                           "Period " + std::string{period_id} + " is being recomputed; retry the write.", "period_id");
  }

  return store_.commit([&](Store::Tables& tables) {
    const auto it = tables.periods.find(std::string{period_id});
    if (it == tables.periods.end()) {
      return unknown_period(period_id);
    }
    const Period period = it->second;
    if (period.frozen()) {
      return Result::failure(ErrorKind::Validation,
                             "Period " + period.period_id + " is " + to_string(period.status) +
                                 "; configuration is frozen.",
                             "status");
    }

    Result applied = mutation(tables, period);
    if (!applied.ok) {
      return applied;
    }
    recalc::mark_dirty(tables, period.period_id, reason, util::unix_timestamp_now());
    return applied;
  });
}

Result TallyService::upsert_monthly_targets(std::string_view period_id, const std::vector<MonthlyTargetInput>& items) {
  std::vector<MonthlyTarget> parsed;
  parsed.reserve(items.size());
  for (const auto& item : items) {
    const auto value = Decimal::parse(item.target_value);
    if (!value.has_value() || value->is_negative()) {
      return Result::failure(ErrorKind::Validation,
                             "Invalid target value '" + item.target_value + "' for category " + item.category_id + ".",
                             "target_value");
    }
    parsed.push_back({.category_id = item.category_id, .target_value = *value});
  }

  return write_period_config(period_id, "monthly targets changed", [&](Store::Tables& tables, const Period& period) {
    auto& targets = tables.monthly_targets[period.period_id];
    for (const auto& target : parsed) {
      if (!category_registered(tables, period.shop_id, target.category_id)) {
        return Result::failure(ErrorKind::NotFound,
                               "Category " + target.category_id + " is not registered for shop " + period.shop_id +
                                   ".",
                               "category_id");
      }
      targets[target.category_id] = target;
    }
    return Result::success("Monthly targets saved.");
  });
}

Result TallyService::upsert_weekly_distribution(std::string_view period_id,
                                                const std::vector<WeeklyDistributionInput>& items) {
  std::vector<WeeklyDistributionEntry> parsed;
  parsed.reserve(items.size());
  for (const auto& item : items) {
    const auto value = Decimal::parse(item.percentage);
    if (!value.has_value()) {
      return Result::failure(ErrorKind::Validation, "Invalid percentage '" + item.percentage + "'.",
                             "weekly_distribution");
    }
    parsed.push_back({.week_index = item.week_index, .percentage = *value});
  }

  return write_period_config(period_id, "weekly distribution changed",
                             [&](Store::Tables& tables, const Period& period) {
                               auto& entries = tables.distribution[period.period_id];
                               for (const auto& entry : parsed) {
                                 entries[entry.week_index] = entry;
                               }
                               const Result valid =
                                   validator_.validate_distribution(period, entries, ValidationMode::WriteTime);
                               if (!valid.ok) {
                                 return valid;
                               }
                               return Result::success("Weekly distribution saved.");
                             });
}

Result TallyService::upsert_role_weights(std::string_view period_id, int week_index,
                                         const std::vector<RoleWeightInput>& items) {
  std::vector<RoleWeight> parsed;
  parsed.reserve(items.size());
  for (const auto& item : items) {
    const auto value = Decimal::parse(item.weight_percentage);
    if (!value.has_value()) {
      return Result::failure(ErrorKind::Validation, "Invalid role weight '" + item.weight_percentage + "'.",
                             "role_weights[week=" + std::to_string(week_index) + "]");
    }
    parsed.push_back({.role = item.role, .weight_percentage = *value});
  }

  return write_period_config(period_id, "role weights changed for week " + std::to_string(week_index),
                             [&](Store::Tables& tables, const Period& period) {
                               auto& weights = tables.role_weights[period.period_id][week_index];
                               for (const auto& weight : parsed) {
                                 weights[weight.role] = weight;
                               }
                               const Result valid = validator_.validate_role_weights(period, week_index, weights,
                                                                                     ValidationMode::WriteTime);
                               if (!valid.ok) {
                                 return valid;
                               }
                               return Result::success("Role weights saved.");
                             });
}

Result TallyService::apply_default_configuration(std::string_view period_id) {
  return write_period_config(period_id, "default configuration applied", [&](Store::Tables& tables,
                                                                             const Period& period) {
    auto& entries = tables.distribution[period.period_id];
    if (entries.empty() && !period.weeks.empty()) {
      const auto n = static_cast<std::int64_t>(period.weeks.size());
      std::int64_t previous = 0;
      for (std::int64_t i = 1; i <= n; ++i) {
        const std::int64_t position = util::round_half_up_div(static_cast<__int128>(10000) * i, n);
        entries[period.weeks[static_cast<std::size_t>(i - 1)].index] = {
            .week_index = period.weeks[static_cast<std::size_t>(i - 1)].index,
            .percentage = Decimal::from_cents(position - previous),
        };
        previous = position;
      }
    }

    const auto [junior_weight, senior_weight] = default_role_split(tables, period.shop_id);
    auto& weights_by_week = tables.role_weights[period.period_id];
    for (const auto& week : period.weeks) {
      auto& weights = weights_by_week[week.index];
      if (!weights.empty()) {
        continue;
      }
      weights[Role::SalesJunior] = {.role = Role::SalesJunior,
                                    .weight_percentage = Decimal::from_cents(junior_weight)};
      weights[Role::SalesSenior] = {.role = Role::SalesSenior,
                                    .weight_percentage = Decimal::from_cents(senior_weight)};
    }
    return validator_.validate_scope(tables, period.period_id, {.kind = ValidationScopeKind::All},
                                     ValidationMode::WriteTime);
  });
}

std::vector<MonthlyTarget> TallyService::monthly_targets(std::string_view period_id) const {
  std::vector<MonthlyTarget> out;
  store_.read([&](const Store::Tables& tables) {
    const auto it = tables.monthly_targets.find(std::string{period_id});
    if (it == tables.monthly_targets.end()) {
      return;
    }
    for (const auto& [category_id, target] : it->second) {
      out.push_back(target);
    }
  });
  return out;
}

std::vector<WeeklyDistributionEntry> TallyService::weekly_distribution(std::string_view period_id) const {
  std::vector<WeeklyDistributionEntry> out;
  store_.read([&](const Store::Tables& tables) {
    const auto it = tables.distribution.find(std::string{period_id});
    if (it == tables.distribution.end()) {
      return;
    }
    for (const auto& [week_index, entry] : it->second) {
      out.push_back(entry);
    }
  });
  return out;
}

std::vector<RoleWeight> TallyService::role_weights(std::string_view period_id, int week_index) const {
  std::vector<RoleWeight> out;
  store_.read([&](const Store::Tables& tables) {
    const auto by_week = tables.role_weights.find(std::string{period_id});
    if (by_week == tables.role_weights.end()) {
      return;
    }
    const auto weights = by_week->second.find(week_index);
    if (weights == by_week->second.end()) {
      return;
    }
    for (const auto& [role, weight] : weights->second) {
      out.push_back(weight);
    }
  });
  return out;
}

Result TallyService::upsert_membership(const Membership& membership) {
  const Result ready = ensure_initialized();
  if (!ready.ok) {
    return ready;
  }
  if (membership.shop_id.empty() || membership.user_id.empty()) {
    return Result::failure(ErrorKind::Validation, "Membership requires shop and user ids.", "user_id");
  }

  return store_.commit([&](Store::Tables& tables) {
    tables.memberships[Store::membership_key(membership.shop_id, membership.user_id)] = membership;
    const std::size_t dirtied = recalc::mark_shop_dirty(tables, membership.shop_id,
                                                        "membership changed for " + membership.user_id,
                                                        util::unix_timestamp_now());
    spdlog::debug("membership {} in shop {} saved as {} ({}), {} periods dirtied", membership.user_id,
                  membership.shop_id, to_string(membership.role), membership.active ? "active" : "inactive",
                  dirtied);
    return Result::success("Membership saved.");
  });
}

std::vector<Membership> TallyService::memberships(std::string_view shop_id) const {
  return store_.memberships_for_shop(shop_id);
}

Result TallyService::add_achievement(const AchievementDraft& draft) {
  const Result ready = ensure_initialized();
  if (!ready.ok) {
    return ready;
  }
  if (draft.shop_id.empty() || draft.user_id.empty()) {
    return Result::failure(ErrorKind::Validation, "Achievement requires shop and user ids.", "user_id");
  }
  if (!util::parse_date(draft.occurred_on).has_value()) {
    return Result::failure(ErrorKind::Validation, "Invalid achievement date '" + draft.occurred_on + "'.",
                           "occurred_on");
  }
  const auto value = Decimal::parse(draft.achieved_value);
  if (!value.has_value() || value->is_negative()) {
    return Result::failure(ErrorKind::Validation, "Invalid achieved value '" + draft.achieved_value + "'.",
                           "achieved_value");
  }

  const std::int64_t now = util::unix_timestamp_now();
  Achievement achievement;
  achievement.shop_id = draft.shop_id;
  achievement.user_id = draft.user_id;
  achievement.category_id = draft.category_id;
  achievement.occurred_on = draft.occurred_on;
  achievement.achieved_value = *value;
  achievement.source = draft.source;
  achievement.created_unix = now;
  achievement.updated_unix = now;
  achievement.achievement_id =
      util::content_id("ach", util::canonical_join({
                                  {"shop_id", achievement.shop_id},
                                  {"user_id", achievement.user_id},
                                  {"category_id", achievement.category_id},
                                  {"occurred_on", achievement.occurred_on},
                                  {"achieved_value", achievement.achieved_value.to_string()},
                                  {"created_ms", std::to_string(util::unix_millis_now())},
                                  {"counter", std::to_string(achievement_counter_.fetch_add(1))},
                              }));

  return store_.commit([&](Store::Tables& tables) {
    if (!category_registered(tables, achievement.shop_id, achievement.category_id)) {
      return Result::failure(ErrorKind::NotFound,
                             "Category " + achievement.category_id + " is not registered for shop " +
                                 achievement.shop_id + ".",
                             "category_id");
    }
    tables.achievements[achievement.achievement_id] = achievement;
    return Result::success("Achievement recorded.", achievement.achievement_id);
  });
}

Result TallyService::correct_achievement(std::string_view achievement_id, std::string_view achieved_value) {
  const Result ready = ensure_initialized();
  if (!ready.ok) {
    return ready;
  }
  const auto value = Decimal::parse(achieved_value);
  if (!value.has_value() || value->is_negative()) {
    return Result::failure(ErrorKind::Validation, "Invalid achieved value '" + std::string{achieved_value} + "'.",
                           "achieved_value");
  }

  return store_.commit([&](Store::Tables& tables) {
    const auto it = tables.achievements.find(std::string{achievement_id});
    if (it == tables.achievements.end()) {
      return Result::failure(ErrorKind::NotFound, "Unknown achievement " + std::string{achievement_id} + ".",
                             "achievement_id");
    }
    it->second.achieved_value = *value;
    it->second.updated_unix = util::unix_timestamp_now();
    return Result::success("Achievement corrected.", it->second.achievement_id);
  });
}

Result TallyService::delete_achievement(std::string_view achievement_id) {
  const Result ready = ensure_initialized();
  if (!ready.ok) {
    return ready;
  }
  return store_.commit([&](Store::Tables& tables) {
    if (tables.achievements.erase(std::string{achievement_id}) == 0) {
      return Result::failure(ErrorKind::NotFound, "Unknown achievement " + std::string{achievement_id} + ".",
                             "achievement_id");
    }
    return Result::success("Achievement deleted.");
  });
}

std::vector<Achievement> TallyService::achievements(std::string_view shop_id, std::string_view user_id,
                                                    std::string_view from_date, std::string_view to_date) const {
  std::vector<Achievement> out = store_.achievements_in_range(shop_id, from_date, to_date);
  if (!user_id.empty()) {
    std::erase_if(out, [&](const Achievement& achievement) { return achievement.user_id != user_id; });
  }
  return out;
}

Result TallyService::validate_config(std::string_view period_id, const ValidationScope& scope) const {
  Result result = Result::failure(ErrorKind::Storage, "Service is not initialized.");
  if (!initialized_) {
    return result;
  }
  store_.read([&](const Store::Tables& tables) {
    result = validator_.validate_scope(tables, period_id, scope, ValidationMode::WriteTime);
  });
  return result;
}

Result TallyService::validate_distribution(std::string_view period_id, ValidationMode mode) const {
  Result result = Result::failure(ErrorKind::Storage, "Service is not initialized.");
  if (!initialized_) {
    return result;
  }
  store_.read([&](const Store::Tables& tables) { result = validator_.validate_distribution(tables, period_id, mode); });
  return result;
}

Result TallyService::validate_role_weights(std::string_view period_id, int week_index, ValidationMode mode) const {
  Result result = Result::failure(ErrorKind::Storage, "Service is not initialized.");
  if (!initialized_) {
    return result;
  }
  store_.read([&](const Store::Tables& tables) {
    result = validator_.validate_role_weights(tables, period_id, week_index, mode);
  });
  return result;
}

Result TallyService::request_status_transition(std::string_view period_id, PeriodStatus new_status) {
  const Result ready = ensure_initialized();
  if (!ready.ok) {
    return ready;
  }

  const PeriodLocks::Guard guard =
      locks_.acquire_for(period_id, std::chrono::milliseconds{config_.write_lock_timeout_ms});
  if (!guard.owns_lock()) {
    return Result::failure(ErrorKind::Concurrency,
                           "Period " + std::string{period_id} + " is being recomputed; retry the transition.",
                           "period_id");
  }

  const Result committed = store_.commit([&](Store::Tables& tables) {
    const auto it = tables.periods.find(std::string{period_id});
    if (it == tables.periods.end()) {
      return unknown_period(period_id);
    }
    Period& period = it->second;
    if (period.status == new_status) {
      return Result::success("Period already " + to_string(new_status) + ".");
    }
    if (!transition_allowed(period.status, new_status)) {
      return Result::failure(ErrorKind::Validation,
                             "Cannot move period from " + to_string(period.status) + " to " + to_string(new_status) +
                                 ".",
                             "status");
    }

    if (new_status == PeriodStatus::Published || new_status == PeriodStatus::Locked) {
      const Result valid = validator_.validate_scope(tables, period_id, {.kind = ValidationScopeKind::All},
                                                     ValidationMode::Transition);
      if (!valid.ok) {
        return valid;
      }

      const RecalcFlag flag = recalc::state(tables, period_id);
      if (flag.dirty) {
        if (config_.block_transition_when_dirty) {
          return Result::failure(ErrorKind::Validation,
                                 "Period " + period.period_id + " has stale targets (" + flag.reason +
                                     "); recompute first.",
                                 "recalc");
        }
        spdlog::warn("period {} moves to {} with stale targets: {}", period.period_id, to_string(new_status),
                     flag.reason);
      }
    }

    period.status = new_status;
    return Result::success("Period moved to " + to_string(new_status) + ".");
  });

  if (committed.ok) {
    spdlog::info("period {}: {}", period_id, committed.message);
  } else {
    spdlog::info("period {} transition to {} refused: {}", period_id, to_string(new_status), committed.message);
  }
  return committed;
}

Result TallyService::recompute(std::string_view period_id) {
  RecomputeReport report;
  return recompute(period_id, report);
}

Result TallyService::recompute(std::string_view period_id, RecomputeReport& report) {
  const Result ready = ensure_initialized();
  if (!ready.ok) {
    return ready;
  }

  const PeriodLocks::Guard guard = locks_.try_acquire(period_id);
  if (!guard.owns_lock()) {
    return Result::failure(ErrorKind::Concurrency,
                           "A recompute for period " + std::string{period_id} + " is already running.", "period_id");
  }

  AllocationInput input;
  std::uint64_t generation = 0;
  Result precheck = Result::success();
  bool found = false;
  store_.read([&](const Store::Tables& tables) {
    const auto it = tables.periods.find(std::string{period_id});
    if (it == tables.periods.end()) {
      return;
    }
    found = true;
    input.period = it->second;
    if (const auto targets = tables.monthly_targets.find(input.period.period_id);
        targets != tables.monthly_targets.end()) {
      input.monthly_targets = targets->second;
    }
    if (const auto entries = tables.distribution.find(input.period.period_id); entries != tables.distribution.end()) {
      input.distribution = entries->second;
    }
    if (const auto weights = tables.role_weights.find(input.period.period_id); weights != tables.role_weights.end()) {
      input.role_weights = weights->second;
    }
    input.memberships = shop_memberships(tables, input.period.shop_id);
    generation = recalc::state(tables, input.period.period_id).generation;
    precheck = validator_.validate_scope(tables, input.period.period_id, {.kind = ValidationScopeKind::All},
                                         ValidationMode::WriteTime);
  });

  if (!found) {
    return unknown_period(period_id);
  }
  if (input.period.frozen()) {
    return Result::failure(ErrorKind::Recompute,
                           "Period " + input.period.period_id + " is " + to_string(input.period.status) +
                               "; targets are frozen.",
                           "status");
  }
  if (input.period.weeks.empty()) {
    return Result::failure(ErrorKind::Recompute, "Period " + input.period.period_id + " has no weeks.", "weeks");
  }
  if (!precheck.ok) {
    return Result::failure(ErrorKind::Recompute, "Recompute blocked: " + precheck.message, precheck.field);
  }

  AllocationOutput output = allocation_.allocate(input);
  const std::int64_t now = util::unix_timestamp_now();
  bool cleared = false;

  const Result committed = store_.commit([&](Store::Tables& tables) {
    const auto it = tables.periods.find(input.period.period_id);
    if (it == tables.periods.end() || it->second.frozen()) {
      return Result::failure(ErrorKind::Recompute,
                             "Period " + input.period.period_id + " changed state during recompute.", "status");
    }
    tables.target_sets[input.period.period_id] = {
        .period_id = input.period.period_id,
        .computed_unix = now,
        .digest = output.digest,
        .rows = output.rows,
    };
    cleared = recalc::clear_if_unchanged(tables, input.period.period_id, generation, now);
    return Result::success("Targets recomputed.", output.digest);
  });
  if (!committed.ok) {
    spdlog::error("recompute of period {} rolled back: {}", input.period.period_id, committed.message);
    return committed.kind == ErrorKind::Recompute
               ? committed
               : Result::failure(ErrorKind::Recompute, "Recompute rolled back: " + committed.message, committed.field);
  }

  report = {
      .period_id = input.period.period_id,
      .row_count = output.rows.size(),
      .digest = output.digest,
      .flag_cleared = cleared,
      .unallocated = std::move(output.unallocated),
  };
  if (!cleared) {
    spdlog::warn("period {} changed while recomputing; recalc flag stays dirty", input.period.period_id);
  }
  spdlog::info("recomputed period {}: {} targets, {} unallocated role targets, digest {}", input.period.period_id,
               report.row_count, report.unallocated.size(), report.digest.substr(0, 12));
  return committed;
}

std::optional<TargetSet> TallyService::user_week_targets(std::string_view period_id) const {
  return store_.target_set(period_id);
}

RecalcFlag TallyService::recalc_flag(std::string_view period_id) const {
  RecalcFlag flag;
  store_.read([&](const Store::Tables& tables) { flag = recalc::state(tables, period_id); });
  return flag;
}

Result TallyService::compute_snapshot(std::string_view period_id, std::string_view rules_version) {
  const Result ready = ensure_initialized();
  if (!ready.ok) {
    return ready;
  }
  // Explicit versions are unique per period. Without one, every call appends a new
  // snapshot tagged "<default>#<sequence>".
  if (rules_version.find(kRulesSequenceMark) != std::string_view::npos) {
    return Result::failure(ErrorKind::Validation,
                           "Rules version may not contain '" + std::string{kRulesSequenceMark} + "'.",
                           "rules_version");
  }
  std::string version{rules_version};

  const Result committed = store_.commit([&](Store::Tables& tables) {
    const auto period_it = tables.periods.find(std::string{period_id});
    if (period_it == tables.periods.end()) {
      return unknown_period(period_id);
    }
    const Period& period = period_it->second;
    const auto targets = tables.target_sets.find(period.period_id);
    if (targets == tables.target_sets.end()) {
      return Result::failure(ErrorKind::NotComputed,
                             "Targets for period " + period.period_id + " have not been computed yet.", "period_id");
    }

    const LeaderboardSnapshot* prior = latest_snapshot(tables, period.period_id);
    static const std::vector<LeaderboardRow> kNoRows;
    const auto prior_rows_it = prior == nullptr ? tables.snapshot_rows.end() : tables.snapshot_rows.find(prior->snapshot_id);
    const std::vector<LeaderboardRow>& prior_rows =
        prior_rows_it == tables.snapshot_rows.end() ? kNoRows : prior_rows_it->second;

    std::vector<LeaderboardRow> rows =
        scorer_.score(period, targets->second,
                      shop_achievements(tables, period.shop_id, period.start_date(), period.end_date()), prior_rows);

    LeaderboardSnapshot snapshot;
    snapshot.period_id = period.period_id;
    snapshot.sequence = tables.next_sequence++;
    if (version.empty()) {
      version = config_.default_rules_version + std::string{kRulesSequenceMark} + std::to_string(snapshot.sequence);
    }
    snapshot.rules_version = version;
    snapshot.computed_unix_ms = util::unix_millis_now();
    if (prior != nullptr && snapshot.computed_unix_ms < prior->computed_unix_ms) {
      snapshot.computed_unix_ms = prior->computed_unix_ms;
    }
    snapshot.snapshot_id = util::content_id("snap", util::canonical_join({
                                                        {"period_id", snapshot.period_id},
                                                        {"rules_version", snapshot.rules_version},
                                                        {"computed_unix_ms", std::to_string(snapshot.computed_unix_ms)},
                                                        {"sequence", std::to_string(snapshot.sequence)},
                                                    }));
    for (auto& row : rows) {
      row.snapshot_id = snapshot.snapshot_id;
    }

    const std::size_t row_count = rows.size();
    tables.snapshot_rows[snapshot.snapshot_id] = std::move(rows);
    tables.snapshots.push_back(snapshot);
    return Result::success("Snapshot computed with " + std::to_string(row_count) + " rows.", snapshot.snapshot_id);
  });

  if (committed.ok) {
    spdlog::info("leaderboard snapshot {} for period {} (rules {}): {}", committed.data, period_id, version,
                 committed.message);
  }
  return committed;
}

std::vector<LeaderboardRow> TallyService::leaderboard_rows(std::string_view snapshot_id) const {
  return store_.snapshot_rows(snapshot_id);
}

std::vector<LeaderboardSnapshot> TallyService::snapshots(std::string_view period_id) const {
  return store_.snapshots_for_period(period_id);
}

std::vector<LeaderboardRow> TallyService::current_leaderboard(std::string_view period_id) const {
  const auto listed = store_.snapshots_for_period(period_id);
  if (listed.empty()) {
    return {};
  }
  return store_.snapshot_rows(listed.front().snapshot_id);
}

std::vector<WeekProgress> TallyService::weekly_progress(std::string_view period_id) const {
  std::vector<WeekProgress> out;
  store_.read([&](const Store::Tables& tables) {
    const auto period_it = tables.periods.find(std::string{period_id});
    if (period_it == tables.periods.end()) {
      return;
    }
    const Period& period = period_it->second;
    const auto targets = tables.target_sets.find(period.period_id);
    const std::vector<Achievement> logged =
        shop_achievements(tables, period.shop_id, period.start_date(), period.end_date());

    for (const auto& week : period.weeks) {
      // user -> category -> {target, achieved}
      std::map<std::string, std::map<std::string, std::pair<Decimal, Decimal>>> cells;
      if (targets != tables.target_sets.end()) {
        for (const auto& row : targets->second.rows) {
          if (row.week_index == week.index) {
            cells[row.user_id][row.category_id].first += row.target_value;
          }
        }
      }
      for (const auto& achievement : logged) {
        if (achievement.occurred_on >= week.start_date && achievement.occurred_on <= week.end_date) {
          cells[achievement.user_id][achievement.category_id].second += achievement.achieved_value;
        }
      }

      WeekProgress progress;
      progress.week = week;
      for (const auto& [user_id, categories] : cells) {
        UserWeeklyProgress user;
        user.user_id = user_id;
        const auto membership = tables.memberships.find(Store::membership_key(period.shop_id, user_id));
        if (membership != tables.memberships.end()) {
          user.role = membership->second.role;
        }
        for (const auto& [category_id, values] : categories) {
          user.categories.push_back({
              .category_id = category_id,
              .category_name = category_name(tables, period.shop_id, category_id),
              .target_value = values.first,
              .achieved_value = values.second,
              .percentage = util::percentage_of(values.second, values.first),
          });
          user.total_target += values.first;
          user.total_achieved += values.second;
        }
        user.percentage = util::percentage_of(user.total_achieved, user.total_target);
        progress.users.push_back(std::move(user));
      }
      out.push_back(std::move(progress));
    }
  });
  return out;
}

std::vector<CategoryProgress> TallyService::category_performance(std::string_view period_id) const {
  std::vector<CategoryProgress> out;
  store_.read([&](const Store::Tables& tables) {
    const auto period_it = tables.periods.find(std::string{period_id});
    if (period_it == tables.periods.end()) {
      return;
    }
    const Period& period = period_it->second;

    std::map<std::string, std::pair<Decimal, Decimal>> totals;
    if (const auto targets = tables.monthly_targets.find(period.period_id); targets != tables.monthly_targets.end()) {
      for (const auto& [category_id, target] : targets->second) {
        totals[category_id].first = target.target_value;
      }
    }
    for (const auto& achievement : shop_achievements(tables, period.shop_id, period.start_date(), period.end_date())) {
      totals[achievement.category_id].second += achievement.achieved_value;
    }

    for (const auto& [category_id, values] : totals) {
      out.push_back({
          .category_id = category_id,
          .category_name = category_name(tables, period.shop_id, category_id),
          .target_value = values.first,
          .achieved_value = values.second,
          .percentage = util::percentage_of(values.second, values.first),
      });
    }
  });
  return out;
}

}  // namespace tally
