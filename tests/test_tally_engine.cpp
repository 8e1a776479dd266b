#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <map>
#include <string>
#include <thread>
#include <vector>

#include "core/config/engine_config.hpp"
#include "core/model/enum_names.hpp"
#include "core/service/allocation_engine.hpp"
#include "core/service/leaderboard_scorer.hpp"
#include "core/service/period_locks.hpp"
#include "core/service/recalc_tracker.hpp"
#include "core/service/validator.hpp"
#include "core/storage/store.hpp"
#include "core/util/canonical.hpp"
#include "core/util/dates.hpp"
#include "core/util/decimal.hpp"
#include "core/util/hash.hpp"

namespace {

using tally::Decimal;

std::filesystem::path temp_dir(const std::string& name) {
  const auto root = std::filesystem::temp_directory_path() / "tally-tests" / name;
  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  std::filesystem::create_directories(root, ec);
  return root;
}

Decimal dec(const char* text) {
  const auto parsed = Decimal::parse(text);
  assert(parsed.has_value());
  return *parsed;
}

tally::Period make_period(int year, unsigned month) {
  tally::Period period;
  period.period_id = "per-test";
  period.shop_id = "shop-test";
  period.year = year;
  period.month = month;
  for (const auto& span : tally::util::month_week_spans(year, month)) {
    period.weeks.push_back({
        .index = span.index,
        .start_date = span.start_date,
        .end_date = span.end_date,
        .day_count = span.day_count,
    });
  }
  return period;
}

std::map<int, tally::WeeklyDistributionEntry> distribution(std::initializer_list<const char*> percentages) {
  std::map<int, tally::WeeklyDistributionEntry> out;
  int week = 1;
  for (const char* pct : percentages) {
    out[week] = {.week_index = week, .percentage = dec(pct)};
    ++week;
  }
  return out;
}

std::map<tally::Role, tally::RoleWeight> weights(std::initializer_list<std::pair<tally::Role, const char*>> items) {
  std::map<tally::Role, tally::RoleWeight> out;
  for (const auto& [role, pct] : items) {
    out[role] = {.role = role, .weight_percentage = dec(pct)};
  }
  return out;
}

std::int64_t total_cents(const std::vector<tally::UserWeekTarget>& rows) {
  std::int64_t sum = 0;
  for (const auto& row : rows) {
    sum += row.target_value.cents();
  }
  return sum;
}

void test_decimal_parsing_and_format() {
  assert(dec("12").cents() == 1200);
  assert(dec("12.3").cents() == 1230);
  assert(dec("12.34").cents() == 1234);
  assert(dec("-0.5").cents() == -50);
  assert(dec(".75").cents() == 75);
  assert(!Decimal::parse("12.345").has_value());
  assert(!Decimal::parse("abc").has_value());
  assert(!Decimal::parse("").has_value());
  assert(!Decimal::parse(".").has_value());
  assert(!Decimal::parse("5.").has_value());
  assert(!Decimal::parse("1e3").has_value());
  assert(!Decimal::parse("-").has_value());
  assert(!Decimal::parse("--5.50").has_value());
  assert(!Decimal::parse("+-1").has_value());
  assert(!Decimal::parse("-+1").has_value());
  assert(!Decimal::parse("--9223372036854775808").has_value());
  assert(!Decimal::parse("1000000000001").has_value());
  assert(dec("-1000000000000").cents() == -100000000000000);

  assert(Decimal::from_cents(-50).to_string() == "-0.50");
  assert(Decimal::from_cents(100000).to_string() == "1000.00");
  assert(Decimal::from_cents(7).to_string() == "0.07");
  assert(dec("33.33") + dec("66.67") == tally::util::kHundredPercent);

  assert(tally::util::percentage_of(dec("150"), dec("200")) == dec("75"));
  assert(tally::util::percentage_of(dec("1"), dec("3")) == dec("33.33"));
  assert(tally::util::percentage_of(dec("2"), dec("3")) == dec("66.67"));
  assert(tally::util::percentage_of(dec("5"), Decimal{}) == Decimal{});
  assert(tally::util::percentage_of(Decimal::from_cents(10'000'000'000'000'000), dec("0.01")) ==
         Decimal::from_cents(std::numeric_limits<std::int64_t>::max()));
  assert(tally::util::round_half_up_div(5, 2) == 3);

  assert(tally::util::within_tolerance(dec("99.99"), dec("100"), dec("0.01")));
  assert(!tally::util::within_tolerance(dec("99.98"), dec("100"), dec("0.01")));
}

void test_month_week_spans() {
  const auto february = tally::util::month_week_spans(2026, 2);
  assert(february.size() == 4);
  assert(february.front().start_date == "2026-02-01");
  assert(february.back().start_date == "2026-02-22");
  assert(february.back().end_date == "2026-02-28");
  assert(february.back().day_count == 7);

  const auto leap = tally::util::month_week_spans(2024, 2);
  assert(leap.size() == 5);
  assert(leap.back().start_date == "2024-02-29");
  assert(leap.back().end_date == "2024-02-29");
  assert(leap.back().day_count == 1);

  const auto march = tally::util::month_week_spans(2026, 3);
  assert(march.size() == 5);
  assert(march[4].index == 5);
  assert(march[4].start_date == "2026-03-29");
  assert(march[4].day_count == 3);

  assert(tally::util::previous_day("2026-03-01") == "2026-02-28");
  assert(!tally::util::parse_date("2026-02-30").has_value());
}

void test_sha256_and_content_ids() {
  assert(tally::util::ensure_sodium());
  assert(tally::util::sha256_hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  const std::string id = tally::util::content_id("snap", "payload");
  assert(id.rfind("snap-", 0) == 0);
  assert(id.size() == 5 + 24);
  assert(id == tally::util::content_id("snap", "payload"));
}

void test_canonical_records() {
  const std::string joined = tally::util::canonical_join({{"b", "two\nlines"}, {"a", "back\\slash=x"}});
  assert(joined == "a=back\\\\slash=x\nb=two\\nlines\n");
  const auto parsed = tally::util::parse_canonical_map(joined + "no separator\n=orphan\na=second\n");
  assert(parsed.size() == 2);
  assert(parsed.at("a") == "back\\slash=x");
  assert(parsed.at("b") == "two\nlines");

  assert(tally::util::trim_copy("  padded\t\n") == "padded");
  assert(tally::util::trim_copy(" \t ").empty());
  assert(tally::util::lowercase_copy("MiXeD") == "mixed");
  assert((tally::util::split_csv(" a, ,b ,") == std::vector<std::string>{"a", "b"}));

  assert(tally::util::to_hex(std::string{"\x00\xff", 2}) == "00ff");
  assert(tally::util::from_hex("00FF") == std::string("\x00\xff", 2));
  assert(!tally::util::from_hex("abc").has_value());
  assert(!tally::util::from_hex("zz").has_value());
}

void test_validator_write_time_and_transition() {
  const tally::InvariantValidator validator{dec("0.01")};
  const tally::Period period = make_period(2026, 2);
  using tally::ValidationMode;

  assert(validator.validate_distribution(period, distribution({"60", "30"}), ValidationMode::WriteTime).ok);
  const tally::Result partial = validator.validate_distribution(period, distribution({"60", "30"}),
                                                                ValidationMode::Transition);
  assert(!partial.ok);
  assert(partial.kind == tally::ErrorKind::Validation);
  assert(partial.field == "weekly_distribution");

  const tally::Result over = validator.validate_distribution(period, distribution({"60", "40.01"}),
                                                             ValidationMode::WriteTime);
  assert(!over.ok);
  assert(over.field == "weekly_distribution");

  assert(validator.validate_distribution(period, distribution({"25", "25", "25", "24.99"}),
                                         ValidationMode::Transition)
             .ok);
  assert(!validator.validate_distribution(period, distribution({"25", "25", "25", "24.98"}),
                                          ValidationMode::Transition)
              .ok);

  std::map<int, tally::WeeklyDistributionEntry> bad_week;
  bad_week[9] = {.week_index = 9, .percentage = dec("10")};
  assert(!validator.validate_distribution(period, bad_week, ValidationMode::WriteTime).ok);

  using tally::Role;
  const tally::Result heavy = validator.validate_role_weights(
      period, 2, weights({{Role::SalesJunior, "70"}, {Role::SalesSenior, "40"}}), ValidationMode::WriteTime);
  assert(!heavy.ok);
  assert(heavy.field == "role_weights[week=2]");
  assert(validator
             .validate_role_weights(period, 2, weights({{Role::SalesJunior, "70"}}), ValidationMode::WriteTime)
             .ok);
  assert(!validator
              .validate_role_weights(period, 2, weights({{Role::SalesJunior, "70"}}), ValidationMode::Transition)
              .ok);
  assert(!validator.validate_role_weights(period, 3, weights({{Role::Owner, "-1"}}), ValidationMode::WriteTime).ok);

  // Weeks are checked independently: an empty week fails only at transition.
  tally::Store::Tables tables;
  tables.periods[period.period_id] = period;
  tables.distribution[period.period_id] = distribution({"25", "25", "25", "25"});
  for (const auto& week : period.weeks) {
    if (week.index != 3) {
      tables.role_weights[period.period_id][week.index] =
          weights({{Role::SalesJunior, "40"}, {Role::SalesSenior, "60"}});
    }
  }
  assert(validator.validate_scope(tables, period.period_id, {.kind = tally::ValidationScopeKind::All},
                                  ValidationMode::WriteTime)
             .ok);
  const tally::Result missing_week = validator.validate_scope(
      tables, period.period_id, {.kind = tally::ValidationScopeKind::All}, ValidationMode::Transition);
  assert(!missing_week.ok);
  assert(missing_week.field == "role_weights[week=3]");
  assert(validator.validate_scope(tables, "per-missing", {}, ValidationMode::WriteTime).kind ==
         tally::ErrorKind::NotFound);
}

void test_allocation_reference_example() {
  using tally::Role;
  tally::AllocationInput input;
  input.period = make_period(2026, 2);
  input.monthly_targets["sales"] = {.category_id = "sales", .target_value = dec("1000.00")};
  input.distribution = distribution({"25", "25", "25", "25"});
  for (const auto& week : input.period.weeks) {
    input.role_weights[week.index] = weights({{Role::SalesJunior, "60"}, {Role::SalesSenior, "40"}});
  }
  input.memberships = {
      {.shop_id = "shop-test", .user_id = "u-junior-c", .role = Role::SalesJunior, .active = true},
      {.shop_id = "shop-test", .user_id = "u-junior-a", .role = Role::SalesJunior, .active = true},
      {.shop_id = "shop-test", .user_id = "u-junior-b", .role = Role::SalesJunior, .active = true},
      {.shop_id = "shop-test", .user_id = "u-senior", .role = Role::SalesSenior, .active = true},
      {.shop_id = "shop-test", .user_id = "u-gone", .role = Role::SalesSenior, .active = false},
  };

  const tally::AllocationEngine engine;
  const tally::AllocationOutput output = engine.allocate(input);
  assert(output.unallocated.empty());
  assert(output.rows.size() == 16);
  for (const auto& row : output.rows) {
    assert(row.user_id != "u-gone");
    if (row.user_id == "u-senior") {
      assert(row.target_value == dec("100.00"));
    } else {
      assert(row.target_value == dec("50.00"));
    }
  }
  assert(output.rows.front().week_index == 1);
  assert(output.rows.front().user_id == "u-junior-a");
  assert(total_cents(output.rows) == 100000);

  // Same inputs, same digest.
  assert(engine.allocate(input).digest == output.digest);
  input.memberships.push_back(
      {.shop_id = "shop-test", .user_id = "u-junior-d", .role = Role::SalesJunior, .active = true});
  assert(engine.allocate(input).digest != output.digest);
}

void test_even_split_remainder_order() {
  const auto shares = tally::AllocationEngine::split_evenly(dec("100.00"), 3);
  assert(shares.size() == 3);
  assert(shares[0] == dec("33.34"));
  assert(shares[1] == dec("33.33"));
  assert(shares[2] == dec("33.33"));

  const auto cents = tally::AllocationEngine::split_evenly(dec("0.02"), 5);
  assert(cents[0] == dec("0.01"));
  assert(cents[1] == dec("0.01"));
  assert(cents[2].is_zero());
  assert(tally::AllocationEngine::split_evenly(dec("10"), 0).empty());
}

void test_allocation_has_no_drift() {
  using tally::Role;
  for (int members = 1; members <= 50; ++members) {
    tally::AllocationInput input;
    input.period = make_period(2026, 3);
    input.monthly_targets["sales"] = {.category_id = "sales", .target_value = dec("1000.01")};
    input.monthly_targets["units"] = {.category_id = "units", .target_value = dec("7")};
    input.distribution = distribution({"33.33", "16.67", "25", "15", "10"});
    for (const auto& week : input.period.weeks) {
      input.role_weights[week.index] =
          weights({{Role::Manager, "10.01"}, {Role::SalesJunior, "44.99"}, {Role::SalesSenior, "45"}});
    }
    input.memberships.push_back({.shop_id = "shop-test", .user_id = "manager", .role = Role::Manager});
    input.memberships.push_back({.shop_id = "shop-test", .user_id = "senior-1", .role = Role::SalesSenior});
    input.memberships.push_back({.shop_id = "shop-test", .user_id = "senior-2", .role = Role::SalesSenior});
    for (int i = 0; i < members; ++i) {
      input.memberships.push_back(
          {.shop_id = "shop-test", .user_id = "junior-" + std::to_string(i), .role = Role::SalesJunior});
    }

    const tally::AllocationOutput output = tally::AllocationEngine{}.allocate(input);
    assert(output.unallocated.empty());

    std::map<std::string, std::int64_t> per_category;
    std::map<std::pair<std::string, int>, std::int64_t> per_week;
    for (const auto& row : output.rows) {
      assert(!row.target_value.is_negative());
      per_category[row.category_id] += row.target_value.cents();
      per_week[{row.category_id, row.week_index}] += row.target_value.cents();
    }
    assert(per_category["sales"] == 100001);
    assert(per_category["units"] == 700);

    const auto weekly = tally::AllocationEngine::weekly_targets(dec("1000.01"), input.period, input.distribution);
    assert(weekly.size() == 5);
    std::int64_t weekly_sum = 0;
    for (std::size_t i = 0; i < weekly.size(); ++i) {
      const std::int64_t allocated = per_week[{"sales", static_cast<int>(i) + 1}];
      assert(allocated == weekly[i].cents());
      weekly_sum += weekly[i].cents();
    }
    assert(weekly_sum == 100001);
  }
}

void test_allocation_reports_unallocated_roles() {
  using tally::Role;
  tally::AllocationInput input;
  input.period = make_period(2026, 2);
  input.monthly_targets["sales"] = {.category_id = "sales", .target_value = dec("1000")};
  input.distribution = distribution({"25", "25", "25", "25"});
  for (const auto& week : input.period.weeks) {
    input.role_weights[week.index] = weights({{Role::SalesJunior, "40"}, {Role::SalesSenior, "60"}});
  }
  input.memberships = {{.shop_id = "shop-test", .user_id = "solo", .role = Role::SalesJunior}};

  const tally::AllocationOutput output = tally::AllocationEngine{}.allocate(input);
  assert(output.rows.size() == 4);
  assert(output.unallocated.size() == 4);
  for (const auto& gap : output.unallocated) {
    assert(gap.role == Role::SalesSenior);
    assert(gap.amount == dec("150.00"));
  }
  assert(total_cents(output.rows) == 40000);
}

void test_scorer_ranking_trend_and_streak() {
  const tally::Period period = make_period(2026, 2);
  tally::TargetSet targets;
  targets.period_id = period.period_id;
  targets.rows = {
      {.week_index = 2, .user_id = "alice", .category_id = "sales", .target_value = dec("100")},
      {.week_index = 1, .user_id = "bob", .category_id = "sales", .target_value = dec("200")},
      {.week_index = 1, .user_id = "carol", .category_id = "sales", .target_value = dec("100")},
  };
  auto achievement = [](std::string user, std::string day, const char* value) {
    tally::Achievement a;
    a.shop_id = "shop-test";
    a.user_id = std::move(user);
    a.category_id = "sales";
    a.occurred_on = std::move(day);
    a.achieved_value = dec(value);
    return a;
  };
  const std::vector<tally::Achievement> achievements = {
      achievement("alice", "2026-02-02", "40"),   achievement("alice", "2026-02-03", "40"),
      achievement("bob", "2026-02-01", "160"),    achievement("carol", "2026-02-05", "40"),
      achievement("zed", "2026-02-04", "500"),    achievement("alice", "2026-03-01", "999"),
  };

  const tally::LeaderboardScorer scorer;
  const auto rows = scorer.score(period, targets, achievements, {});
  assert(rows.size() == 4);
  // alice and bob tie on 80.00%, bob wins on score; zed has no target and scores 0%.
  assert(rows[0].user_id == "bob");
  assert(rows[1].user_id == "alice");
  assert(rows[2].user_id == "carol");
  assert(rows[3].user_id == "zed");
  for (std::size_t i = 0; i < rows.size(); ++i) {
    assert(rows[i].rank == static_cast<int>(i) + 1);
    assert(rows[i].trend == tally::Trend::Flat);
  }
  assert(rows[1].achievement_pct == dec("80.00"));
  assert(rows[1].score == dec("80"));
  assert(rows[0].total_target == dec("200"));
  assert(rows[1].streak_days == 2);
  assert(rows[3].achievement_pct.is_zero());
  assert(rows[3].score == dec("500"));

  std::vector<tally::LeaderboardRow> prior = rows;
  prior[0].achievement_pct = dec("85");
  prior[1].achievement_pct = dec("75");
  const auto next = scorer.score(period, targets, achievements, prior);
  assert(next[0].trend == tally::Trend::Down);
  assert(next[1].trend == tally::Trend::Up);
  assert(next[2].trend == tally::Trend::Flat);

  using tally::LeaderboardScorer;
  assert(LeaderboardScorer::trend_between(dec("80"), dec("85"), Decimal{}) == tally::Trend::Up);
  assert(LeaderboardScorer::trend_between(dec("80"), dec("80"), Decimal{}) == tally::Trend::Flat);
  assert(LeaderboardScorer::trend_between(dec("80"), dec("75"), Decimal{}) == tally::Trend::Down);
  assert(LeaderboardScorer::trend_between(dec("80"), dec("80.40"), dec("0.50")) == tally::Trend::Flat);

  assert(LeaderboardScorer::streak_days({}, "2026-02-01") == 0);
  assert(LeaderboardScorer::streak_days({"2026-02-03", "2026-02-01", "2026-02-02", "2026-02-05"}, "2026-02-01") ==
         1);
  assert(LeaderboardScorer::streak_days({"2026-02-03", "2026-02-01", "2026-02-02", "2026-02-02"}, "2026-02-01") ==
         3);
  assert(LeaderboardScorer::streak_days({"2026-02-01", "2026-02-02", "2026-02-03"}, "2026-02-02") == 2);
}

void test_recalc_flag_generations() {
  tally::Store::Tables tables;
  tally::Period period = make_period(2026, 2);
  tables.periods[period.period_id] = period;
  tally::Period locked = make_period(2026, 3);
  locked.period_id = "per-locked";
  locked.status = tally::PeriodStatus::Locked;
  tables.periods[locked.period_id] = locked;

  assert(!tally::recalc::state(tables, period.period_id).dirty);
  tally::recalc::mark_dirty(tables, period.period_id, "targets changed", 1);
  const std::uint64_t seen = tally::recalc::state(tables, period.period_id).generation;

  assert(tally::recalc::mark_shop_dirty(tables, "shop-test", "membership changed", 2) == 1);
  assert(!tally::recalc::state(tables, locked.period_id).dirty);

  assert(!tally::recalc::clear_if_unchanged(tables, period.period_id, seen, 3));
  const tally::RecalcFlag still = tally::recalc::state(tables, period.period_id);
  assert(still.dirty);
  assert(still.reason == "membership changed");

  assert(tally::recalc::clear_if_unchanged(tables, period.period_id, still.generation, 4));
  assert(!tally::recalc::state(tables, period.period_id).dirty);
}

void test_period_locks() {
  tally::PeriodLocks locks;
  auto held = locks.try_acquire("per-a");
  assert(held.owns_lock());

  bool same_period_try = true;
  bool same_period_timed = true;
  bool other_period = false;
  std::thread worker([&] {
    same_period_try = locks.try_acquire("per-a").owns_lock();
    same_period_timed = locks.acquire_for("per-a", std::chrono::milliseconds{20}).owns_lock();
    other_period = locks.try_acquire("per-b").owns_lock();
  });
  worker.join();
  assert(!same_period_try);
  assert(!same_period_timed);
  assert(other_period);

  held.unlock();
  std::thread after([&] { same_period_try = locks.try_acquire("per-a").owns_lock(); });
  after.join();
  assert(same_period_try);
}

void test_store_commit_is_atomic() {
  tally::Store store;
  assert(store.open("").ok);
  assert(!store.persistent());

  tally::Period period = make_period(2026, 2);
  assert(store.commit([&](tally::Store::Tables& tables) {
    tables.periods[period.period_id] = period;
    tables.snapshots.push_back({.snapshot_id = "snap-1", .period_id = period.period_id, .rules_version = "v1"});
    return tally::Result::success();
  }).ok);

  const tally::Result duplicate = store.commit([&](tally::Store::Tables& tables) {
    tables.periods.erase(period.period_id);
    tables.snapshots.push_back({.snapshot_id = "snap-2", .period_id = period.period_id, .rules_version = "v1"});
    return tally::Result::success();
  });
  assert(!duplicate.ok);
  assert(duplicate.kind == tally::ErrorKind::Conflict);
  assert(store.period(period.period_id).has_value());
  assert(store.snapshots_for_period(period.period_id).size() == 1);

  const tally::Result refused = store.commit([&](tally::Store::Tables& tables) {
    tables.periods.clear();
    return tally::Result::failure(tally::ErrorKind::Validation, "nope");
  });
  assert(!refused.ok);
  assert(store.period(period.period_id).has_value());
}

void test_store_file_roundtrip() {
  const auto dir = temp_dir("store");
  using tally::Role;
  {
    tally::Store store;
    assert(store.open(dir.string()).ok);
    assert(store.persistent());
    assert(store.commit([&](tally::Store::Tables& tables) {
      tally::Period period = make_period(2026, 2);
      period.status = tally::PeriodStatus::Published;
      tables.periods[period.period_id] = period;
      tables.categories[tally::Store::category_key("shop-test", "sales")] = {
          .shop_id = "shop-test", .category_id = "sales", .name = "Sales\nfloor", .unit = tally::CategoryUnit::Currency};
      tables.distribution[period.period_id] = distribution({"25", "25", "25", "25"});
      tables.role_weights[period.period_id][2] = weights({{Role::Manager, "12.5"}});
      tables.target_sets[period.period_id] = {
          .period_id = period.period_id,
          .computed_unix = 42,
          .digest = "abc",
          .rows = {{.week_index = 2, .user_id = "alice", .category_id = "sales", .target_value = dec("12.34")}},
      };
      tally::recalc::mark_dirty(tables, period.period_id, "with | pipes = and\ttabs", 7);
      return tally::Result::success();
    }).ok);
  }
  assert(std::filesystem::exists(dir / "tally.dat"));
  assert(!std::filesystem::exists(dir / "tally.dat.tmp"));

  tally::Store reopened;
  assert(reopened.open(dir.string()).ok);
  const auto period = reopened.period("per-test");
  assert(period.has_value());
  assert(period->status == tally::PeriodStatus::Published);
  assert(period->weeks.size() == 4);
  assert(period->weeks[3].end_date == "2026-02-28");
  const auto categories = reopened.categories_for_shop("shop-test");
  assert(categories.size() == 1);
  assert(categories.front().name == "Sales\nfloor");
  assert(categories.front().unit == tally::CategoryUnit::Currency);
  const auto targets = reopened.target_set("per-test");
  assert(targets.has_value());
  assert(targets->rows.size() == 1);
  assert(targets->rows.front().target_value == dec("12.34"));
  const auto flag = reopened.recalc_flag("per-test");
  assert(flag.has_value());
  assert(flag->dirty);
  assert(flag->reason == "with | pipes = and\ttabs");
  reopened.read([](const tally::Store::Tables& tables) {
    assert(tables.role_weights.at("per-test").at(2).at(Role::Manager).weight_percentage == dec("12.50"));
  });

  assert(tally::Store::category_key("a|b", "c") != tally::Store::category_key("a", "b|c"));
  assert(tally::Store::membership_key("a\\", "|b") != tally::Store::membership_key("a\\|", "b"));
  assert(tally::Store::category_key("shop", "sales") == "shop|sales");

  std::ofstream corrupt(dir / "tally.dat", std::ios::app);
  corrupt << "period\tnot-hex\n";
  corrupt.close();
  tally::Store broken;
  const tally::Result load = broken.open(dir.string());
  assert(!load.ok);
  assert(load.kind == tally::ErrorKind::Storage);
}

void test_engine_config_file() {
  const auto dir = temp_dir("config");
  const auto path = dir / "tally.conf";
  {
    std::ofstream out(path);
    out << "# tally engine\n\n";
    out << "trend_epsilon = 0.50\n";
    out << "block_transition_when_dirty=yes\n";
    out << "write_lock_timeout_ms=40\n";
    out << "default_rules_version=v2\n";
    out << "colour=blue\n";
  }

  tally::EngineConfig config;
  const tally::Result loaded = tally::load_engine_config(path.string(), config);
  assert(loaded.ok);
  assert(config.trend_epsilon == dec("0.50"));
  assert(config.block_transition_when_dirty);
  assert(config.write_lock_timeout_ms == 40);
  assert(config.default_rules_version == "v2");
  assert(config.percentage_tolerance == dec("0.01"));

  {
    std::ofstream out(path);
    out << "trend_epsilon=0.5\npercentage_tolerance=lots\n";
  }
  tally::EngineConfig untouched;
  const tally::Result bad = tally::load_engine_config(path.string(), untouched);
  assert(!bad.ok);
  assert(bad.kind == tally::ErrorKind::Validation);
  assert(bad.field == "percentage_tolerance");
  assert(untouched.trend_epsilon.is_zero());

  const tally::Result missing = tally::load_engine_config((dir / "absent.conf").string(), untouched);
  assert(missing.kind == tally::ErrorKind::NotFound);
}

void test_enum_names() {
  assert(tally::to_string(tally::Role::SalesJunior) == "sales_junior");
  assert(tally::role_from_string("junior") == tally::Role::SalesJunior);
  assert(tally::role_from_string("sales_senior") == tally::Role::SalesSenior);
  assert(!tally::role_from_string("intern").has_value());
  assert(tally::period_status_from_string("locked") == tally::PeriodStatus::Locked);
  assert(tally::role_order(tally::Role::Owner) < tally::role_order(tally::Role::SalesSenior));
}

}  // namespace

int main() {
  test_decimal_parsing_and_format();
  test_month_week_spans();
  test_sha256_and_content_ids();
  test_canonical_records();
  test_validator_write_time_and_transition();
  test_allocation_reference_example();
  test_even_split_remainder_order();
  test_allocation_has_no_drift();
  test_allocation_reports_unallocated_roles();
  test_scorer_ranking_trend_and_streak();
  test_recalc_flag_generations();
  test_period_locks();
  test_store_commit_is_atomic();
  test_store_file_roundtrip();
  test_engine_config_file();
  test_enum_names();

  std::cout << "tally_engine_tests passed\n";
  return 0;
}
