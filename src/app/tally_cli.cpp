#include <cstdlib>
#include <functional>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

#include "core/api/core_api.hpp"
#include "core/config/engine_config.hpp"
#include "core/model/app_meta.hpp"
#include "core/model/enum_names.hpp"

namespace {

using Args = std::vector<std::string>;

struct Command {
  std::size_t min_args = 0;
  std::string usage;
  std::function<tally::Result(tally::CoreApi&, const Args&)> run;
};

void print_usage(const std::map<std::string, Command>& commands) {
  std::cout << tally::kAppDisplayName << " " << tally::kAppVersion << " (" << tally::kBuildRelease << ")\n\n";
  std::cout << "usage: tally_cli [--config FILE] [--data-dir DIR] <command> [args...]\n\ncommands:\n";
  for (const auto& [name, command] : commands) {
    std::cout << "  " << name << " " << command.usage << "\n";
  }
}

std::optional<int> parse_int(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  const std::string owned{text};
  char* end = nullptr;
  const long value = std::strtol(owned.c_str(), &end, 10);
  if (end == nullptr || *end != '\0') {
    return std::nullopt;
  }
  return static_cast<int>(value);
}

// "3=25.00" -> {3, "25.00"}
std::optional<std::pair<std::string, std::string>> split_assignment(std::string_view text) {
  const auto pos = text.find('=');
  if (pos == std::string_view::npos || pos == 0) {
    return std::nullopt;
  }
  return std::pair{std::string{text.substr(0, pos)}, std::string{text.substr(pos + 1)}};
}

tally::Result bad_argument(std::string_view what, std::string_view value) {
  return tally::Result::failure(tally::ErrorKind::Validation,
                                "Invalid " + std::string{what} + " '" + std::string{value} + "'.", std::string{what});
}

void print_rows(const std::vector<tally::LeaderboardRow>& rows) {
  for (const auto& row : rows) {
    std::cout << "#" << row.rank << " " << row.user_id << " score=" << row.score.to_string()
              << " pct=" << row.achievement_pct.to_string() << " target=" << row.total_target.to_string()
              << " trend=" << tally::to_string(row.trend) << " streak=" << row.streak_days << "\n";
  }
  if (rows.empty()) {
    std::cout << "No leaderboard rows.\n";
  }
}

std::map<std::string, Command> build_commands() {
  using tally::CoreApi;
  using tally::Result;
  std::map<std::string, Command> commands;

  commands["create-period"] = {3, "SHOP YEAR MONTH", [](CoreApi& api, const Args& a) {
                                 const auto year = parse_int(a[1]);
                                 const auto month = parse_int(a[2]);
                                 if (!year || !month || *month < 1) {
                                   return bad_argument("month", a[1] + "-" + a[2]);
                                 }
                                 return api.create_period(a[0], *year, static_cast<unsigned>(*month));
                               }};

  commands["periods"] = {1, "SHOP", [](CoreApi& api, const Args& a) {
                           for (const auto& period : api.periods(a[0])) {
                             std::cout << period.period_id << " " << period.year << "-" << period.month << " "
                                       << tally::to_string(period.status) << " weeks=" << period.weeks.size() << "\n";
                           }
                           return Result::success();
                         }};

  commands["weeks"] = {1, "PERIOD", [](CoreApi& api, const Args& a) {
                         if (!api.period(a[0])) {
                           return Result::failure(tally::ErrorKind::NotFound, "Unknown period " + a[0] + ".",
                                                  "period_id");
                         }
                         for (const auto& week : api.weeks(a[0])) {
                           std::cout << "week " << week.index << ": " << week.start_date << " .. " << week.end_date
                                     << " (" << week.day_count << " days)\n";
                         }
                         return Result::success();
                       }};

  commands["add-category"] = {3, "SHOP ID NAME [count|currency]", [](CoreApi& api, const Args& a) {
                                tally::Category category{.shop_id = a[0], .category_id = a[1], .name = a[2]};
                                if (a.size() > 3) {
                                  const auto unit = tally::category_unit_from_string(a[3]);
                                  if (!unit) {
                                    return bad_argument("unit", a[3]);
                                  }
                                  category.unit = *unit;
                                }
                                return api.register_category(category);
                              }};

  commands["set-targets"] = {2, "PERIOD CATEGORY=VALUE...", [](CoreApi& api, const Args& a) {
                               std::vector<tally::MonthlyTargetInput> items;
                               for (std::size_t i = 1; i < a.size(); ++i) {
                                 const auto pair = split_assignment(a[i]);
                                 if (!pair) {
                                   return bad_argument("target", a[i]);
                                 }
                                 items.push_back({.category_id = pair->first, .target_value = pair->second});
                               }
                               return api.upsert_monthly_targets(a[0], items);
                             }};

  commands["set-distribution"] = {2, "PERIOD WEEK=PCT...", [](CoreApi& api, const Args& a) {
                                    std::vector<tally::WeeklyDistributionInput> items;
                                    for (std::size_t i = 1; i < a.size(); ++i) {
                                      const auto pair = split_assignment(a[i]);
                                      const auto week = pair ? parse_int(pair->first) : std::nullopt;
                                      if (!week) {
                                        return bad_argument("weekly_distribution", a[i]);
                                      }
                                      items.push_back({.week_index = *week, .percentage = pair->second});
                                    }
                                    return api.upsert_weekly_distribution(a[0], items);
                                  }};

  commands["set-weights"] = {3, "PERIOD WEEK ROLE=PCT...", [](CoreApi& api, const Args& a) {
                               const auto week = parse_int(a[1]);
                               if (!week) {
                                 return bad_argument("week", a[1]);
                               }
                               std::vector<tally::RoleWeightInput> items;
                               for (std::size_t i = 2; i < a.size(); ++i) {
                                 const auto pair = split_assignment(a[i]);
                                 const auto role = pair ? tally::role_from_string(pair->first) : std::nullopt;
                                 if (!role) {
                                   return bad_argument("role_weights", a[i]);
                                 }
                                 items.push_back({.role = *role, .weight_percentage = pair->second});
                               }
                               return api.upsert_role_weights(a[0], *week, items);
                             }};

  commands["apply-defaults"] = {1, "PERIOD", [](CoreApi& api, const Args& a) {
                                  return api.apply_default_configuration(a[0]);
                                }};

  commands["member"] = {3, "SHOP USER ROLE [active|inactive]", [](CoreApi& api, const Args& a) {
                          const auto role = tally::role_from_string(a[2]);
                          if (!role) {
                            return bad_argument("role", a[2]);
                          }
                          const bool active = a.size() < 4 || a[3] != "inactive";
                          return api.upsert_membership(
                              {.shop_id = a[0], .user_id = a[1], .role = *role, .active = active});
                        }};

  commands["achieve"] = {5, "SHOP USER CATEGORY DATE VALUE", [](CoreApi& api, const Args& a) {
                           return api.add_achievement({
                               .shop_id = a[0],
                               .user_id = a[1],
                               .category_id = a[2],
                               .occurred_on = a[3],
                               .achieved_value = a[4],
                               .source = tally::AchievementSource::Manual,
                           });
                         }};

  commands["correct"] = {2, "ACHIEVEMENT VALUE", [](CoreApi& api, const Args& a) {
                           return api.correct_achievement(a[0], a[1]);
                         }};

  commands["delete-achievement"] = {1, "ACHIEVEMENT", [](CoreApi& api, const Args& a) {
                                      return api.delete_achievement(a[0]);
                                    }};

  commands["validate"] = {1, "PERIOD [distribution|weights WEEK|all]", [](CoreApi& api, const Args& a) {
                            tally::ValidationScope scope{.kind = tally::ValidationScopeKind::All};
                            if (a.size() > 1 && a[1] == "distribution") {
                              scope.kind = tally::ValidationScopeKind::Distribution;
                            } else if (a.size() > 2 && a[1] == "weights") {
                              const auto week = parse_int(a[2]);
                              if (!week) {
                                return bad_argument("week", a[2]);
                              }
                              scope = {.kind = tally::ValidationScopeKind::RoleWeights, .week_index = *week};
                            }
                            return api.validate_config(a[0], scope);
                          }};

  commands["transition"] = {2, "PERIOD draft|published|locked|archived", [](CoreApi& api, const Args& a) {
                              const auto status = tally::period_status_from_string(a[1]);
                              if (!status) {
                                return bad_argument("status", a[1]);
                              }
                              return api.request_status_transition(a[0], *status);
                            }};

  commands["recompute"] = {1, "PERIOD", [](CoreApi& api, const Args& a) {
                             tally::RecomputeReport report;
                             const Result result = api.recompute(a[0], report);
                             if (result.ok) {
                               std::cout << "rows=" << report.row_count << " digest=" << report.digest
                                         << " flag_cleared=" << (report.flag_cleared ? "yes" : "no") << "\n";
                               for (const auto& gap : report.unallocated) {
                                 std::cout << "unallocated: week " << gap.week_index << " "
                                           << tally::to_string(gap.role) << " " << gap.category_id << " "
                                           << gap.amount.to_string() << "\n";
                               }
                             }
                             return result;
                           }};

  commands["targets"] = {1, "PERIOD", [](CoreApi& api, const Args& a) {
                           const auto targets = api.user_week_targets(a[0]);
                           if (!targets) {
                             return Result::failure(tally::ErrorKind::NotComputed,
                                                    "Targets for period " + a[0] + " have not been computed yet.",
                                                    "period_id");
                           }
                           for (const auto& row : targets->rows) {
                             std::cout << "week " << row.week_index << " " << row.category_id << " " << row.user_id
                                       << " " << row.target_value.to_string() << "\n";
                           }
                           return Result::success({}, targets->digest);
                         }};

  commands["flag"] = {1, "PERIOD", [](CoreApi& api, const Args& a) {
                        const tally::RecalcFlag flag = api.recalc_flag(a[0]);
                        std::cout << (flag.dirty ? "dirty" : "clean");
                        if (flag.dirty) {
                          std::cout << " (" << flag.reason << ")";
                        }
                        std::cout << " generation=" << flag.generation << "\n";
                        return Result::success();
                      }};

  commands["snapshot"] = {1, "PERIOD [RULES_VERSION]", [](CoreApi& api, const Args& a) {
                            return api.compute_snapshot(a[0], a.size() > 1 ? a[1] : std::string{});
                          }};

  commands["rows"] = {1, "SNAPSHOT", [](CoreApi& api, const Args& a) {
                        print_rows(api.get_leaderboard_rows(a[0]));
                        return Result::success();
                      }};

  commands["snapshots"] = {1, "PERIOD", [](CoreApi& api, const Args& a) {
                             for (const auto& snapshot : api.list_snapshots(a[0])) {
                               std::cout << snapshot.snapshot_id << " rules=" << snapshot.rules_version
                                         << " at=" << snapshot.computed_unix_ms << " seq=" << snapshot.sequence
                                         << "\n";
                             }
                             return Result::success();
                           }};

  commands["leaderboard"] = {1, "PERIOD", [](CoreApi& api, const Args& a) {
                               print_rows(api.current_leaderboard(a[0]));
                               return Result::success();
                             }};

  commands["progress"] = {1, "PERIOD", [](CoreApi& api, const Args& a) {
                            for (const auto& week : api.weekly_progress(a[0])) {
                              std::cout << "week " << week.week.index << " (" << week.week.start_date << " .. "
                                        << week.week.end_date << ")\n";
                              for (const auto& user : week.users) {
                                std::cout << "  " << user.user_id << " "
                                          << (user.role ? tally::to_string(*user.role) : std::string{"-"}) << " "
                                          << user.total_achieved.to_string() << "/" << user.total_target.to_string()
                                          << " (" << user.percentage.to_string() << "%)\n";
                              }
                            }
                            return Result::success();
                          }};

  commands["category-report"] = {1, "PERIOD", [](CoreApi& api, const Args& a) {
                                   for (const auto& category : api.category_performance(a[0])) {
                                     std::cout << category.category_id << " " << category.category_name << " "
                                               << category.achieved_value.to_string() << "/"
                                               << category.target_value.to_string() << " ("
                                               << category.percentage.to_string() << "%)\n";
                                   }
                                   return Result::success();
                                 }};

  return commands;
}

}  // namespace

int main(int argc, char** argv) {
  const auto commands = build_commands();

  tally::EngineConfig config{.data_dir = "tally-data"};
  std::optional<std::string> data_dir_override;
  Args positional;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if ((arg == "--config" || arg == "--data-dir") && i + 1 < argc) {
      if (arg == "--config") {
        const tally::Result loaded = tally::load_engine_config(argv[++i], config);
        if (!loaded.ok) {
          std::cerr << "config: " << loaded.message << '\n';
          return 2;
        }
      } else {
        data_dir_override = argv[++i];
      }
      continue;
    }
    if (arg == "--help" || arg == "-h") {
      print_usage(commands);
      return 0;
    }
    positional.push_back(arg);
  }
  if (data_dir_override) {
    config.data_dir = *data_dir_override;
  }

  if (positional.empty()) {
    print_usage(commands);
    return 2;
  }
  const auto command = commands.find(positional.front());
  if (command == commands.end()) {
    std::cerr << "unknown command: " << positional.front() << '\n';
    print_usage(commands);
    return 2;
  }
  const Args args(positional.begin() + 1, positional.end());
  if (args.size() < command->second.min_args) {
    std::cerr << "usage: tally_cli " << command->first << " " << command->second.usage << '\n';
    return 2;
  }

  tally::CoreApi api;
  const tally::Result init = api.init(config);
  if (!init.ok) {
    std::cerr << "tally init failed: " << init.message << '\n';
    return 1;
  }

  const tally::Result result = command->second.run(api, args);
  if (!result.ok) {
    spdlog::error("{} failed [{}{}]: {}", command->first, tally::to_string(result.kind),
                  result.field.empty() ? std::string{} : " " + result.field, result.message);
    return result.retryable() ? 75 : 1;
  }
  if (!result.message.empty()) {
    std::cout << result.message << '\n';
  }
  if (!result.data.empty()) {
    std::cout << result.data << '\n';
  }
  return 0;
}
