#include "core/storage/store.hpp"

#include <algorithm>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <set>
#include <system_error>
#include <tuple>
#include <unordered_map>
#include <utility>

#include <spdlog/spdlog.h>

#include "core/model/enum_names.hpp"
#include "core/util/canonical.hpp"

namespace tally {
namespace {

constexpr std::string_view kDataFile = "tally.dat";
constexpr std::string_view kDataHeader = "# tally store v1";

using Fields = std::unordered_map<std::string, std::string>;

// shop|id with '|' and backslash escaped in both parts, so distinct pairs never share a key.
std::string composite_key(std::string_view shop_id, std::string_view id) {
  std::string key;
  key.reserve(shop_id.size() + id.size() + 1);
  const auto append = [&key](std::string_view part) {
    for (const char c : part) {
      if (c == '|' || c == '\\') {
        key.push_back('\\');
      }
      key.push_back(c);
    }
  };
  append(shop_id);
  key.push_back('|');
  append(id);
  return key;
}

std::string record_line(std::string_view table, std::vector<std::pair<std::string, std::string>> fields) {
  std::string line{table};
  line.push_back('\t');
  line += util::to_hex(util::canonical_join(std::move(fields)));
  line.push_back('\n');
  return line;
}

template <typename Int>
bool parse_integer(const Fields& fields, const std::string& key, Int& out) {
  const auto it = fields.find(key);
  if (it == fields.end()) {
    return false;
  }
  const std::string& text = it->second;
  const auto result = std::from_chars(text.data(), text.data() + text.size(), out);
  return result.ec == std::errc() && result.ptr == text.data() + text.size();
}

bool parse_decimal(const Fields& fields, const std::string& key, Decimal& out) {
  const auto it = fields.find(key);
  if (it == fields.end()) {
    return false;
  }
  const auto parsed = Decimal::parse(it->second);
  if (!parsed.has_value()) {
    return false;
  }
  out = *parsed;
  return true;
}

std::string field(const Fields& fields, const std::string& key) {
  const auto it = fields.find(key);
  return it == fields.end() ? std::string{} : it->second;
}

std::string encode_weeks(const std::vector<Week>& weeks) {
  std::string out;
  for (const auto& week : weeks) {
    if (!out.empty()) {
      out.push_back(';');
    }
    out += std::to_string(week.index) + "," + week.start_date + "," + week.end_date + "," +
           std::to_string(week.day_count);
  }
  return out;
}

bool decode_weeks(std::string_view text, std::vector<Week>& out) {
  out.clear();
  while (!text.empty()) {
    const std::size_t end = text.find(';');
    const std::string_view item = text.substr(0, end);
    const std::vector<std::string> parts = util::split_csv(item);
    if (parts.size() != 4) {
      return false;
    }
    Week week;
    week.start_date = parts[1];
    week.end_date = parts[2];
    if (std::from_chars(parts[0].data(), parts[0].data() + parts[0].size(), week.index).ec != std::errc() ||
        std::from_chars(parts[3].data(), parts[3].data() + parts[3].size(), week.day_count).ec != std::errc()) {
      return false;
    }
    out.push_back(std::move(week));
    if (end == std::string_view::npos) {
      break;
    }
    text.remove_prefix(end + 1);
  }
  return true;
}

bool apply_record(std::string_view table, const Fields& f, Store::Tables& tables) {
  if (table == "period") {
    Period period;
    period.period_id = field(f, "period_id");
    period.shop_id = field(f, "shop_id");
    const auto status = period_status_from_string(field(f, "status"));
    if (!parse_integer(f, "year", period.year) || !parse_integer(f, "month", period.month) ||
        !parse_integer(f, "created_unix", period.created_unix) || !status.has_value() ||
        !decode_weeks(field(f, "weeks"), period.weeks) || period.period_id.empty()) {
      return false;
    }
    period.status = *status;
    tables.periods[period.period_id] = std::move(period);
    return true;
  }

  if (table == "category") {
    Category category;
    category.shop_id = field(f, "shop_id");
    category.category_id = field(f, "category_id");
    category.name = field(f, "name");
    const auto unit = category_unit_from_string(field(f, "unit"));
    if (!unit.has_value() || category.category_id.empty()) {
      return false;
    }
    category.unit = *unit;
    tables.categories[Store::category_key(category.shop_id, category.category_id)] = std::move(category);
    return true;
  }

  if (table == "monthly_target") {
    MonthlyTarget target;
    target.category_id = field(f, "category_id");
    if (!parse_decimal(f, "target_value", target.target_value)) {
      return false;
    }
    tables.monthly_targets[field(f, "period_id")][target.category_id] = std::move(target);
    return true;
  }

  if (table == "distribution") {
    WeeklyDistributionEntry entry;
    if (!parse_integer(f, "week_index", entry.week_index) || !parse_decimal(f, "percentage", entry.percentage)) {
      return false;
    }
    tables.distribution[field(f, "period_id")][entry.week_index] = entry;
    return true;
  }

  if (table == "role_weight") {
    int week_index = 0;
    RoleWeight weight;
    const auto role = role_from_string(field(f, "role"));
    if (!role.has_value() || !parse_integer(f, "week_index", week_index) ||
        !parse_decimal(f, "weight_percentage", weight.weight_percentage)) {
      return false;
    }
    weight.role = *role;
    tables.role_weights[field(f, "period_id")][week_index][weight.role] = weight;
    return true;
  }

  if (table == "membership") {
    Membership membership;
    membership.shop_id = field(f, "shop_id");
    membership.user_id = field(f, "user_id");
    membership.active = field(f, "active") == "1";
    const auto role = role_from_string(field(f, "role"));
    if (!role.has_value() || membership.user_id.empty()) {
      return false;
    }
    membership.role = *role;
    tables.memberships[Store::membership_key(membership.shop_id, membership.user_id)] = std::move(membership);
    return true;
  }

  if (table == "target_set") {
    TargetSet& set = tables.target_sets[field(f, "period_id")];
    set.period_id = field(f, "period_id");
    set.digest = field(f, "digest");
    return parse_integer(f, "computed_unix", set.computed_unix);
  }

  if (table == "user_week_target") {
    UserWeekTarget row;
    row.user_id = field(f, "user_id");
    row.category_id = field(f, "category_id");
    if (!parse_integer(f, "week_index", row.week_index) || !parse_decimal(f, "target_value", row.target_value)) {
      return false;
    }
    const std::string period_id = field(f, "period_id");
    TargetSet& set = tables.target_sets[period_id];
    set.period_id = period_id;
    set.rows.push_back(std::move(row));
    return true;
  }

  if (table == "recalc_flag") {
    RecalcFlag flag;
    flag.period_id = field(f, "period_id");
    flag.dirty = field(f, "dirty") == "1";
    flag.reason = field(f, "reason");
    if (!parse_integer(f, "generation", flag.generation) || !parse_integer(f, "updated_unix", flag.updated_unix)) {
      return false;
    }
    tables.recalc_flags[flag.period_id] = std::move(flag);
    return true;
  }

  if (table == "achievement") {
    Achievement achievement;
    achievement.achievement_id = field(f, "achievement_id");
    achievement.shop_id = field(f, "shop_id");
    achievement.user_id = field(f, "user_id");
    achievement.category_id = field(f, "category_id");
    achievement.occurred_on = field(f, "occurred_on");
    const auto source = achievement_source_from_string(field(f, "source"));
    if (!source.has_value() || !parse_decimal(f, "achieved_value", achievement.achieved_value) ||
        !parse_integer(f, "created_unix", achievement.created_unix) ||
        !parse_integer(f, "updated_unix", achievement.updated_unix)) {
      return false;
    }
    achievement.source = *source;
    tables.achievements[achievement.achievement_id] = std::move(achievement);
    return true;
  }

  if (table == "snapshot") {
    LeaderboardSnapshot snapshot;
    snapshot.snapshot_id = field(f, "snapshot_id");
    snapshot.period_id = field(f, "period_id");
    snapshot.rules_version = field(f, "rules_version");
    if (!parse_integer(f, "computed_unix_ms", snapshot.computed_unix_ms) ||
        !parse_integer(f, "sequence", snapshot.sequence)) {
      return false;
    }
    tables.snapshots.push_back(std::move(snapshot));
    return true;
  }

  if (table == "snapshot_row") {
    LeaderboardRow row;
    row.snapshot_id = field(f, "snapshot_id");
    row.user_id = field(f, "user_id");
    const auto trend = trend_from_string(field(f, "trend"));
    if (!trend.has_value() || !parse_integer(f, "rank", row.rank) || !parse_decimal(f, "score", row.score) ||
        !parse_decimal(f, "achievement_pct", row.achievement_pct) ||
        !parse_decimal(f, "total_target", row.total_target) || !parse_integer(f, "streak_days", row.streak_days)) {
      return false;
    }
    row.trend = *trend;
    tables.snapshot_rows[row.snapshot_id].push_back(std::move(row));
    return true;
  }

  if (table == "meta") {
    return parse_integer(f, "next_sequence", tables.next_sequence);
  }

  return false;
}

std::string serialize_tables(const Store::Tables& tables) {
  std::string out{kDataHeader};
  out.push_back('\n');

  out += record_line("meta", {{"next_sequence", std::to_string(tables.next_sequence)}});

  for (const auto& [id, period] : tables.periods) {
    out += record_line("period", {
                                     {"period_id", period.period_id},
                                     {"shop_id", period.shop_id},
                                     {"year", std::to_string(period.year)},
                                     {"month", std::to_string(period.month)},
                                     {"status", to_string(period.status)},
                                     {"created_unix", std::to_string(period.created_unix)},
                                     {"weeks", encode_weeks(period.weeks)},
                                 });
  }

  for (const auto& [key, category] : tables.categories) {
    out += record_line("category", {
                                       {"shop_id", category.shop_id},
                                       {"category_id", category.category_id},
                                       {"name", category.name},
                                       {"unit", to_string(category.unit)},
                                   });
  }

  for (const auto& [period_id, targets] : tables.monthly_targets) {
    for (const auto& [category_id, target] : targets) {
      out += record_line("monthly_target", {
                                               {"period_id", period_id},
                                               {"category_id", category_id},
                                               {"target_value", target.target_value.to_string()},
                                           });
    }
  }

  for (const auto& [period_id, entries] : tables.distribution) {
    for (const auto& [week_index, entry] : entries) {
      out += record_line("distribution", {
                                             {"period_id", period_id},
                                             {"week_index", std::to_string(week_index)},
                                             {"percentage", entry.percentage.to_string()},
                                         });
    }
  }

  for (const auto& [period_id, weeks] : tables.role_weights) {
    for (const auto& [week_index, weights] : weeks) {
      for (const auto& [role, weight] : weights) {
        out += record_line("role_weight", {
                                              {"period_id", period_id},
                                              {"week_index", std::to_string(week_index)},
                                              {"role", to_string(role)},
                                              {"weight_percentage", weight.weight_percentage.to_string()},
                                          });
      }
    }
  }

  for (const auto& [key, membership] : tables.memberships) {
    out += record_line("membership", {
                                         {"shop_id", membership.shop_id},
                                         {"user_id", membership.user_id},
                                         {"role", to_string(membership.role)},
                                         {"active", membership.active ? "1" : "0"},
                                     });
  }

  for (const auto& [period_id, set] : tables.target_sets) {
    out += record_line("target_set", {
                                         {"period_id", period_id},
                                         {"computed_unix", std::to_string(set.computed_unix)},
                                         {"digest", set.digest},
                                     });
    for (const auto& row : set.rows) {
      out += record_line("user_week_target", {
                                                 {"period_id", period_id},
                                                 {"week_index", std::to_string(row.week_index)},
                                                 {"user_id", row.user_id},
                                                 {"category_id", row.category_id},
                                                 {"target_value", row.target_value.to_string()},
                                             });
    }
  }

  for (const auto& [period_id, flag] : tables.recalc_flags) {
    out += record_line("recalc_flag", {
                                          {"period_id", period_id},
                                          {"dirty", flag.dirty ? "1" : "0"},
                                          {"reason", flag.reason},
                                          {"generation", std::to_string(flag.generation)},
                                          {"updated_unix", std::to_string(flag.updated_unix)},
                                      });
  }

  for (const auto& [id, achievement] : tables.achievements) {
    out += record_line("achievement", {
                                          {"achievement_id", achievement.achievement_id},
                                          {"shop_id", achievement.shop_id},
                                          {"user_id", achievement.user_id},
                                          {"category_id", achievement.category_id},
                                          {"occurred_on", achievement.occurred_on},
                                          {"achieved_value", achievement.achieved_value.to_string()},
                                          {"source", to_string(achievement.source)},
                                          {"created_unix", std::to_string(achievement.created_unix)},
                                          {"updated_unix", std::to_string(achievement.updated_unix)},
                                      });
  }

  for (const auto& snapshot : tables.snapshots) {
    out += record_line("snapshot", {
                                       {"snapshot_id", snapshot.snapshot_id},
                                       {"period_id", snapshot.period_id},
                                       {"rules_version", snapshot.rules_version},
                                       {"computed_unix_ms", std::to_string(snapshot.computed_unix_ms)},
                                       {"sequence", std::to_string(snapshot.sequence)},
                                   });
  }

  for (const auto& [snapshot_id, rows] : tables.snapshot_rows) {
    for (const auto& row : rows) {
      out += record_line("snapshot_row", {
                                             {"snapshot_id", snapshot_id},
                                             {"user_id", row.user_id},
                                             {"rank", std::to_string(row.rank)},
                                             {"score", row.score.to_string()},
                                             {"achievement_pct", row.achievement_pct.to_string()},
                                             {"total_target", row.total_target.to_string()},
                                             {"trend", to_string(row.trend)},
                                             {"streak_days", std::to_string(row.streak_days)},
                                         });
    }
  }

  return out;
}

}  // namespace

Result Store::open(std::string_view data_dir) {
  std::unique_lock lock(mutex_);
  tables_ = Tables{};
  data_dir_ = std::string{data_dir};
  data_path_.clear();

  if (data_dir_.empty()) {
    spdlog::debug("store opened in memory");
    return Result::success("Store opened in memory.");
  }

  std::error_code ec;
  std::filesystem::create_directories(data_dir_, ec);
  if (ec) {
    return Result::failure(ErrorKind::Storage, "Failed to create store directory: " + ec.message());
  }

  data_path_ = (std::filesystem::path{data_dir_} / std::string{kDataFile}).string();
  const Result loaded = load();
  if (!loaded.ok) {
    spdlog::error("store load failed: {}", loaded.message);
    return loaded;
  }

  spdlog::info("store opened at {} ({} periods, {} achievements, {} snapshots)", data_path_,
               tables_.periods.size(), tables_.achievements.size(), tables_.snapshots.size());
  return Result::success("Store opened.");
}

Result Store::commit(const Mutation& mutation) {
  std::unique_lock lock(mutex_);
  Tables working = tables_;

  Result result = mutation(working);
  if (!result.ok) {
    return result;
  }

  const Result constraints = check_constraints(working);
  if (!constraints.ok) {
    return constraints;
  }

  if (persistent()) {
    const Result persisted = persist(working);
    if (!persisted.ok) {
      spdlog::error("store commit rolled back: {}", persisted.message);
      return persisted;
    }
  }

  tables_ = std::move(working);
  return result;
}

void Store::read(const Reader& reader) const {
  std::shared_lock lock(mutex_);
  reader(tables_);
}

std::optional<Period> Store::period(std::string_view period_id) const {
  std::shared_lock lock(mutex_);
  const auto it = tables_.periods.find(std::string{period_id});
  if (it == tables_.periods.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<Period> Store::periods_for_shop(std::string_view shop_id) const {
  std::shared_lock lock(mutex_);
  std::vector<Period> out;
  for (const auto& [id, period] : tables_.periods) {
    if (period.shop_id == shop_id) {
      out.push_back(period);
    }
  }
  std::ranges::sort(out, [](const Period& lhs, const Period& rhs) {
    if (lhs.year != rhs.year) {
      return lhs.year > rhs.year;
    }
    return lhs.month > rhs.month;
  });
  return out;
}

std::vector<Category> Store::categories_for_shop(std::string_view shop_id) const {
  std::shared_lock lock(mutex_);
  std::vector<Category> out;
  for (const auto& [key, category] : tables_.categories) {
    if (category.shop_id == shop_id) {
      out.push_back(category);
    }
  }
  return out;
}

std::vector<Membership> Store::memberships_for_shop(std::string_view shop_id) const {
  std::shared_lock lock(mutex_);
  std::vector<Membership> out;
  for (const auto& [key, membership] : tables_.memberships) {
    if (membership.shop_id == shop_id) {
      out.push_back(membership);
    }
  }
  return out;
}

std::optional<TargetSet> Store::target_set(std::string_view period_id) const {
  std::shared_lock lock(mutex_);
  const auto it = tables_.target_sets.find(std::string{period_id});
  if (it == tables_.target_sets.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<RecalcFlag> Store::recalc_flag(std::string_view period_id) const {
  std::shared_lock lock(mutex_);
  const auto it = tables_.recalc_flags.find(std::string{period_id});
  if (it == tables_.recalc_flags.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<Achievement> Store::achievement(std::string_view achievement_id) const {
  std::shared_lock lock(mutex_);
  const auto it = tables_.achievements.find(std::string{achievement_id});
  if (it == tables_.achievements.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<Achievement> Store::achievements_in_range(std::string_view shop_id, std::string_view from_date,
                                                      std::string_view to_date) const {
  std::shared_lock lock(mutex_);
  std::vector<Achievement> out;
  for (const auto& [id, achievement] : tables_.achievements) {
    if (achievement.shop_id == shop_id && achievement.occurred_on >= from_date &&
        achievement.occurred_on <= to_date) {
      out.push_back(achievement);
    }
  }
  return out;
}

std::vector<LeaderboardSnapshot> Store::snapshots_for_period(std::string_view period_id) const {
  std::shared_lock lock(mutex_);
  std::vector<LeaderboardSnapshot> out;
  for (const auto& snapshot : tables_.snapshots) {
    if (snapshot.period_id == period_id) {
      out.push_back(snapshot);
    }
  }
  std::ranges::sort(out, [](const LeaderboardSnapshot& lhs, const LeaderboardSnapshot& rhs) {
    if (lhs.computed_unix_ms != rhs.computed_unix_ms) {
      return lhs.computed_unix_ms > rhs.computed_unix_ms;
    }
    return lhs.sequence > rhs.sequence;
  });
  return out;
}

std::optional<LeaderboardSnapshot> Store::snapshot(std::string_view snapshot_id) const {
  std::shared_lock lock(mutex_);
  const auto it = std::ranges::find_if(tables_.snapshots, [snapshot_id](const LeaderboardSnapshot& snapshot) {
    return snapshot.snapshot_id == snapshot_id;
  });
  if (it == tables_.snapshots.end()) {
    return std::nullopt;
  }
  return *it;
}

std::vector<LeaderboardRow> Store::snapshot_rows(std::string_view snapshot_id) const {
  std::shared_lock lock(mutex_);
  const auto it = tables_.snapshot_rows.find(std::string{snapshot_id});
  if (it == tables_.snapshot_rows.end()) {
    return {};
  }
  return it->second;
}

std::string Store::membership_key(std::string_view shop_id, std::string_view user_id) {
  return composite_key(shop_id, user_id);
}

std::string Store::category_key(std::string_view shop_id, std::string_view category_id) {
  return composite_key(shop_id, category_id);
}

Result Store::load() {
  std::ifstream in(data_path_);
  if (!in) {
    return Result::success("Store file will be created on first commit.");
  }

  Tables loaded;
  std::string line;
  std::size_t line_number = 0;
  while (std::getline(in, line)) {
    ++line_number;
    if (line.empty() || line.front() == '#') {
      continue;
    }

    const std::size_t tab = line.find('\t');
    if (tab == std::string::npos) {
      return Result::failure(ErrorKind::Storage, "Malformed store record at line " + std::to_string(line_number));
    }
    const std::string_view table = std::string_view{line}.substr(0, tab);
    const auto payload = util::from_hex(std::string_view{line}.substr(tab + 1));
    if (!payload.has_value() || !apply_record(table, util::parse_canonical_map(*payload), loaded)) {
      return Result::failure(ErrorKind::Storage, "Malformed store record at line " + std::to_string(line_number));
    }
  }

  const Result constraints = check_constraints(loaded);
  if (!constraints.ok) {
    return Result::failure(ErrorKind::Storage, "Store file violates constraints: " + constraints.message);
  }

  tables_ = std::move(loaded);
  return Result::success();
}

Result Store::persist(const Tables& tables) const {
  const std::string tmp_path = data_path_ + ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::out | std::ios::trunc);
    if (!out) {
      return Result::failure(ErrorKind::Storage, "Failed to open store file for writing.");
    }
    out << serialize_tables(tables);
    out.flush();
    if (!out.good()) {
      return Result::failure(ErrorKind::Storage, "Failed flushing store file.");
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, data_path_, ec);
  if (ec) {
    std::filesystem::remove(tmp_path, ec);
    return Result::failure(ErrorKind::Storage, "Failed to replace store file.");
  }
  return Result::success();
}

Result Store::check_constraints(const Tables& tables) {
  std::set<std::tuple<std::string, int, unsigned>> months;
  for (const auto& [id, period] : tables.periods) {
    if (!months.emplace(period.shop_id, period.year, period.month).second) {
      return Result::failure(ErrorKind::Conflict,
                             "A period already exists for shop " + period.shop_id + " " +
                                 std::to_string(period.year) + "-" + std::to_string(period.month) + ".",
                             "period");
    }
  }

  std::set<std::pair<std::string, std::string>> versions;
  std::set<std::string> snapshot_ids;
  for (const auto& snapshot : tables.snapshots) {
    if (!versions.emplace(snapshot.period_id, snapshot.rules_version).second) {
      return Result::failure(ErrorKind::Conflict,
                             "Snapshot with rules version " + snapshot.rules_version +
                                 " already exists for period " + snapshot.period_id + ".",
                             "rules_version");
    }
    if (!snapshot_ids.insert(snapshot.snapshot_id).second) {
      return Result::failure(ErrorKind::Conflict, "Duplicate snapshot id " + snapshot.snapshot_id + ".",
                             "snapshot_id");
    }
  }

  return Result::success();
}

}  // namespace tally
