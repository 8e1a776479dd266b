#include "core/service/recalc_tracker.hpp"

#include <utility>

#include <spdlog/spdlog.h>

namespace tally::recalc {

void mark_dirty(Store::Tables& tables, std::string_view period_id, std::string reason, std::int64_t now_unix) {
  RecalcFlag& flag = tables.recalc_flags[std::string{period_id}];
  flag.period_id = std::string{period_id};
  flag.dirty = true;
  flag.reason = std::move(reason);
  flag.generation += 1;
  flag.updated_unix = now_unix;
  spdlog::debug("period {} marked dirty (generation {}): {}", flag.period_id, flag.generation, flag.reason);
}

std::size_t mark_shop_dirty(Store::Tables& tables, std::string_view shop_id, const std::string& reason,
                            std::int64_t now_unix) {
  std::size_t marked = 0;
  for (const auto& [period_id, period] : tables.periods) {
    if (period.shop_id != shop_id || period.frozen()) {
      continue;
    }
    mark_dirty(tables, period_id, reason, now_unix);
    ++marked;
  }
  return marked;
}

bool clear_if_unchanged(Store::Tables& tables, std::string_view period_id, std::uint64_t generation,
                        std::int64_t now_unix) {
  RecalcFlag& flag = tables.recalc_flags[std::string{period_id}];
  flag.period_id = std::string{period_id};
  if (flag.generation != generation) {
    return false;
  }
  flag.dirty = false;
  flag.reason.clear();
  flag.updated_unix = now_unix;
  return true;
}

RecalcFlag state(const Store::Tables& tables, std::string_view period_id) {
  const auto it = tables.recalc_flags.find(std::string{period_id});
  if (it == tables.recalc_flags.end()) {
    RecalcFlag flag;
    flag.period_id = std::string{period_id};
    return flag;
  }
  return it->second;
}

}  // namespace tally::recalc
