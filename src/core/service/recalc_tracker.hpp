#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "core/model/types.hpp"
#include "core/storage/store.hpp"

namespace tally::recalc {

// All functions operate on tables inside a Store::commit so the flag changes in the
// same transaction as the write that caused it.

void mark_dirty(Store::Tables& tables, std::string_view period_id, std::string reason, std::int64_t now_unix);

// Dirties every period of the shop that is still editable.
std::size_t mark_shop_dirty(Store::Tables& tables, std::string_view shop_id, const std::string& reason,
                            std::int64_t now_unix);

// Clears the flag only if nothing re-dirtied it since `generation` was read.
bool clear_if_unchanged(Store::Tables& tables, std::string_view period_id, std::uint64_t generation,
                        std::int64_t now_unix);

RecalcFlag state(const Store::Tables& tables, std::string_view period_id);

}  // namespace tally::recalc
