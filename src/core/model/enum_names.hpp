#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "core/model/types.hpp"

namespace tally {

std::string to_string(PeriodStatus status);
std::string to_string(Role role);
std::string to_string(CategoryUnit unit);
std::string to_string(AchievementSource source);
std::string to_string(Trend trend);
std::string to_string(ErrorKind kind);

std::optional<PeriodStatus> period_status_from_string(std::string_view text);
std::optional<Role> role_from_string(std::string_view text);
std::optional<CategoryUnit> category_unit_from_string(std::string_view text);
std::optional<AchievementSource> achievement_source_from_string(std::string_view text);
std::optional<Trend> trend_from_string(std::string_view text);

// Position of the role in the canonical allocation order.
int role_order(Role role);

}  // namespace tally
