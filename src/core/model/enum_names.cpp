#include "core/model/enum_names.hpp"

namespace tally {

std::string to_string(PeriodStatus status) {
  switch (status) {
    case PeriodStatus::Draft:
      return "draft";
    case PeriodStatus::Published:
      return "published";
    case PeriodStatus::Locked:
      return "locked";
    case PeriodStatus::Archived:
      return "archived";
  }
  return "draft";
}

std::string to_string(Role role) {
  switch (role) {
    case Role::Owner:
      return "owner";
    case Role::Manager:
      return "manager";
    case Role::SalesJunior:
      return "sales_junior";
    case Role::SalesSenior:
      return "sales_senior";
  }
  return "sales_junior";
}

std::string to_string(CategoryUnit unit) {
  return unit == CategoryUnit::Currency ? "currency" : "count";
}

std::string to_string(AchievementSource source) {
  switch (source) {
    case AchievementSource::Manual:
      return "manual";
    case AchievementSource::Import:
      return "import";
    case AchievementSource::Api:
      return "api";
  }
  return "manual";
}

std::string to_string(Trend trend) {
  switch (trend) {
    case Trend::Up:
      return "up";
    case Trend::Down:
      return "down";
    case Trend::Flat:
      return "flat";
  }
  return "flat";
}

std::string to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None:
      return "none";
    case ErrorKind::Validation:
      return "validation";
    case ErrorKind::Recompute:
      return "recompute";
    case ErrorKind::NotComputed:
      return "not_computed";
    case ErrorKind::Concurrency:
      return "concurrency";
    case ErrorKind::NotFound:
      return "not_found";
    case ErrorKind::Conflict:
      return "conflict";
    case ErrorKind::Storage:
      return "storage";
  }
  return "none";
}

std::optional<PeriodStatus> period_status_from_string(std::string_view text) {
  if (text == "draft") {
    return PeriodStatus::Draft;
  }
  if (text == "published") {
    return PeriodStatus::Published;
  }
  if (text == "locked") {
    return PeriodStatus::Locked;
  }
  if (text == "archived") {
    return PeriodStatus::Archived;
  }
  return std::nullopt;
}

std::optional<Role> role_from_string(std::string_view text) {
  if (text == "owner") {
    return Role::Owner;
  }
  if (text == "manager") {
    return Role::Manager;
  }
  if (text == "sales_junior" || text == "junior") {
    return Role::SalesJunior;
  }
  if (text == "sales_senior" || text == "senior") {
    return Role::SalesSenior;
  }
  return std::nullopt;
}

std::optional<CategoryUnit> category_unit_from_string(std::string_view text) {
  if (text == "count") {
    return CategoryUnit::Count;
  }
  if (text == "currency") {
    return CategoryUnit::Currency;
  }
  return std::nullopt;
}

std::optional<AchievementSource> achievement_source_from_string(std::string_view text) {
  if (text == "manual") {
    return AchievementSource::Manual;
  }
  if (text == "import") {
    return AchievementSource::Import;
  }
  if (text == "api") {
    return AchievementSource::Api;
  }
  return std::nullopt;
}

std::optional<Trend> trend_from_string(std::string_view text) {
  if (text == "up") {
    return Trend::Up;
  }
  if (text == "down") {
    return Trend::Down;
  }
  if (text == "flat") {
    return Trend::Flat;
  }
  return std::nullopt;
}

int role_order(Role role) {
  return static_cast<int>(role);
}

}  // namespace tally
