#pragma once

#include <map>
#include <string_view>

#include "core/model/types.hpp"
#include "core/storage/store.hpp"

namespace tally {

enum class ValidationMode {
  WriteTime,   // sum must not exceed 100.00
  Transition,  // sum must equal 100.00 within tolerance
};

class InvariantValidator {
public:
  explicit InvariantValidator(Decimal tolerance = Decimal::from_cents(1)) : tolerance_(tolerance) {}

  Result validate_distribution(const Period& period, const std::map<int, WeeklyDistributionEntry>& entries,
                               ValidationMode mode) const;
  Result validate_role_weights(const Period& period, int week_index, const std::map<Role, RoleWeight>& weights,
                               ValidationMode mode) const;

  Result validate_distribution(const Store::Tables& tables, std::string_view period_id, ValidationMode mode) const;
  Result validate_role_weights(const Store::Tables& tables, std::string_view period_id, int week_index,
                               ValidationMode mode) const;
  Result validate_scope(const Store::Tables& tables, std::string_view period_id, const ValidationScope& scope,
                        ValidationMode mode) const;

  static Result validate_percentage(Decimal value, std::string_view field);

  [[nodiscard]] Decimal tolerance() const { return tolerance_; }

private:
  Result check_sum(Decimal sum, ValidationMode mode, const std::string& field, const std::string& scope) const;

  Decimal tolerance_;
};

}  // namespace tally
