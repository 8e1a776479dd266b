#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tally::util {

// Largest whole-unit magnitude `Decimal::parse` accepts. Sums of up to 90,000 such values
// stay inside int64 hundredths; the arithmetic operators do not check beyond that.
inline constexpr std::int64_t kMaxWholeUnits = 1'000'000'000'000;

// Exact fixed-point value with two fractional digits, stored as hundredths.
class Decimal {
public:
  constexpr Decimal() = default;

  static constexpr Decimal from_cents(std::int64_t cents) {
    Decimal d;
    d.cents_ = cents;
    return d;
  }
  static constexpr Decimal from_units(std::int64_t units) { return from_cents(units * 100); }

  // Accepts "12", "12.3", "12.34", "-0.5": one optional sign, then digits. More than two
  // fractional digits, or a magnitude above kMaxWholeUnits, is an error.
  static std::optional<Decimal> parse(std::string_view text);

  [[nodiscard]] constexpr std::int64_t cents() const { return cents_; }
  [[nodiscard]] constexpr bool is_zero() const { return cents_ == 0; }
  [[nodiscard]] constexpr bool is_negative() const { return cents_ < 0; }
  [[nodiscard]] std::string to_string() const;

  constexpr Decimal operator+(Decimal other) const { return from_cents(cents_ + other.cents_); }
  constexpr Decimal operator-(Decimal other) const { return from_cents(cents_ - other.cents_); }
  constexpr Decimal& operator+=(Decimal other) {
    cents_ += other.cents_;
    return *this;
  }
  constexpr Decimal& operator-=(Decimal other) {
    cents_ -= other.cents_;
    return *this;
  }

  constexpr auto operator<=>(const Decimal&) const = default;

private:
  std::int64_t cents_ = 0;
};

inline constexpr Decimal kHundredPercent = Decimal::from_units(100);

// |lhs - rhs| <= tolerance
bool within_tolerance(Decimal lhs, Decimal rhs, Decimal tolerance);

// numerator / denominator * 100, rounded half away from zero to two digits.
// A zero denominator yields zero.
Decimal percentage_of(Decimal numerator, Decimal denominator);

// numerator / denominator in cents, rounded half up. Both must be non-negative; a quotient
// beyond int64 is clamped to its maximum.
std::int64_t round_half_up_div(__int128 numerator, __int128 denominator);

}  // namespace tally::util
