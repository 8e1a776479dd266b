#include "core/util/decimal.hpp"

#include <charconv>
#include <cstdlib>
#include <limits>

#include <spdlog/spdlog.h>

namespace tally::util {
namespace {

bool all_digits(std::string_view text) {
  for (const char c : text) {
    if (c < '0' || c > '9') {
      return false;
    }
  }
  return true;
}

}  // namespace

std::optional<Decimal> Decimal::parse(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }

  bool negative = false;
  if (text.front() == '-' || text.front() == '+') {
    negative = text.front() == '-';
    text.remove_prefix(1);
  }

  const std::size_t dot = text.find('.');
  const std::string_view whole = text.substr(0, dot);
  const std::string_view frac = dot == std::string_view::npos ? std::string_view{} : text.substr(dot + 1);
  if (whole.empty() && frac.empty()) {
    return std::nullopt;
  }
  if (dot != std::string_view::npos && frac.empty()) {
    return std::nullopt;
  }
  if (frac.size() > 2) {
    return std::nullopt;
  }

  if (!all_digits(whole)) {
    return std::nullopt;
  }

  std::int64_t units = 0;
  if (!whole.empty()) {
    const auto result = std::from_chars(whole.data(), whole.data() + whole.size(), units);
    if (result.ec != std::errc() || result.ptr != whole.data() + whole.size()) {
      return std::nullopt;
    }
  }
  if (units < 0 || units > kMaxWholeUnits) {
    return std::nullopt;
  }

  std::int64_t hundredths = 0;
  for (std::size_t i = 0; i < 2; ++i) {
    hundredths *= 10;
    if (i < frac.size()) {
      const char c = frac[i];
      if (c < '0' || c > '9') {
        return std::nullopt;
      }
      hundredths += c - '0';
    }
  }

  const std::int64_t cents = units * 100 + hundredths;
  return Decimal::from_cents(negative ? -cents : cents);
}

std::string Decimal::to_string() const {
  const std::int64_t magnitude = cents_ < 0 ? -cents_ : cents_;
  std::string out = cents_ < 0 ? "-" : "";
  out += std::to_string(magnitude / 100);
  out.push_back('.');
  const std::int64_t frac = magnitude % 100;
  out.push_back(static_cast<char>('0' + frac / 10));
  out.push_back(static_cast<char>('0' + frac % 10));
  return out;
}

bool within_tolerance(Decimal lhs, Decimal rhs, Decimal tolerance) {
  const std::int64_t diff = lhs.cents() - rhs.cents();
  return std::llabs(diff) <= tolerance.cents();
}

Decimal percentage_of(Decimal numerator, Decimal denominator) {
  if (denominator.is_zero()) {
    return Decimal{};
  }
  // (n / d) * 100 expressed in hundredths of a percent: n * 10000 / d.
  __int128 n = static_cast<__int128>(numerator.cents()) * 10000;
  __int128 d = denominator.cents();
  const bool negative = (n < 0) != (d < 0);
  if (n < 0) {
    n = -n;
  }
  if (d < 0) {
    d = -d;
  }
  const std::int64_t magnitude = round_half_up_div(n, d);
  return Decimal::from_cents(negative ? -magnitude : magnitude);
}

std::int64_t round_half_up_div(__int128 numerator, __int128 denominator) {
  __int128 quotient = numerator / denominator;
  const __int128 remainder = numerator % denominator;
  if (remainder * 2 >= denominator) {
    ++quotient;
  }
  if (quotient > std::numeric_limits<std::int64_t>::max()) {
    spdlog::warn("rounded quotient exceeds the int64 range; clamping");
    return std::numeric_limits<std::int64_t>::max();
  }
  return static_cast<std::int64_t>(quotient);
}

}  // namespace tally::util
