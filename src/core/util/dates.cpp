#include "core/util/dates.hpp"

#include <charconv>
#include <cstdio>

namespace tally::util {
namespace {

bool parse_int(std::string_view text, int& out) {
  const auto result = std::from_chars(text.data(), text.data() + text.size(), out);
  return result.ec == std::errc() && result.ptr == text.data() + text.size();
}

}  // namespace

std::optional<std::chrono::sys_days> parse_date(std::string_view text) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
    return std::nullopt;
  }
  int y = 0;
  int m = 0;
  int d = 0;
  if (!parse_int(text.substr(0, 4), y) || !parse_int(text.substr(5, 2), m) ||
      !parse_int(text.substr(8, 2), d)) {
    return std::nullopt;
  }
  const std::chrono::year_month_day ymd{std::chrono::year{y}, std::chrono::month{static_cast<unsigned>(m)},
                                        std::chrono::day{static_cast<unsigned>(d)}};
  if (!ymd.ok()) {
    return std::nullopt;
  }
  return std::chrono::sys_days{ymd};
}

std::string format_date(std::chrono::sys_days day) {
  const std::chrono::year_month_day ymd{day};
  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", static_cast<int>(ymd.year()),
                static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
  return buffer;
}

std::vector<DateSpan> month_week_spans(int year, unsigned month) {
  const std::chrono::sys_days first{std::chrono::year{year} / std::chrono::month{month} / 1};
  const std::chrono::sys_days last{std::chrono::year{year} / std::chrono::month{month} / std::chrono::last};

  std::vector<DateSpan> spans;
  int index = 1;
  for (std::chrono::sys_days start = first; start <= last; start += std::chrono::days{7}) {
    std::chrono::sys_days end = start + std::chrono::days{6};
    if (end > last) {
      end = last;
    }
    spans.push_back({
        .index = index++,
        .start_date = format_date(start),
        .end_date = format_date(end),
        .day_count = static_cast<int>((end - start).count()) + 1,
    });
  }
  return spans;
}

std::string previous_day(std::string_view date) {
  const auto parsed = parse_date(date);
  if (!parsed.has_value()) {
    return {};
  }
  return format_date(*parsed - std::chrono::days{1});
}

}  // namespace tally::util
