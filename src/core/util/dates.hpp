#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tally::util {

struct DateSpan {
  int index = 0;  // 1-based
  std::string start_date;
  std::string end_date;
  int day_count = 0;
};

std::optional<std::chrono::sys_days> parse_date(std::string_view text);
std::string format_date(std::chrono::sys_days day);

// Consecutive 7-day slices from the 1st of the month; the final slice may be shorter.
std::vector<DateSpan> month_week_spans(int year, unsigned month);

std::string previous_day(std::string_view date);

}  // namespace tally::util
