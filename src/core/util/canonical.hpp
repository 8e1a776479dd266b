#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tally::util {

std::int64_t unix_timestamp_now();
std::int64_t unix_millis_now();

std::string lowercase_copy(std::string_view value);
std::string trim_copy(std::string_view value);

// Fields sorted by key, one "key=value" line each. Newlines and backslashes in values
// are escaped so every record stays on its own line.
std::string canonical_join(std::vector<std::pair<std::string, std::string>> fields);
// Inverse of canonical_join. Lines without '=' are skipped; the first value for a key wins.
std::unordered_map<std::string, std::string> parse_canonical_map(std::string_view payload);

std::vector<std::string> split_csv(std::string_view csv);

std::string to_hex(std::string_view bytes);
std::optional<std::string> from_hex(std::string_view hex);

}  // namespace tally::util
