#include "core/util/canonical.hpp"

#include <algorithm>
#include <chrono>
#include <cctype>

namespace tally::util {
namespace {

constexpr std::string_view kWhitespace = " \t\r\n\f\v";
constexpr char kHexDigits[] = "0123456789abcdef";

template <typename Duration>
std::int64_t epoch_count() {
  return std::chrono::duration_cast<Duration>(std::chrono::system_clock::now().time_since_epoch()).count();
}

void append_escaped(std::string& out, std::string_view value) {
  for (const char c : value) {
    switch (c) {
      case '\n':
        out += "\\n";
        break;
      case '\\':
        out += "\\\\";
        break;
      default:
        out.push_back(c);
    }
  }
}

std::string unescape(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (value[i] != '\\' || i + 1 == value.size()) {
      out.push_back(value[i]);
      continue;
    }
    ++i;
    out.push_back(value[i] == 'n' ? '\n' : value[i]);
  }
  return out;
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  const char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (lower >= 'a' && lower <= 'f') {
    return lower - 'a' + 10;
  }
  return -1;
}

}  // namespace

std::int64_t unix_timestamp_now() {
  return epoch_count<std::chrono::seconds>();
}

std::int64_t unix_millis_now() {
  return epoch_count<std::chrono::milliseconds>();
}

std::string lowercase_copy(std::string_view value) {
  std::string out{value};
  for (char& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

std::string trim_copy(std::string_view value) {
  const std::size_t begin = value.find_first_not_of(kWhitespace);
  if (begin == std::string_view::npos) {
    return {};
  }
  const std::size_t end = value.find_last_not_of(kWhitespace);
  return std::string{value.substr(begin, end - begin + 1)};
}

std::string canonical_join(std::vector<std::pair<std::string, std::string>> fields) {
  std::ranges::sort(fields, {}, &std::pair<std::string, std::string>::first);

  std::string payload;
  for (const auto& [key, value] : fields) {
    payload += key;
    payload.push_back('=');
    append_escaped(payload, value);
    payload.push_back('\n');
  }
  return payload;
}

std::unordered_map<std::string, std::string> parse_canonical_map(std::string_view payload) {
  std::unordered_map<std::string, std::string> parsed;
  while (!payload.empty()) {
    const std::size_t newline = payload.find('\n');
    const std::string_view line = payload.substr(0, newline);
    payload = newline == std::string_view::npos ? std::string_view{} : payload.substr(newline + 1);

    const std::size_t eq = line.find('=');
    if (eq == std::string_view::npos || eq == 0) {
      continue;
    }
    parsed.emplace(std::string{line.substr(0, eq)}, unescape(line.substr(eq + 1)));
  }
  return parsed;
}

std::vector<std::string> split_csv(std::string_view csv) {
  std::vector<std::string> values;
  while (true) {
    const std::size_t comma = csv.find(',');
    std::string item = trim_copy(csv.substr(0, comma));
    if (!item.empty()) {
      values.push_back(std::move(item));
    }
    if (comma == std::string_view::npos) {
      break;
    }
    csv.remove_prefix(comma + 1);
  }
  return values;
}

std::string to_hex(std::string_view bytes) {
  std::string out;
  out.reserve(bytes.size() * 2U);
  for (const unsigned char byte : bytes) {
    out.push_back(kHexDigits[byte >> 4U]);
    out.push_back(kHexDigits[byte & 0x0FU]);
  }
  return out;
}

std::optional<std::string> from_hex(std::string_view hex) {
  if ((hex.size() % 2U) != 0U) {
    return std::nullopt;
  }
  std::string out;
  out.reserve(hex.size() / 2U);
  for (std::size_t i = 0; i < hex.size(); i += 2U) {
    const int hi = hex_value(hex[i]);
    const int lo = hex_value(hex[i + 1U]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    out.push_back(static_cast<char>((hi << 4) | lo));
  }
  return out;
}

}  // namespace tally::util
