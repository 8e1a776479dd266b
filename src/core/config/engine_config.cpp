#include "core/config/engine_config.hpp"

#include <charconv>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "core/util/canonical.hpp"

namespace tally {
namespace {

Result invalid_setting(std::string_view key, std::string_view value) {
  return Result::failure(ErrorKind::Validation,
                         "Invalid value '" + std::string{value} + "' for setting " + std::string{key} + ".",
                         std::string{key});
}

}  // namespace

Result apply_engine_setting(std::string_view key, std::string_view value, EngineConfig& out) {
  if (key == "data_dir") {
    out.data_dir = std::string{value};
  } else if (key == "default_rules_version") {
    if (value.empty()) {
      return invalid_setting(key, value);
    }
    out.default_rules_version = std::string{value};
  } else if (key == "trend_epsilon" || key == "percentage_tolerance") {
    const auto parsed = Decimal::parse(value);
    if (!parsed.has_value() || parsed->is_negative()) {
      return invalid_setting(key, value);
    }
    (key == "trend_epsilon" ? out.trend_epsilon : out.percentage_tolerance) = *parsed;
  } else if (key == "block_transition_when_dirty") {
    const std::string lowered = util::lowercase_copy(value);
    if (lowered == "true" || lowered == "1" || lowered == "yes") {
      out.block_transition_when_dirty = true;
    } else if (lowered == "false" || lowered == "0" || lowered == "no") {
      out.block_transition_when_dirty = false;
    } else {
      return invalid_setting(key, value);
    }
  } else if (key == "write_lock_timeout_ms") {
    std::uint32_t parsed = 0;
    const auto result = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (result.ec != std::errc() || result.ptr != value.data() + value.size()) {
      return invalid_setting(key, value);
    }
    out.write_lock_timeout_ms = parsed;
  } else if (key == "log_level") {
    out.log_level = std::string{value};
  } else {
    spdlog::debug("ignoring unknown setting {}", key);
  }
  return Result::success();
}

Result load_engine_config(std::string_view path, EngineConfig& out) {
  std::ifstream in{std::string{path}};
  if (!in) {
    return Result::failure(ErrorKind::NotFound, "Config file not found: " + std::string{path}, "config");
  }

  std::ostringstream filtered;
  std::string line;
  while (std::getline(in, line)) {
    const std::string trimmed = util::trim_copy(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    filtered << trimmed << '\n';
  }

  EngineConfig loaded = out;
  for (const auto& [key, value] : util::parse_canonical_map(filtered.str())) {
    const Result applied = apply_engine_setting(util::trim_copy(key), util::trim_copy(value), loaded);
    if (!applied.ok) {
      return applied;
    }
  }

  out = std::move(loaded);
  return Result::success("Config loaded from " + std::string{path});
}

}  // namespace tally
