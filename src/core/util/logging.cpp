#include "core/util/logging.hpp"

#include <string>

#include <spdlog/spdlog.h>

namespace tally::util {

bool configure_logging(std::string_view level) {
  const std::string name{level};
  const spdlog::level::level_enum parsed = spdlog::level::from_str(name);
  if (parsed == spdlog::level::off && name != "off") {
    return false;
  }
  spdlog::set_level(parsed);
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  return true;
}

}  // namespace tally::util
