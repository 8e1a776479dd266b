#pragma once

#include <string_view>

namespace tally::util {

// Sets the global spdlog level from a name ("trace".."off"). Returns false for unknown names.
bool configure_logging(std::string_view level);

}  // namespace tally::util
