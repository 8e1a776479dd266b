#pragma once

#include <string_view>

#include "core/model/types.hpp"

namespace tally {

// Reads a key=value file (one per line, '#' comments) over the defaults already in `out`.
// Unknown keys are ignored.
Result load_engine_config(std::string_view path, EngineConfig& out);

Result apply_engine_setting(std::string_view key, std::string_view value, EngineConfig& out);

}  // namespace tally
