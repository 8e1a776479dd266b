#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace tally::util {

bool ensure_sodium();

std::string sha256_hex(std::string_view payload);

// prefix + "-" + first `length` hex chars of sha256(payload)
std::string content_id(std::string_view prefix, std::string_view payload, std::size_t length = 24);

}  // namespace tally::util
