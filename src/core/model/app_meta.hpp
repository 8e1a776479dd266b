#pragma once

#include <string_view>

#ifndef TALLY_APP_VERSION
#define TALLY_APP_VERSION "0.3.0"
#endif

#ifndef TALLY_BUILD_RELEASE
#define TALLY_BUILD_RELEASE "Allocation + Leaderboard core"
#endif

namespace tally {

inline constexpr std::string_view kAppDisplayName = "Tally::Shop Targets";
inline constexpr std::string_view kAppVersion = TALLY_APP_VERSION;
inline constexpr std::string_view kBuildRelease = TALLY_BUILD_RELEASE;

}  // namespace tally
