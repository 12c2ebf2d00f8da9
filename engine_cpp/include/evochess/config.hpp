#pragma once

/// @file config.hpp
/// Engine configuration.

#include <evochess/position.hpp>

#include <spdlog/common.h>

#include <functional>
#include <string>

namespace evochess {

/// Seconds source for wall-clock cooldowns. Tests inject a manual clock.
using Clock = std::function<double()>;

/// Monotonic seconds since an unspecified epoch.
[[nodiscard]] double steady_seconds();

/// Engine construction parameters. Defaults give a standard game with
/// stationary tracking on.
struct EngineConfig {
    std::string starting_fen = std::string(kStartingFen);
    int stationary_threshold = 3;     ///< full rounds before a stationary ability fires
    bool track_stationary = true;     ///< own a StationaryTracker and check after each move
    bool refresh_cached_moves = true; ///< recompute cached destinations after each move
    spdlog::level::level_enum log_level = spdlog::level::warn;
    Clock clock = steady_seconds;
};

}  // namespace evochess
