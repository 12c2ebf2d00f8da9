#pragma once

/// @file log.hpp
/// Engine logger. A named spdlog logger shared by every component.

#include <spdlog/spdlog.h>

#include <memory>

namespace evochess::log {

/// The "evochess" logger, created on first use with a stdout colour sink.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

void set_level(spdlog::level::level_enum level);

}  // namespace evochess::log
