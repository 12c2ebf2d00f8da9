/// @file log.cpp
/// Engine logger setup.

#include <evochess/log.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace evochess::log {

namespace {
constexpr const char* kLoggerName = "evochess";
}

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        if (auto existing = spdlog::get(kLoggerName)) return existing;
        auto created = spdlog::stdout_color_mt(kLoggerName);
        created->set_level(spdlog::level::warn);
        return created;
    }();
    return instance;
}

void set_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

}  // namespace evochess::log
