/**
 * @file logging.cpp
 * @brief Library logger implementation for the Portainer C++ SDK
 */

#include "portainer/logging.hpp"
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace portainer {

std::shared_ptr<spdlog::logger> logger() {
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> instance;

    std::call_once(once, []() {
        instance = spdlog::get(PORTAINER_LOGGER_NAME);
        if (!instance) {
            instance = spdlog::stderr_color_mt(PORTAINER_LOGGER_NAME);
            instance->set_level(to_spdlog_level(LogLevel::Warning));
        }
    });

    return instance;
}

spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::None: return spdlog::level::off;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Warning: return spdlog::level::warn;
        case LogLevel::Info: return spdlog::level::info;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::All: return spdlog::level::trace;
        default: return spdlog::level::warn;
    }
}

void set_log_level(LogLevel level) {
    logger()->set_level(to_spdlog_level(level));
}

} // namespace portainer
