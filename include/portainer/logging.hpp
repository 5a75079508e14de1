/**
 * @file logging.hpp
 * @brief Library logger for the Portainer C++ SDK
 */

#ifndef PORTAINER_LOGGING_HPP
#define PORTAINER_LOGGING_HPP

#include "types.hpp"
#include <memory>
#include <spdlog/spdlog.h>

namespace portainer {

/// Name of the logger registered with spdlog.
constexpr const char* PORTAINER_LOGGER_NAME = "portainer";

/**
 * Get the SDK logger, creating it on first use
 * @return Shared spdlog logger writing to stderr
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * Set the SDK log level
 * @param level SDK log level
 */
void set_log_level(LogLevel level);

/**
 * Map an SDK log level onto spdlog
 */
spdlog::level::level_enum to_spdlog_level(LogLevel level);

} // namespace portainer

#endif // PORTAINER_LOGGING_HPP
