/**
 * @file logging.hpp
 * @brief Logging setup for qwenchat
 */

#ifndef QWENCHAT_LOGGING_HPP
#define QWENCHAT_LOGGING_HPP

#include "types.hpp"
#include <spdlog/spdlog.h>

namespace qwenchat {

/**
 * Map a client log level onto spdlog
 * @param level Client log level
 * @return spdlog level
 */
spdlog::level::level_enum to_spdlog_level(LogLevel level);

/**
 * Apply the log level to the default spdlog logger
 * @param level Client log level
 */
void configure_logging(LogLevel level);

} // namespace qwenchat

#endif // QWENCHAT_LOGGING_HPP
