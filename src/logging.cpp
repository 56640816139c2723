/**
 * @file logging.cpp
 * @brief Logging setup for qwenchat
 */

#include "qwenchat/logging.hpp"

namespace qwenchat {

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

void configure_logging(LogLevel level) {
    spdlog::set_level(to_spdlog_level(level));
}

} // namespace qwenchat
