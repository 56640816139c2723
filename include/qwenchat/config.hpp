/**
 * @file config.hpp
 * @brief Runtime configuration for qwenchat
 */

#ifndef QWENCHAT_CONFIG_HPP
#define QWENCHAT_CONFIG_HPP

#include "types.hpp"
#include <map>

namespace qwenchat {

/**
 * Client configuration
 *
 * Resolved from built-in defaults, then a .env file, then the process
 * environment (highest precedence).
 */
struct Config {
    std::string base_url = QWEN_BASE_URL;
    std::string model = QWEN_DEFAULT_MODEL;
    std::string user_agent = QWEN_DEFAULT_USER_AGENT;
    std::string data_dir;
    SessionPolicy policy;
    int thinking_budget = DEFAULT_THINKING_BUDGET;
    long connect_timeout_seconds = 30;
    long read_timeout_seconds = 120;

    std::string cookies_path() const;
    std::string token_path() const;
    std::string login_time_path() const;

    /**
     * Load configuration
     * @param env_file Path to a .env file; defaults to <data_dir>/.env
     * @return Resolved configuration
     */
    static Config load(const std::optional<std::string>& env_file = std::nullopt);

    /**
     * Build configuration from explicit key/value settings over defaults
     * @param values Settings keyed by environment variable name
     * @return Resolved configuration
     */
    static Config from_values(const std::map<std::string, std::string>& values);
};

/**
 * Parse KEY=VALUE lines of a .env file
 * @param path File path
 * @return Parsed values; empty if the file cannot be read
 */
std::map<std::string, std::string> read_env_file(const std::string& path);

} // namespace qwenchat

#endif // QWENCHAT_CONFIG_HPP
