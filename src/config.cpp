/**
 * @file config.cpp
 * @brief Configuration loading for qwenchat
 */

#include "qwenchat/config.hpp"
#include "qwenchat/errors.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <fstream>

namespace qwenchat {

namespace {

const char* const CONFIG_KEYS[] = {
    "QWEN_BASE_URL",
    "QWEN_MODEL",
    "QWEN_USER_AGENT",
    "QWENCHAT_HOME",
    "QWEN_SESSION_MAX_AGE_HOURS",
    "QWEN_THINKING_BUDGET",
    "QWEN_CONNECT_TIMEOUT",
    "QWEN_READ_TIMEOUT"
};

std::string trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

long parse_number(const std::string& key, const std::string& value) {
    try {
        size_t consumed = 0;
        long number = std::stol(value, &consumed);
        if (consumed != value.size() || number < 0) {
            throw ConfigurationError("Invalid value for " + key + ": " + value, key);
        }
        return number;
    } catch (const std::invalid_argument&) {
        throw ConfigurationError("Invalid value for " + key + ": " + value, key);
    } catch (const std::out_of_range&) {
        throw ConfigurationError("Value out of range for " + key + ": " + value, key);
    }
}

std::string join_path(const std::string& dir, const char* name) {
#ifdef _WIN32
    return dir + "\\" + name;
#else
    return dir + "/" + name;
#endif
}

} // namespace

std::string Config::cookies_path() const {
    return join_path(data_dir, QWENCHAT_COOKIES_FILENAME);
}

std::string Config::token_path() const {
    return join_path(data_dir, QWENCHAT_TOKEN_FILENAME);
}

std::string Config::login_time_path() const {
    return join_path(data_dir, QWENCHAT_LOGIN_TIME_FILENAME);
}

std::map<std::string, std::string> read_env_file(const std::string& path) {
    std::map<std::string, std::string> values;

    std::ifstream file(path);
    if (!file.is_open()) {
        return values;
    }

    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        // Remove quotes
        if (!value.empty() && (value.front() == '"' || value.front() == '\'')) {
            value = value.substr(1);
        }
        if (!value.empty() && (value.back() == '"' || value.back() == '\'')) {
            value.pop_back();
        }
        if (!key.empty()) {
            values[key] = value;
        }
    }

    return values;
}

Config Config::from_values(const std::map<std::string, std::string>& values) {
    Config config;

    auto get = [&](const char* key) -> std::optional<std::string> {
        auto it = values.find(key);
        if (it == values.end() || it->second.empty()) return std::nullopt;
        return it->second;
    };

    if (auto v = get("QWEN_BASE_URL")) {
        config.base_url = *v;
        while (!config.base_url.empty() && config.base_url.back() == '/') {
            config.base_url.pop_back();
        }
    }
    if (auto v = get("QWEN_MODEL")) config.model = *v;
    if (auto v = get("QWEN_USER_AGENT")) config.user_agent = *v;
    config.data_dir = get_qwenchat_dir(get("QWENCHAT_HOME"));

    if (auto v = get("QWEN_SESSION_MAX_AGE_HOURS")) {
        config.policy.max_age = std::chrono::hours(parse_number("QWEN_SESSION_MAX_AGE_HOURS", *v));
    }
    if (auto v = get("QWEN_THINKING_BUDGET")) {
        config.thinking_budget = static_cast<int>(parse_number("QWEN_THINKING_BUDGET", *v));
    }
    if (auto v = get("QWEN_CONNECT_TIMEOUT")) {
        config.connect_timeout_seconds = parse_number("QWEN_CONNECT_TIMEOUT", *v);
    }
    if (auto v = get("QWEN_READ_TIMEOUT")) {
        config.read_timeout_seconds = parse_number("QWEN_READ_TIMEOUT", *v);
    }

    return config;
}

Config Config::load(const std::optional<std::string>& env_file) {
    std::map<std::string, std::string> values;

    // QWENCHAT_HOME decides where the default .env lives
    const char* env_home = getenv("QWENCHAT_HOME");
    std::string env_path = env_file.value_or(
        join_path(get_qwenchat_dir(env_home ? std::optional<std::string>(env_home) : std::nullopt),
                  QWENCHAT_ENV_FILENAME));

    values = read_env_file(env_path);
    if (!values.empty()) {
        spdlog::debug("Loaded {} settings from {}", values.size(), env_path);
    }

    for (const char* key : CONFIG_KEYS) {
        const char* value = getenv(key);
        if (value) {
            values[key] = value;
        }
    }

    return from_values(values);
}

} // namespace qwenchat
