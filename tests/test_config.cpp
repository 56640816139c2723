/**
 * @file test_config.cpp
 * @brief Configuration tests
 */

#include <gtest/gtest.h>
#include <qwenchat/config.hpp>
#include <qwenchat/errors.hpp>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <random>

using namespace qwenchat;

TEST(Config, Defaults) {
    Config config = Config::from_values({});

    EXPECT_EQ(config.base_url, QWEN_BASE_URL);
    EXPECT_EQ(config.model, QWEN_DEFAULT_MODEL);
    EXPECT_EQ(config.policy.max_age, std::chrono::hours(24));
    EXPECT_EQ(config.thinking_budget, DEFAULT_THINKING_BUDGET);
    EXPECT_FALSE(config.data_dir.empty());
}

TEST(Config, ExplicitValues) {
    Config config = Config::from_values({
        {"QWEN_BASE_URL", "https://chat.example.test//"},
        {"QWEN_MODEL", "qwen-plus"},
        {"QWENCHAT_HOME", "/tmp/qwenchat-home"},
        {"QWEN_SESSION_MAX_AGE_HOURS", "6"},
        {"QWEN_THINKING_BUDGET", "1024"},
        {"QWEN_CONNECT_TIMEOUT", "5"},
        {"QWEN_READ_TIMEOUT", "60"}
    });

    EXPECT_EQ(config.base_url, "https://chat.example.test");
    EXPECT_EQ(config.model, "qwen-plus");
    EXPECT_EQ(config.data_dir, "/tmp/qwenchat-home");
    EXPECT_EQ(config.cookies_path(), "/tmp/qwenchat-home/cookies.json");
    EXPECT_EQ(config.token_path(), "/tmp/qwenchat-home/token.txt");
    EXPECT_EQ(config.policy.max_age, std::chrono::hours(6));
    EXPECT_EQ(config.thinking_budget, 1024);
    EXPECT_EQ(config.connect_timeout_seconds, 5);
    EXPECT_EQ(config.read_timeout_seconds, 60);
}

TEST(Config, EmptyValueKeepsDefault) {
    Config config = Config::from_values({{"QWEN_MODEL", ""}});
    EXPECT_EQ(config.model, QWEN_DEFAULT_MODEL);
}

TEST(Config, InvalidNumberThrows) {
    try {
        Config::from_values({{"QWEN_SESSION_MAX_AGE_HOURS", "soon"}});
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_EQ(e.config_key(), "QWEN_SESSION_MAX_AGE_HOURS");
    }

    EXPECT_THROW(Config::from_values({{"QWEN_READ_TIMEOUT", "12s"}}), ConfigurationError);
    EXPECT_THROW(Config::from_values({{"QWEN_THINKING_BUDGET", "-1"}}), ConfigurationError);
}

TEST(Config, ReadEnvFile) {
    std::random_device rd;
    std::string path = (std::filesystem::temp_directory_path() /
                        ("qwenchat-env-" + std::to_string(rd()))).string();
    {
        std::ofstream out(path);
        out << "# comment\n"
            << "\n"
            << "QWEN_MODEL = \"qwen-turbo\"\n"
            << "QWEN_USER_AGENT='agent/1.0'\n"
            << "not a setting\n"
            << "QWEN_READ_TIMEOUT=45\n";
    }

    auto values = read_env_file(path);
    std::remove(path.c_str());

    EXPECT_EQ(values.size(), 3u);
    EXPECT_EQ(values["QWEN_MODEL"], "qwen-turbo");
    EXPECT_EQ(values["QWEN_USER_AGENT"], "agent/1.0");
    EXPECT_EQ(values["QWEN_READ_TIMEOUT"], "45");
}

TEST(Config, MissingEnvFileIsEmpty) {
    EXPECT_TRUE(read_env_file("/nonexistent/qwenchat/.env").empty());
}
