/**
 * @file test_credentials.cpp
 * @brief Credential store and session manager tests
 */

#include <gtest/gtest.h>
#include <qwenchat/credential_store.hpp>
#include <qwenchat/session_manager.hpp>
#include <qwenchat/errors.hpp>
#include <filesystem>
#include <fstream>
#include <random>

using namespace qwenchat;

namespace fs = std::filesystem;

// =============================================================================
// Test Fixture
// =============================================================================

class CredentialsTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        dir_ = fs::temp_directory_path() / ("qwenchat-test-" + std::to_string(rd()));
        fs::create_directories(dir_);
        store_ = std::make_shared<CredentialStore>(
            (dir_ / "cookies.json").string(),
            (dir_ / "token.txt").string(),
            (dir_ / "last_login").string()
        );
        now_ = std::chrono::system_clock::now();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    void write(const std::string& name, const std::string& content) {
        std::ofstream out(dir_ / name);
        out << content;
    }

    std::shared_ptr<SessionManager> make_manager(std::chrono::hours max_age = std::chrono::hours(24)) {
        SessionPolicy policy;
        policy.max_age = max_age;
        return std::make_shared<SessionManager>(
            store_, "https://chat.example.test", "test-agent", policy,
            [this]() { return now_; });
    }

    fs::path dir_;
    std::shared_ptr<CredentialStore> store_;
    std::chrono::system_clock::time_point now_;
};

// =============================================================================
// Credential store
// =============================================================================

TEST_F(CredentialsTest, LoadMissingIsAbsent) {
    EXPECT_FALSE(store_->load().has_value());
}

TEST_F(CredentialsTest, LoadMalformedCookiesIsAbsent) {
    write("cookies.json", "{not json");
    EXPECT_FALSE(store_->load().has_value());
}

TEST_F(CredentialsTest, SaveLoadRoundTrip) {
    Credentials credentials;
    credentials.cookies = {{"ssxmod_itna", "abc"}, {"cna", "x=y;z"}};
    credentials.token = "jwt-token";
    credentials.issued_at = from_epoch_ms(1700000000123);

    store_->save(credentials);
    std::optional<Credentials> loaded = store_->load();

    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->cookies, credentials.cookies);
    EXPECT_EQ(loaded->token, credentials.token);
    ASSERT_TRUE(loaded->issued_at.has_value());
    EXPECT_EQ(to_epoch_ms(*loaded->issued_at), 1700000000123);
}

TEST_F(CredentialsTest, SaveWithoutTokenRemovesTokenFile) {
    Credentials credentials;
    credentials.cookies = {{"a", "1"}};
    credentials.token = "old";
    store_->save(credentials);

    credentials.token.reset();
    store_->save(credentials);

    std::optional<Credentials> loaded = store_->load();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_FALSE(loaded->token.has_value());
}

TEST_F(CredentialsTest, TokenCookieTakesPrecedence) {
    write("cookies.json", R"({"token": "from-cookie", "other": "1"})");
    write("token.txt", "from-file\n");

    std::optional<Credentials> loaded = store_->load();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->token, std::optional<std::string>("from-cookie"));
}

TEST_F(CredentialsTest, TokenFileFallback) {
    write("cookies.json", R"({"other": "1"})");
    write("token.txt", "  from-file \n");

    std::optional<Credentials> loaded = store_->load();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->token, std::optional<std::string>("from-file"));
    EXPECT_FALSE(loaded->issued_at.has_value());
}

TEST_F(CredentialsTest, TokenMatchingCookieSkipsTokenFile) {
    Credentials credentials;
    credentials.cookies = {{"token", "jwt"}, {"a", "1"}};
    credentials.token = "jwt";
    store_->save(credentials);

    EXPECT_FALSE(fs::exists(dir_ / "token.txt"));
    std::optional<Credentials> loaded = store_->load();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->token, std::optional<std::string>("jwt"));
}

TEST_F(CredentialsTest, TokenCookieWinsOverSavedToken) {
    Credentials credentials;
    credentials.cookies = {{"token", "from-cookie"}};
    credentials.token = "from-login";
    store_->save(credentials);

    EXPECT_TRUE(fs::exists(dir_ / "token.txt"));
    std::optional<Credentials> loaded = store_->load();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->token, std::optional<std::string>("from-cookie"));

    credentials.token.reset();
    store_->save(credentials);
    loaded = store_->load();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->token, std::optional<std::string>("from-cookie"));
}

TEST_F(CredentialsTest, SaveIntoUnwritablePathThrows) {
    write("blocker", "file, not a directory");
    CredentialStore store(
        (dir_ / "blocker" / "cookies.json").string(),
        (dir_ / "blocker" / "token.txt").string(),
        (dir_ / "blocker" / "last_login").string()
    );

    Credentials credentials;
    credentials.cookies = {{"a", "1"}};
    EXPECT_THROW(store.save(credentials), CredentialStoreError);
}

TEST_F(CredentialsTest, ClearRemovesFiles) {
    Credentials credentials;
    credentials.cookies = {{"a", "1"}};
    credentials.token = "t";
    credentials.issued_at = now_;
    store_->save(credentials);

    store_->clear();
    EXPECT_FALSE(store_->load().has_value());
    EXPECT_FALSE(fs::exists(dir_ / "token.txt"));
}

TEST(TokenLookupChain, FirstNonEmptyWins) {
    std::vector<std::string> tried;
    TokenLookupChain chain;
    chain.add("missing", [&]() -> std::optional<std::string> { tried.push_back("missing"); return std::nullopt; })
         .add("empty", [&]() -> std::optional<std::string> { tried.push_back("empty"); return std::string(); })
         .add("local_storage", [&]() -> std::optional<std::string> { tried.push_back("local_storage"); return std::string("tok"); })
         .add("never", [&]() -> std::optional<std::string> { tried.push_back("never"); return std::string("other"); });

    auto found = chain.resolve();
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->first, "local_storage");
    EXPECT_EQ(found->second, "tok");
    EXPECT_EQ(tried, (std::vector<std::string>{"missing", "empty", "local_storage"}));
    EXPECT_EQ(chain.size(), 4u);
}

TEST(TokenLookupChain, EmptyChainResolvesNothing) {
    TokenLookupChain chain;
    EXPECT_FALSE(chain.resolve().has_value());
}

// =============================================================================
// Session manager
// =============================================================================

TEST_F(CredentialsTest, NeedsReauthWithoutCredentials) {
    auto manager = make_manager();
    EXPECT_TRUE(manager->needs_reauth());
    EXPECT_FALSE(manager->has_cookies());
}

TEST_F(CredentialsTest, NeedsReauthWhenStale) {
    Credentials credentials;
    credentials.cookies = {{"a", "1"}};
    credentials.issued_at = now_ - std::chrono::hours(25);
    store_->save(credentials);

    auto manager = make_manager();
    EXPECT_TRUE(manager->has_cookies());
    EXPECT_TRUE(manager->needs_reauth());
}

TEST_F(CredentialsTest, FreshCredentialsDoNotNeedReauth) {
    Credentials credentials;
    credentials.cookies = {{"a", "1"}};
    credentials.issued_at = now_ - std::chrono::hours(23);
    store_->save(credentials);

    auto manager = make_manager();
    EXPECT_FALSE(manager->needs_reauth());

    now_ += std::chrono::hours(2);
    EXPECT_TRUE(manager->needs_reauth());
}

TEST_F(CredentialsTest, CookiesWithoutLoginTimeNeedReauth) {
    write("cookies.json", R"({"a": "1"})");
    auto manager = make_manager();
    EXPECT_TRUE(manager->has_cookies());
    EXPECT_TRUE(manager->needs_reauth());
}

TEST_F(CredentialsTest, RecordSuccessfulLoginPersistsAndStamps) {
    auto manager = make_manager();
    ASSERT_TRUE(manager->needs_reauth());

    Credentials credentials;
    credentials.cookies = {{"session", "s1"}};
    credentials.token = "tok";
    manager->record_successful_login(credentials);

    EXPECT_FALSE(manager->needs_reauth());

    std::optional<Credentials> stored = store_->load();
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->cookies, credentials.cookies);
    EXPECT_EQ(stored->token, std::optional<std::string>("tok"));
    ASSERT_TRUE(stored->issued_at.has_value());
    EXPECT_EQ(to_epoch_ms(*stored->issued_at), to_epoch_ms(now_));
}

TEST_F(CredentialsTest, MarkStaleUntilNextLogin) {
    Credentials credentials;
    credentials.cookies = {{"a", "1"}};
    auto manager = make_manager();
    manager->record_successful_login(credentials);
    ASSERT_FALSE(manager->needs_reauth());

    manager->mark_stale();
    EXPECT_TRUE(manager->needs_reauth());

    manager->record_successful_login(credentials);
    EXPECT_FALSE(manager->needs_reauth());
}

TEST_F(CredentialsTest, HeadersDerivedFromBaseUrl) {
    auto manager = make_manager();
    auto headers = manager->headers();

    EXPECT_EQ(headers["Content-Type"], "application/json");
    EXPECT_EQ(headers["Accept"], "application/json");
    EXPECT_EQ(headers["Origin"], "https://chat.example.test");
    EXPECT_EQ(headers["Referer"], "https://chat.example.test/");
    EXPECT_EQ(headers["User-Agent"], "test-agent");
    EXPECT_EQ(headers["source"], "web");
    EXPECT_FALSE(headers["X-Request-Id"].empty());
    EXPECT_EQ(headers.count("Authorization"), 0u);

    EXPECT_NE(manager->headers()["X-Request-Id"], headers["X-Request-Id"]);
}

TEST_F(CredentialsTest, RequestContextCarriesCookiesAndToken) {
    Credentials credentials;
    credentials.cookies = {{"a", "1"}, {"b", "2"}};
    credentials.token = "tok";
    auto manager = make_manager();
    manager->record_successful_login(credentials);

    RequestContext context = manager->request_context();
    EXPECT_EQ(context.base_url, "https://chat.example.test");
    EXPECT_EQ(context.cookies, credentials.cookies);
    EXPECT_EQ(context.headers["Authorization"], "Bearer tok");
}
