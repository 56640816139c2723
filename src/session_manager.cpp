/**
 * @file session_manager.cpp
 * @brief Session manager implementation for qwenchat
 */

#include "qwenchat/session_manager.hpp"
#include "qwenchat/errors.hpp"
#include <spdlog/spdlog.h>

namespace qwenchat {

SessionManager::SessionManager(
    std::shared_ptr<CredentialStore> store,
    const std::string& base_url,
    const std::string& user_agent,
    const SessionPolicy& policy,
    Clock clock
) : store_(std::move(store)),
    base_url_(base_url),
    user_agent_(user_agent),
    policy_(policy),
    clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); })),
    stale_(false) {
    reload();
}

void SessionManager::reload() {
    std::optional<Credentials> loaded;
    if (store_) {
        loaded = store_->load();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    credentials_ = std::move(loaded);
    stale_ = false;
}

std::map<std::string, std::string> SessionManager::headers() const {
    std::map<std::string, std::string> result = {
        {"Accept", "application/json"},
        {"Content-Type", "application/json"},
        {"Origin", base_url_},
        {"Referer", base_url_ + "/"},
        {"User-Agent", user_agent_},
        {"X-Request-Id", generate_uuid()},
        {"X-Accel-Buffering", "no"},
        {"source", "web"}
    };

    std::lock_guard<std::mutex> lock(mutex_);
    if (credentials_.has_value() && credentials_->token.has_value()) {
        result["Authorization"] = "Bearer " + *credentials_->token;
    }
    return result;
}

RequestContext SessionManager::request_context() const {
    RequestContext context;
    context.base_url = base_url_;
    context.headers = headers();

    std::lock_guard<std::mutex> lock(mutex_);
    if (credentials_.has_value()) {
        context.cookies = credentials_->cookies;
    }
    return context;
}

bool SessionManager::needs_reauth() const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (stale_) return true;
    if (!credentials_.has_value() || !credentials_->has_cookies()) return true;
    if (!credentials_->issued_at.has_value()) return true;

    auto age = clock_() - *credentials_->issued_at;
    return age > policy_.max_age;
}

void SessionManager::record_successful_login(Credentials credentials) {
    credentials.issued_at = clock_();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        credentials_ = credentials;
        stale_ = false;
    }

    if (store_) {
        store_->save(credentials);
    }
    spdlog::info("Recorded login with {} cookies", credentials.cookies.size());
}

void SessionManager::mark_stale() {
    std::lock_guard<std::mutex> lock(mutex_);
    stale_ = true;
}

bool SessionManager::has_cookies() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return credentials_.has_value() && credentials_->has_cookies();
}

std::optional<Credentials> SessionManager::credentials() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return credentials_;
}

} // namespace qwenchat
