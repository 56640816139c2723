/**
 * @file session_manager.hpp
 * @brief Live credentials and reauthentication policy for qwenchat
 */

#ifndef QWENCHAT_SESSION_MANAGER_HPP
#define QWENCHAT_SESSION_MANAGER_HPP

#include "types.hpp"
#include "credential_store.hpp"
#include <memory>
#include <mutex>

namespace qwenchat {

/**
 * Session manager for the Qwen web session
 */
class SessionManager {
public:
    /**
     * Create a session manager and load stored credentials
     * @param store Credential store
     * @param base_url Service base URL used for Origin and Referer
     * @param user_agent User-Agent header value
     * @param policy Reauthentication policy
     * @param clock Time source
     */
    SessionManager(
        std::shared_ptr<CredentialStore> store,
        const std::string& base_url,
        const std::string& user_agent = QWEN_DEFAULT_USER_AGENT,
        const SessionPolicy& policy = {},
        Clock clock = nullptr
    );

    /**
     * Build request headers; X-Request-Id is fresh on every call
     * @return Header map
     */
    std::map<std::string, std::string> headers() const;

    /**
     * Headers, cookies and base URL for one transport call
     * @return Request context
     */
    RequestContext request_context() const;

    /**
     * Check whether a new login is required
     * @return True when credentials are absent, stale or marked stale
     */
    bool needs_reauth() const;

    /**
     * Persist freshly acquired credentials and stamp them with the current time
     * @param credentials Credentials from the login collaborator
     */
    void record_successful_login(Credentials credentials);

    /**
     * Force needs_reauth() until the next successful login
     */
    void mark_stale();

    /**
     * Re-read credentials from the store
     */
    void reload();

    bool has_cookies() const;
    std::optional<Credentials> credentials() const;
    const std::string& base_url() const { return base_url_; }
    const SessionPolicy& policy() const { return policy_; }
    std::shared_ptr<CredentialStore> store() const { return store_; }

private:
    std::shared_ptr<CredentialStore> store_;
    std::string base_url_;
    std::string user_agent_;
    SessionPolicy policy_;
    Clock clock_;
    std::optional<Credentials> credentials_;
    bool stale_;
    mutable std::mutex mutex_;
};

} // namespace qwenchat

#endif // QWENCHAT_SESSION_MANAGER_HPP
