/**
 * @file client.hpp
 * @brief Main client for qwenchat
 */

#ifndef QWENCHAT_CLIENT_HPP
#define QWENCHAT_CLIENT_HPP

#include "types.hpp"
#include "config.hpp"
#include "credential_store.hpp"
#include "session_manager.hpp"
#include "session.hpp"
#include "transport.hpp"
#include <memory>
#include <map>
#include <mutex>

namespace qwenchat {

/**
 * Client options
 */
struct ClientOptions {
    std::optional<Config> config;
    std::optional<std::string> env_file;
    std::shared_ptr<Transport> transport;
    Clock clock;
    // Unset leaves the process-wide spdlog level alone
    std::optional<LogLevel> log_level;
};

/**
 * Main qwenchat client
 */
class Client {
public:
    /**
     * Create a client
     * @param options Configuration options
     */
    explicit Client(const ClientOptions& options = {});

    ~Client();

    /**
     * Make sure a usable session exists
     * @param login_handler Produces fresh credentials when a login is required
     */
    void start(const LoginHandler& login_handler = nullptr);

    /**
     * Close all sessions
     */
    void stop();

    /**
     * Create a new chat session with its own conversation
     * @param config Session configuration
     * @return Session pointer
     */
    std::shared_ptr<ChatSession> create_session(const SessionConfig& config = {});

    /**
     * Get an existing session
     * @param session_id Session ID
     * @return Session pointer
     */
    std::shared_ptr<ChatSession> get_session(const std::string& session_id);

    /**
     * List all sessions
     * @return Session metadata list
     */
    std::vector<SessionMetadata> list_sessions() const;

    /**
     * Delete a session
     * @param session_id Session ID
     */
    void delete_session(const std::string& session_id);

    bool needs_reauth() const { return session_manager_->needs_reauth(); }
    const Config& config() const { return config_; }
    SessionManager& session_manager() { return *session_manager_; }
    bool started() const;

private:
    Config config_;
    std::shared_ptr<CredentialStore> store_;
    std::shared_ptr<SessionManager> session_manager_;
    std::shared_ptr<Transport> transport_;
    std::map<std::string, std::shared_ptr<ChatSession>> sessions_;
    bool started_;
    mutable std::mutex mutex_;
};

} // namespace qwenchat

#endif // QWENCHAT_CLIENT_HPP
