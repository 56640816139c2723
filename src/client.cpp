/**
 * @file client.cpp
 * @brief Client implementation for qwenchat
 */

#include "qwenchat/client.hpp"
#include "qwenchat/errors.hpp"
#include "qwenchat/logging.hpp"
#include <spdlog/spdlog.h>

namespace qwenchat {

Client::Client(const ClientOptions& options)
    : config_(options.config.has_value() ? *options.config : Config::load(options.env_file)),
      started_(false) {
    if (options.log_level.has_value()) {
        configure_logging(*options.log_level);
    }

    store_ = std::make_shared<CredentialStore>(
        config_.cookies_path(),
        config_.token_path(),
        config_.login_time_path()
    );

    session_manager_ = std::make_shared<SessionManager>(
        store_,
        config_.base_url,
        config_.user_agent,
        config_.policy,
        options.clock
    );

    if (options.transport) {
        transport_ = options.transport;
    } else {
        TransportOptions transport_opts;
        transport_opts.connect_timeout_seconds = config_.connect_timeout_seconds;
        transport_opts.read_timeout_seconds = config_.read_timeout_seconds;
        transport_opts.request_timeout_seconds = config_.read_timeout_seconds;
        transport_ = std::make_shared<CurlTransport>(transport_opts);
    }
}

Client::~Client() {
    stop();
}

bool Client::started() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return started_;
}

void Client::start(const LoginHandler& login_handler) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (started_) {
        return;
    }

    if (session_manager_->needs_reauth()) {
        if (login_handler) {
            spdlog::warn("Session expired, logging in...");
            std::optional<Credentials> credentials = login_handler();
            if (!credentials.has_value() || !credentials->has_cookies()) {
                throw AuthenticationError("Login failed!");
            }
            session_manager_->record_successful_login(*credentials);
            spdlog::info("Login successful!");
        } else if (!session_manager_->has_cookies()) {
            throw CredentialsMissingError(store_->cookies_path());
        } else {
            spdlog::warn("Stored session is older than {}h; requests may be rejected",
                         std::chrono::duration_cast<std::chrono::hours>(config_.policy.max_age).count());
        }
    } else {
        spdlog::info("Using existing session");
    }

    started_ = true;
}

void Client::stop() {
    std::lock_guard<std::mutex> lock(mutex_);

    // Destroy all sessions
    for (auto& [id, session] : sessions_) {
        session->destroy();
    }
    sessions_.clear();

    started_ = false;
}

std::shared_ptr<ChatSession> Client::create_session(const SessionConfig& config) {
    if (!started()) {
        start();
    }

    std::lock_guard<std::mutex> lock(mutex_);

    std::string session_id = config.session_id.value_or(generate_uuid());
    if (sessions_.count(session_id)) {
        throw SessionError("Session already exists: " + session_id, session_id);
    }

    ReasoningSettings reasoning;
    reasoning.budget = config_.thinking_budget;
    if (config.reasoning.has_value()) {
        reasoning = *config.reasoning;
    }

    auto session = std::make_shared<ChatSession>(
        session_id,
        config.model.value_or(config_.model),
        session_manager_,
        transport_,
        reasoning
    );

    sessions_[session_id] = session;

    return session;
}

std::shared_ptr<ChatSession> Client::get_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        throw SessionNotFoundError(session_id);
    }

    return it->second;
}

std::vector<SessionMetadata> Client::list_sessions() const {
    std::vector<std::shared_ptr<ChatSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, session] : sessions_) {
            sessions.push_back(session);
        }
    }

    std::vector<SessionMetadata> result;
    for (const auto& session : sessions) {
        SessionMetadata meta;
        meta.session_id = session->session_id();
        meta.model = session->model();
        meta.conversation_id = session->conversation_id();
        meta.start_time = format_timestamp(session->start_time());
        meta.modified_time = format_timestamp(session->modified_time());
        result.push_back(meta);
    }

    return result;
}

void Client::delete_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = sessions_.find(session_id);
    if (it != sessions_.end()) {
        it->second->destroy();
        sessions_.erase(it);
    }
}

} // namespace qwenchat
