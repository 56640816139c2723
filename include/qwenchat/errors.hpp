/**
 * @file errors.hpp
 * @brief Exception types for qwenchat
 */

#ifndef QWENCHAT_ERRORS_HPP
#define QWENCHAT_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <optional>

namespace qwenchat {

/**
 * Base exception class for qwenchat errors
 */
class QwenChatError : public std::runtime_error {
public:
    explicit QwenChatError(const std::string& message, const std::string& code = "")
        : std::runtime_error(message), code_(code) {}

    const std::string& code() const { return code_; }

protected:
    std::string code_;
};

/**
 * Authentication-related errors
 */
class AuthenticationError : public QwenChatError {
public:
    explicit AuthenticationError(const std::string& message)
        : QwenChatError(message, "AUTHENTICATION_ERROR") {}
};

/**
 * No cookies available for a chat operation
 */
class CredentialsMissingError : public AuthenticationError {
public:
    explicit CredentialsMissingError(const std::string& credential_path = "")
        : AuthenticationError(credential_path.empty()
              ? "No cookies found - please login first"
              : "No cookies found at " + credential_path + " - please login first"),
          credential_path_(credential_path) {}

    const std::string& credential_path() const { return credential_path_; }

private:
    std::string credential_path_;
};

/**
 * Persisting credentials failed
 */
class CredentialStoreError : public AuthenticationError {
public:
    CredentialStoreError(const std::string& message, const std::string& path)
        : AuthenticationError(message + ": " + path), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

/**
 * Conversation could not be created; state stays unset so a later call retries
 */
class ConversationCreationError : public QwenChatError {
public:
    ConversationCreationError(
        const std::string& message,
        std::optional<int> status_code = std::nullopt,
        const std::string& response_body = ""
    ) : QwenChatError(message, "CONVERSATION_CREATION_ERROR"),
        status_code_(status_code),
        response_body_(response_body) {}

    std::optional<int> status_code() const { return status_code_; }
    const std::string& response_body() const { return response_body_; }

private:
    std::optional<int> status_code_;
    std::string response_body_;
};

/**
 * Connection errors
 */
class ConnectionError : public QwenChatError {
public:
    explicit ConnectionError(const std::string& message, const std::string& endpoint = "")
        : QwenChatError(message, "CONNECTION_ERROR"), endpoint_(endpoint) {}

    const std::string& endpoint() const { return endpoint_; }

private:
    std::string endpoint_;
};

/**
 * API errors
 */
class APIError : public QwenChatError {
public:
    APIError(
        const std::string& message,
        int status_code,
        const std::string& response_body = "",
        const std::string& endpoint = ""
    ) : QwenChatError(message, "API_ERROR"),
        status_code_(status_code),
        response_body_(response_body),
        endpoint_(endpoint) {}

    int status_code() const { return status_code_; }
    const std::string& response_body() const { return response_body_; }
    const std::string& endpoint() const { return endpoint_; }

protected:
    int status_code_;
    std::string response_body_;
    std::string endpoint_;
};

/**
 * Session errors
 */
class SessionError : public QwenChatError {
public:
    SessionError(const std::string& message, const std::string& session_id = "")
        : QwenChatError(message, "SESSION_ERROR"), session_id_(session_id) {}

    const std::string& session_id() const { return session_id_; }

protected:
    std::string session_id_;
};

/**
 * Session not found
 */
class SessionNotFoundError : public SessionError {
public:
    explicit SessionNotFoundError(const std::string& session_id)
        : SessionError("Session not found: " + session_id, session_id) {}
};

/**
 * Session is closed
 */
class SessionClosedError : public SessionError {
public:
    explicit SessionClosedError(const std::string& session_id = "")
        : SessionError("Session is closed", session_id) {}
};

/**
 * Configuration errors
 */
class ConfigurationError : public QwenChatError {
public:
    ConfigurationError(const std::string& message, const std::string& config_key = "")
        : QwenChatError(message, "CONFIGURATION_ERROR"), config_key_(config_key) {}

    const std::string& config_key() const { return config_key_; }

private:
    std::string config_key_;
};

/**
 * Network failure while a response was streaming
 */
class StreamError : public QwenChatError {
public:
    StreamError(const std::string& message, const std::string& partial_content = "")
        : QwenChatError(message, "STREAM_ERROR"), partial_content_(partial_content) {}

    const std::string& partial_content() const { return partial_content_; }

private:
    std::string partial_content_;
};

/**
 * Cancellation
 */
class CancellationError : public QwenChatError {
public:
    explicit CancellationError(const std::string& partial_content = "")
        : QwenChatError("Operation cancelled", "CANCELLATION_ERROR"),
          partial_content_(partial_content) {}

    const std::string& partial_content() const { return partial_content_; }

private:
    std::string partial_content_;
};

} // namespace qwenchat

#endif // QWENCHAT_ERRORS_HPP
