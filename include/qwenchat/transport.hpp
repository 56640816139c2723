/**
 * @file transport.hpp
 * @brief HTTP transport for the Qwen chat API
 */

#ifndef QWENCHAT_TRANSPORT_HPP
#define QWENCHAT_TRANSPORT_HPP

#include "types.hpp"
#include <array>
#include <exception>
#include <memory>
#include <mutex>

namespace qwenchat {

/**
 * Ordinary HTTP or network failure, reported rather than thrown
 */
struct TransportFailure {
    long status_code = 0;
    std::string message;
    std::string body_excerpt;
};

struct CreateConversationResult {
    std::optional<std::string> conversation_id;
    std::optional<TransportFailure> failure;

    bool ok() const { return conversation_id.has_value(); }
};

struct StreamResult {
    long status_code = 0;
    bool cancelled = false;
    std::optional<TransportFailure> failure;

    bool ok() const { return !failure.has_value() && !cancelled; }
};

/**
 * Interpret a conversation creation response
 * @param status_code HTTP status
 * @param body Response body
 * @return Conversation id, or a failure with a truncated body
 */
CreateConversationResult interpret_create_conversation_response(long status_code, const std::string& body);

/**
 * Splits a streamed response body into lines for a LineHandler
 *
 * Set the HTTP status before feeding. Only a 200 body is split; any other
 * body is kept as an excerpt of at most STREAM_ERROR_BODY_LIMIT bytes.
 * An exception thrown by the handler stops delivery and is held until
 * rethrow_if_failed().
 */
class LineSplitter {
public:
    explicit LineSplitter(LineHandler on_line, CancelCheck is_cancelled = nullptr);

    void set_status(long status_code) { status_code_ = status_code; }
    long status_code() const { return status_code_; }

    /**
     * Feed received bytes and deliver every complete line
     * @param data Received bytes
     * @param size Byte count
     * @return False when delivery must stop
     */
    bool feed(const char* data, std::size_t size);

    /**
     * Deliver a trailing unterminated line
     * @return False when delivery stopped
     */
    bool finish();

    /**
     * Poll the cancellation check
     * @return True when the transfer must be aborted
     */
    bool should_abort();

    bool cancelled() const { return cancelled_; }
    bool failed() const { return static_cast<bool>(error_); }
    const std::string& error_body() const { return error_body_; }

    /**
     * Rethrow the exception that stopped delivery, if any
     */
    void rethrow_if_failed() const;

private:
    bool deliver(std::string line);

    LineHandler on_line_;
    CancelCheck is_cancelled_;
    std::string buffer_;
    std::string error_body_;
    long status_code_;
    bool cancelled_;
    std::exception_ptr error_;
};

/**
 * Transport interface
 */
class Transport {
public:
    virtual ~Transport() = default;

    /**
     * Create a conversation
     * @param context Headers, cookies and base URL
     * @param payload Creation payload
     * @return Conversation id or failure
     */
    virtual CreateConversationResult create_conversation(
        const RequestContext& context,
        const json& payload
    ) = 0;

    /**
     * Send a chat turn and deliver the response line by line as it arrives
     * @param context Headers, cookies and base URL
     * @param conversation_id Conversation id for the query string
     * @param payload Chat turn payload
     * @param on_line Called per line of a 200 response; return false to cancel
     * @param is_cancelled Polled while waiting for data; true aborts the request
     * @return Stream outcome
     */
    virtual StreamResult stream_chat_turn(
        const RequestContext& context,
        const std::string& conversation_id,
        const json& payload,
        const LineHandler& on_line,
        const CancelCheck& is_cancelled
    ) = 0;
};

/**
 * Transport options
 */
struct TransportOptions {
    long connect_timeout_seconds = 30;
    long read_timeout_seconds = 120;
    long request_timeout_seconds = 120;
};

/**
 * libcurl transport sharing its connection cache across requests
 */
class CurlTransport : public Transport {
public:
    explicit CurlTransport(const TransportOptions& options = {});
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    CreateConversationResult create_conversation(
        const RequestContext& context,
        const json& payload
    ) override;

    StreamResult stream_chat_turn(
        const RequestContext& context,
        const std::string& conversation_id,
        const json& payload,
        const LineHandler& on_line,
        const CancelCheck& is_cancelled
    ) override;

private:
    TransportOptions options_;
    void* share_;
    std::array<std::mutex, 8> share_locks_;
};

} // namespace qwenchat

#endif // QWENCHAT_TRANSPORT_HPP
