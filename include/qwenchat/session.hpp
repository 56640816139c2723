/**
 * @file session.hpp
 * @brief Chat session for qwenchat
 */

#ifndef QWENCHAT_SESSION_HPP
#define QWENCHAT_SESSION_HPP

#include "types.hpp"
#include "conversation.hpp"
#include "request_builder.hpp"
#include "session_manager.hpp"
#include "transport.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <vector>
#include <chrono>

namespace qwenchat {

/**
 * One conversation with the chat service
 *
 * Turns on a session are serialized. Run independent sessions for parallel
 * conversations; they may share the session manager and the transport.
 */
class ChatSession {
public:
    /**
     * Create a session
     * @param session_id Session identifier
     * @param model Model id
     * @param session_manager Shared credentials and headers
     * @param transport Shared transport
     * @param reasoning Initial reasoning settings
     */
    ChatSession(
        const std::string& session_id,
        const std::string& model,
        std::shared_ptr<SessionManager> session_manager,
        std::shared_ptr<Transport> transport,
        const ReasoningSettings& reasoning = {}
    );

    ~ChatSession();

    // Getters
    const std::string& session_id() const { return session_id_; }
    const std::string& model() const { return builder_.model(); }
    std::chrono::system_clock::time_point start_time() const { return start_time_; }
    std::chrono::system_clock::time_point modified_time() const;
    // Conversation accessors wait for a turn in flight
    std::optional<std::string> conversation_id() const;
    std::optional<std::string> parent_id() const;

    /**
     * Register an event handler
     * @param handler Event handler function
     */
    void on(EventHandler handler);

    /**
     * Send a user turn and wait for the full answer
     * @param prompt User prompt
     * @param system_instruction Optional system instruction
     * @return Answer and reasoning text
     * @throws CredentialsMissingError, ConversationCreationError, APIError,
     *         StreamError, CancellationError, SessionClosedError
     */
    TurnResult send(
        const std::string& prompt,
        const std::optional<std::string>& system_instruction = std::nullopt
    );

    /**
     * Send a user turn for programmatic use
     * @param prompt User prompt
     * @param system_instruction Optional system instruction
     * @return Answer text, or a string starting with "Error: "
     */
    std::string send_message(
        const std::string& prompt,
        const std::optional<std::string>& system_instruction = std::nullopt
    );

    /**
     * Start a fresh conversation on the next turn
     */
    void new_conversation();

    /**
     * Enable or disable reasoning
     * @param enabled Reasoning flag
     * @param budget Reasoning budget, used only when enabled
     */
    void set_thinking(bool enabled, int budget = DEFAULT_THINKING_BUDGET);

    ReasoningSettings thinking() const;

    /**
     * Abort the turn in flight, if any
     */
    void cancel();

    /**
     * Close the session
     */
    void destroy();

private:
    void emit(EventType event_type, const json& data);
    CreateConversationResult create_conversation(const RequestContext& context);

    std::string session_id_;
    std::shared_ptr<SessionManager> session_manager_;
    std::shared_ptr<Transport> transport_;
    RequestBuilder builder_;
    ReasoningSettings reasoning_;
    ConversationState conversation_;

    std::vector<EventHandler> event_handlers_;
    std::atomic<bool> cancelled_;
    bool closed_;
    std::chrono::system_clock::time_point start_time_;
    std::chrono::system_clock::time_point modified_time_;
    mutable std::mutex turn_mutex_;
    mutable std::mutex mutex_;
};

} // namespace qwenchat

#endif // QWENCHAT_SESSION_HPP
