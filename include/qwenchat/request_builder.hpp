/**
 * @file request_builder.hpp
 * @brief Payload construction for the Qwen chat API
 */

#ifndef QWENCHAT_REQUEST_BUILDER_HPP
#define QWENCHAT_REQUEST_BUILDER_HPP

#include "types.hpp"
#include "conversation.hpp"

namespace qwenchat {

/**
 * Builds conversation creation and chat turn payloads
 */
class RequestBuilder {
public:
    /**
     * Create a request builder
     * @param model Model id sent with every request
     */
    explicit RequestBuilder(const std::string& model = QWEN_DEFAULT_MODEL);

    /**
     * Conversation creation payload
     * @param timestamp_ms Creation time in epoch milliseconds
     * @return JSON payload
     */
    json build_create_conversation(int64_t timestamp_ms) const;

    /**
     * Fill a turn request from the conversation with fresh ids and the current time
     * @param conversation Conversation state; must hold an id
     * @param prompt User prompt
     * @param system_instruction Optional system instruction
     * @param reasoning Reasoning settings
     * @return Turn request
     */
    ChatTurnRequest make_turn(
        const ConversationState& conversation,
        const std::string& prompt,
        const std::optional<std::string>& system_instruction,
        const ReasoningSettings& reasoning
    ) const;

    /**
     * Chat turn payload
     * @param request Turn request
     * @return JSON payload
     */
    json build_chat_turn(const ChatTurnRequest& request) const;

    /**
     * Fold a system instruction into the single content field
     * @param prompt User prompt
     * @param system_instruction Optional system instruction
     * @return Combined text
     */
    static std::string compose_prompt(
        const std::string& prompt,
        const std::optional<std::string>& system_instruction
    );

    const std::string& model() const { return model_; }

private:
    std::string model_;
};

} // namespace qwenchat

#endif // QWENCHAT_REQUEST_BUILDER_HPP
