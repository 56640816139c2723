/**
 * @file conversation.hpp
 * @brief Conversation threading state for qwenchat
 */

#ifndef QWENCHAT_CONVERSATION_HPP
#define QWENCHAT_CONVERSATION_HPP

#include "types.hpp"
#include "transport.hpp"

namespace qwenchat {

/**
 * Conversation id and parent turn pointer of one chat session
 *
 * Not synchronized; callers serialize turns.
 */
class ConversationState {
public:
    using CreateFn = std::function<CreateConversationResult()>;

    /**
     * Return the conversation id, creating the conversation if unset
     * @param create Creation call, invoked only when no id is set
     * @return Conversation id
     * @throws ConversationCreationError when creation fails; state stays unset
     */
    std::string ensure_conversation(const CreateFn& create);

    /**
     * Forget the conversation and the parent pointer
     */
    void reset() noexcept;

    /**
     * Thread the next turn onto a server-acknowledged turn
     * @param parent_id New parent turn id
     */
    void advance_parent(const std::string& parent_id);

    const std::optional<std::string>& id() const { return id_; }
    const std::optional<std::string>& parent_id() const { return parent_id_; }
    bool has_conversation() const { return id_.has_value(); }

private:
    std::optional<std::string> id_;
    std::optional<std::string> parent_id_;
};

} // namespace qwenchat

#endif // QWENCHAT_CONVERSATION_HPP
