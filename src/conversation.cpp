/**
 * @file conversation.cpp
 * @brief Conversation state implementation for qwenchat
 */

#include "qwenchat/conversation.hpp"
#include "qwenchat/errors.hpp"
#include <spdlog/spdlog.h>

namespace qwenchat {

std::string ConversationState::ensure_conversation(const CreateFn& create) {
    if (id_.has_value()) {
        return *id_;
    }

    CreateConversationResult result = create();
    if (!result.ok()) {
        std::optional<int> status;
        std::string message = "Failed to create conversation";
        std::string body;
        if (result.failure.has_value()) {
            if (result.failure->status_code != 0) {
                status = static_cast<int>(result.failure->status_code);
                message += ": " + std::to_string(result.failure->status_code);
            }
            if (!result.failure->message.empty()) {
                message += " (" + result.failure->message + ")";
            }
            body = result.failure->body_excerpt;
        }
        throw ConversationCreationError(message, status, body);
    }

    id_ = result.conversation_id;
    spdlog::info("Created conversation: {}...", id_->substr(0, 8));
    return *id_;
}

void ConversationState::reset() noexcept {
    id_.reset();
    parent_id_.reset();
}

void ConversationState::advance_parent(const std::string& parent_id) {
    parent_id_ = parent_id;
}

} // namespace qwenchat
