/**
 * @file request_builder.cpp
 * @brief Payload construction for qwenchat
 */

#include "qwenchat/request_builder.hpp"
#include "qwenchat/errors.hpp"

namespace qwenchat {

RequestBuilder::RequestBuilder(const std::string& model)
    : model_(model) {
}

json RequestBuilder::build_create_conversation(int64_t timestamp_ms) const {
    return {
        {"title", "New Chat"},
        {"models", json::array({model_})},
        {"chat_mode", "normal"},
        {"chat_type", "t2t"},
        {"timestamp", timestamp_ms},
        {"project_id", ""}
    };
}

std::string RequestBuilder::compose_prompt(
    const std::string& prompt,
    const std::optional<std::string>& system_instruction
) {
    if (!system_instruction.has_value() || system_instruction->empty()) {
        return prompt;
    }
    return "[System Instructions: " + *system_instruction + "]\n\nUser Request: " + prompt;
}

ChatTurnRequest RequestBuilder::make_turn(
    const ConversationState& conversation,
    const std::string& prompt,
    const std::optional<std::string>& system_instruction,
    const ReasoningSettings& reasoning
) const {
    if (!conversation.id().has_value()) {
        throw SessionError("Cannot build a chat turn without a conversation");
    }

    ChatTurnRequest request;
    request.prompt = prompt;
    request.system_instruction = system_instruction;
    request.reasoning = reasoning;
    request.conversation_id = *conversation.id();
    request.parent_id = conversation.parent_id();
    request.message_id = generate_uuid();
    request.child_id = generate_uuid();
    request.model = model_;
    request.timestamp = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
    return request;
}

json RequestBuilder::build_chat_turn(const ChatTurnRequest& request) const {
    json feature_config = {
        {"thinking_enabled", request.reasoning.enabled},
        {"output_schema", "phase"},
        {"research_mode", "normal"}
    };
    if (request.reasoning.enabled) {
        feature_config["thinking_budget"] = request.reasoning.budget;
    }

    json parent = request.parent_id.has_value() ? json(*request.parent_id) : json(nullptr);
    const std::string& model = request.model.empty() ? model_ : request.model;

    json message = {
        {"fid", request.message_id},
        {"parentId", parent},
        {"childrenIds", json::array({request.child_id})},
        {"role", "user"},
        {"content", compose_prompt(request.prompt, request.system_instruction)},
        {"user_action", "chat"},
        {"files", json::array()},
        {"timestamp", request.timestamp},
        {"models", json::array({model})},
        {"chat_type", "t2t"},
        {"feature_config", feature_config},
        {"extra", {{"meta", {{"subChatType", "t2t"}}}}},
        {"sub_chat_type", "t2t"},
        {"parent_id", parent}
    };

    return {
        {"stream", true},
        {"version", "2.1"},
        {"incremental_output", true},
        {"chat_id", request.conversation_id},
        {"chat_mode", "normal"},
        {"model", model},
        {"parent_id", parent},
        {"messages", json::array({message})},
        {"timestamp", request.timestamp}
    };
}

} // namespace qwenchat
