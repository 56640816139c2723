/**
 * @file session.cpp
 * @brief Chat session implementation for qwenchat
 */

#include "qwenchat/session.hpp"
#include "qwenchat/stream_decoder.hpp"
#include "qwenchat/errors.hpp"
#include <spdlog/spdlog.h>

namespace qwenchat {

ChatSession::ChatSession(
    const std::string& session_id,
    const std::string& model,
    std::shared_ptr<SessionManager> session_manager,
    std::shared_ptr<Transport> transport,
    const ReasoningSettings& reasoning
) : session_id_(session_id),
    session_manager_(std::move(session_manager)),
    transport_(std::move(transport)),
    builder_(model),
    reasoning_(reasoning),
    cancelled_(false),
    closed_(false),
    start_time_(std::chrono::system_clock::now()),
    modified_time_(std::chrono::system_clock::now()) {
}

ChatSession::~ChatSession() {
    destroy();
}

std::chrono::system_clock::time_point ChatSession::modified_time() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return modified_time_;
}

std::optional<std::string> ChatSession::conversation_id() const {
    std::lock_guard<std::mutex> turn_lock(turn_mutex_);
    return conversation_.id();
}

std::optional<std::string> ChatSession::parent_id() const {
    std::lock_guard<std::mutex> turn_lock(turn_mutex_);
    return conversation_.parent_id();
}

void ChatSession::on(EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    event_handlers_.push_back(handler);
}

void ChatSession::emit(EventType event_type, const json& data) {
    SessionEvent event;
    event.event_type = event_type;
    event.data = data;
    event.session_id = session_id_;
    spdlog::trace("[{}] {}", session_id_, event_type_to_string(event_type));

    std::vector<EventHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers = event_handlers_;
    }

    for (const auto& handler : handlers) {
        handler(event);
    }
}

CreateConversationResult ChatSession::create_conversation(const RequestContext& context) {
    spdlog::debug("[{}] Creating chat session...", session_id_);
    json payload = builder_.build_create_conversation(to_epoch_ms(std::chrono::system_clock::now()));
    CreateConversationResult result = transport_->create_conversation(context, payload);
    if (!result.ok() && result.failure.has_value()) {
        spdlog::error("[{}] Failed to create conversation: {} {}",
                      session_id_, result.failure->status_code, result.failure->message);
        if (!result.failure->body_excerpt.empty()) {
            spdlog::warn("[{}] Response: {}", session_id_, result.failure->body_excerpt);
        }
        if (result.failure->status_code == 401 || result.failure->status_code == 403) {
            session_manager_->mark_stale();
        }
    }
    return result;
}

TurnResult ChatSession::send(
    const std::string& prompt,
    const std::optional<std::string>& system_instruction
) {
    std::lock_guard<std::mutex> turn_lock(turn_mutex_);

    ReasoningSettings reasoning;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            throw SessionClosedError(session_id_);
        }
        reasoning = reasoning_;
        modified_time_ = std::chrono::system_clock::now();
    }
    cancelled_ = false;

    try {
        if (!session_manager_->has_cookies()) {
            throw CredentialsMissingError(session_manager_->store()
                ? session_manager_->store()->cookies_path() : "");
        }

        RequestContext context = session_manager_->request_context();

        bool created = false;
        std::string conversation_id = conversation_.ensure_conversation([&]() {
            created = true;
            return create_conversation(context);
        });
        if (created) {
            emit(EventType::ConversationCreated, {{"conversationId", conversation_id}});
        }

        ChatTurnRequest request = builder_.make_turn(conversation_, prompt, system_instruction, reasoning);
        json payload = builder_.build_chat_turn(request);

        StreamObserver observer;
        observer.on_reasoning = [this](const std::string& block) {
            emit(EventType::ReasoningBlock, {{"content", block}});
        };
        observer.on_phase_change = [this](std::optional<Phase> previous, Phase next) {
            if (previous == Phase::Reasoning && next == Phase::Answer) {
                emit(EventType::AnswerStarted, json::object());
            }
        };
        observer.on_parent_advanced = [this](const std::string& parent) {
            emit(EventType::ParentAdvanced, {{"parentId", parent}});
        };

        StreamDecoder decoder(conversation_, observer);

        spdlog::debug("[{}] Sending message (thinking {})", session_id_, reasoning.enabled ? "on" : "off");

        // Fresh context: X-Request-Id is per request
        StreamResult stream = transport_->stream_chat_turn(
            session_manager_->request_context(),
            conversation_id,
            payload,
            [&](const std::string& line) {
                if (cancelled_) {
                    return false;
                }
                decoder.consume_line(line);
                return true;
            },
            [this]() { return cancelled_.load(); }
        );

        if (stream.cancelled) {
            spdlog::info("[{}] Turn cancelled", session_id_);
            throw CancellationError(decoder.answer_text());
        }

        if (stream.failure.has_value()) {
            const TransportFailure& failure = *stream.failure;
            if (failure.status_code == 401 || failure.status_code == 403) {
                session_manager_->mark_stale();
            }
            if (failure.status_code != 0 && failure.status_code != 200) {
                throw APIError(
                    "Request failed with status " + std::to_string(failure.status_code),
                    static_cast<int>(failure.status_code),
                    failure.body_excerpt,
                    QWEN_COMPLETIONS_PATH
                );
            }
            if (failure.status_code == 0) {
                throw ConnectionError(failure.message, QWEN_COMPLETIONS_PATH);
            }
            throw StreamError(failure.message, decoder.answer_text());
        }

        TurnResult result = decoder.finish();
        if (decoder.skipped_lines() > 0) {
            spdlog::debug("[{}] Skipped {} malformed lines", session_id_, decoder.skipped_lines());
        }

        emit(EventType::AssistantMessage, {
            {"content", result.answer},
            {"reasoning", result.reasoning}
        });

        return result;
    } catch (const QwenChatError& e) {
        emit(EventType::SessionError, {{"error", e.what()}, {"code", e.code()}});
        throw;
    }
}

std::string ChatSession::send_message(
    const std::string& prompt,
    const std::optional<std::string>& system_instruction
) {
    try {
        return send(prompt, system_instruction).answer;
    } catch (const StreamError& e) {
        std::string message = std::string("Error: ") + e.what();
        if (!e.partial_content().empty()) {
            message += "\nPartial response: " + e.partial_content();
        }
        return message;
    } catch (const CredentialsMissingError&) {
        return "Error: No cookies found - please login first";
    } catch (const ConversationCreationError&) {
        return "Error: Failed to create session";
    } catch (const APIError& e) {
        return "Error: Request failed with status " + std::to_string(e.status_code());
    } catch (const QwenChatError& e) {
        return std::string("Error: ") + e.what();
    }
}

void ChatSession::new_conversation() {
    std::lock_guard<std::mutex> turn_lock(turn_mutex_);
    conversation_.reset();
    spdlog::info("[{}] Ready for new conversation", session_id_);
    emit(EventType::ConversationReset, json::object());
}

void ChatSession::set_thinking(bool enabled, int budget) {
    std::lock_guard<std::mutex> lock(mutex_);
    reasoning_.enabled = enabled;
    reasoning_.budget = budget;
    spdlog::info("[{}] Thinking mode {} (budget: {})", session_id_, enabled ? "enabled" : "disabled", budget);
}

ReasoningSettings ChatSession::thinking() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reasoning_;
}

void ChatSession::cancel() {
    cancelled_ = true;
}

void ChatSession::destroy() {
    cancelled_ = true;
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    event_handlers_.clear();
}

} // namespace qwenchat
