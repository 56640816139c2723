/**
 * @file stream_decoder.cpp
 * @brief Stream decoder implementation for qwenchat
 */

#include "qwenchat/stream_decoder.hpp"
#include <spdlog/spdlog.h>
#include <cstring>

namespace qwenchat {

namespace {

std::string trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

std::string string_field(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

} // namespace

StreamDecoder::StreamDecoder(ConversationState& conversation, StreamObserver observer)
    : conversation_(conversation),
      observer_(std::move(observer)),
      state_(State::Idle),
      reasoning_flushed_(0),
      answer_finished_(false),
      finished_(false),
      skipped_lines_(0) {
}

StreamEvent StreamDecoder::parse_line(const std::string& line) {
    StreamEvent event;

    std::string trimmed = trim(line);
    if (trimmed.empty() || trimmed.rfind(STREAM_DATA_PREFIX, 0) != 0) {
        return event;
    }

    std::string payload = trim(trimmed.substr(std::strlen(STREAM_DATA_PREFIX)));
    if (payload.empty()) {
        return event;
    }
    if (payload == STREAM_DONE_SENTINEL) {
        event.kind = StreamEvent::Kind::StreamEnd;
        return event;
    }

    json data;
    try {
        data = json::parse(payload);
    } catch (const json::parse_error&) {
        event.kind = StreamEvent::Kind::Unparseable;
        return event;
    }

    if (!data.is_object()) {
        event.kind = StreamEvent::Kind::Unparseable;
        return event;
    }

    // Handle response.created event - response_id threads the next turn
    auto created = data.find("response.created");
    if (created != data.end()) {
        if (created->is_object()) {
            std::string response_id = string_field(*created, "response_id");
            if (!response_id.empty()) {
                event.kind = StreamEvent::Kind::SessionCreated;
                event.parent_id = response_id;
            }
        }
        return event;
    }

    auto choices = data.find("choices");
    if (choices == data.end() || !choices->is_array()) {
        return event;
    }

    event.kind = StreamEvent::Kind::ContentDelta;
    for (const auto& choice : *choices) {
        if (!choice.is_object()) continue;

        auto delta_it = choice.find("delta");
        if (delta_it == choice.end() || !delta_it->is_object()) {
            // No delta: an empty answer-phase delta
            event.deltas.push_back(ContentDelta{});
            continue;
        }

        ContentDelta delta;
        std::string phase = string_field(*delta_it, "phase");
        delta.phase = phase.empty() ? Phase::Answer : wire_to_phase(phase);
        delta.text = string_field(*delta_it, "content");
        delta.status = string_field(*delta_it, "status");
        event.deltas.push_back(std::move(delta));
    }

    return event;
}

bool StreamDecoder::consume_line(const std::string& line) {
    if (state_ == State::Done) {
        return false;
    }
    state_ = State::AwaitingEvents;

    StreamEvent event = parse_line(line);
    switch (event.kind) {
        case StreamEvent::Kind::Ignored:
            break;

        case StreamEvent::Kind::Unparseable:
            skipped_lines_++;
            spdlog::debug("Skipping unparseable stream line: {}", truncate(line, 120));
            break;

        case StreamEvent::Kind::StreamEnd:
            state_ = State::Done;
            return false;

        case StreamEvent::Kind::SessionCreated:
            conversation_.advance_parent(event.parent_id);
            if (observer_.on_parent_advanced) {
                observer_.on_parent_advanced(event.parent_id);
            }
            break;

        case StreamEvent::Kind::ContentDelta:
            if (answer_finished_) {
                spdlog::debug("Ignoring content after the answer finished");
                break;
            }
            for (const auto& delta : event.deltas) {
                apply_delta(delta);
                if (answer_finished_) break;
            }
            break;
    }

    return true;
}

void StreamDecoder::apply_delta(const ContentDelta& delta) {
    if (!current_phase_.has_value() || *current_phase_ != delta.phase) {
        std::optional<Phase> previous = current_phase_;
        if (previous == Phase::Reasoning) {
            flush_reasoning();
        }
        current_phase_ = delta.phase;
        spdlog::debug("Stream phase: {}", phase_to_string(delta.phase));
        if (observer_.on_phase_change) {
            observer_.on_phase_change(previous, delta.phase);
        }
    }

    if (!delta.text.empty()) {
        if (delta.phase == Phase::Reasoning) {
            reasoning_ += delta.text;
        } else {
            answer_ += delta.text;
        }
    }

    if (delta.status == "finished" && delta.phase == Phase::Answer) {
        answer_finished_ = true;
    }
}

void StreamDecoder::flush_reasoning() {
    if (reasoning_flushed_ >= reasoning_.size()) {
        return;
    }
    std::string block = reasoning_.substr(reasoning_flushed_);
    reasoning_flushed_ = reasoning_.size();
    if (observer_.on_reasoning) {
        observer_.on_reasoning(block);
    }
}

TurnResult StreamDecoder::finish() {
    state_ = State::Done;

    if (!finished_) {
        finished_ = true;
        flush_reasoning();
        if (!answer_.empty() && observer_.on_answer) {
            observer_.on_answer(answer_);
        }
    }

    TurnResult result;
    result.answer = answer_;
    result.reasoning = reasoning_;
    return result;
}

} // namespace qwenchat
