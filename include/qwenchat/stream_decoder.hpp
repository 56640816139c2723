/**
 * @file stream_decoder.hpp
 * @brief Incremental decoder for the chat completion event stream
 */

#ifndef QWENCHAT_STREAM_DECODER_HPP
#define QWENCHAT_STREAM_DECODER_HPP

#include "types.hpp"
#include "conversation.hpp"

namespace qwenchat {

/**
 * Callbacks fired while a stream is decoded
 */
struct StreamObserver {
    /// Completed reasoning block, once per transition away from reasoning
    std::function<void(const std::string&)> on_reasoning;
    /// Phase change; previous phase is unset on the first delta
    std::function<void(std::optional<Phase>, Phase)> on_phase_change;
    /// Parent pointer advanced by a response.created record
    std::function<void(const std::string&)> on_parent_advanced;
    /// Full answer, once at end of stream
    std::function<void(const std::string&)> on_answer;
};

/**
 * Stream decoder
 *
 * Reasoning is surfaced as a block at every transition away from the
 * reasoning phase; the answer is surfaced once, whole, at the end.
 */
class StreamDecoder {
public:
    enum class State {
        Idle,
        AwaitingEvents,
        Done
    };

    /**
     * Create a decoder
     * @param conversation Conversation whose parent pointer is advanced
     * @param observer Optional callbacks
     */
    explicit StreamDecoder(ConversationState& conversation, StreamObserver observer = {});

    /**
     * Process one line of the stream
     * @param line Raw line without its terminator
     * @return False once the decoder is done
     */
    bool consume_line(const std::string& line);

    /**
     * End the stream and collect the result
     * @return Answer and reasoning text
     */
    TurnResult finish();

    /**
     * Classify and parse one line
     * @param line Raw line
     * @return Parsed event
     */
    static StreamEvent parse_line(const std::string& line);

    State state() const { return state_; }
    bool done() const { return state_ == State::Done; }
    bool answer_finished() const { return answer_finished_; }
    std::optional<Phase> current_phase() const { return current_phase_; }
    const std::string& answer_text() const { return answer_; }
    const std::string& reasoning_text() const { return reasoning_; }
    std::size_t skipped_lines() const { return skipped_lines_; }

private:
    void apply_delta(const ContentDelta& delta);
    void flush_reasoning();

    ConversationState& conversation_;
    StreamObserver observer_;
    State state_;
    std::optional<Phase> current_phase_;
    std::string reasoning_;
    std::string answer_;
    std::size_t reasoning_flushed_;
    bool answer_finished_;
    bool finished_;
    std::size_t skipped_lines_;
};

} // namespace qwenchat

#endif // QWENCHAT_STREAM_DECODER_HPP
