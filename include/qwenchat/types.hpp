/**
 * @file types.hpp
 * @brief Type definitions for qwenchat
 */

#ifndef QWENCHAT_TYPES_HPP
#define QWENCHAT_TYPES_HPP

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <functional>
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace qwenchat {

using json = nlohmann::json;
using Clock = std::function<std::chrono::system_clock::time_point()>;

// =============================================================================
// Constants
// =============================================================================

constexpr const char* QWEN_BASE_URL = "https://chat.qwen.ai";
constexpr const char* QWEN_DEFAULT_MODEL = "qwen3-max-2025-10-30";
constexpr const char* QWEN_NEW_CHAT_PATH = "/api/v2/chats/new";
constexpr const char* QWEN_COMPLETIONS_PATH = "/api/v2/chat/completions";
constexpr const char* QWEN_DEFAULT_USER_AGENT =
    "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 "
    "(KHTML, like Gecko) Chrome/131.0.0.0 Safari/537.36";
constexpr const char* QWENCHAT_DIR = ".qwenchat";
constexpr const char* QWENCHAT_COOKIES_FILENAME = "cookies.json";
constexpr const char* QWENCHAT_TOKEN_FILENAME = "token.txt";
constexpr const char* QWENCHAT_LOGIN_TIME_FILENAME = "last_login";
constexpr const char* QWENCHAT_ENV_FILENAME = ".env";
constexpr const char* STREAM_DATA_PREFIX = "data:";
constexpr const char* STREAM_DONE_SENTINEL = "[DONE]";
constexpr int DEFAULT_THINKING_BUDGET = 81920;
constexpr int DEFAULT_SESSION_MAX_AGE_HOURS = 24;
constexpr std::size_t CREATE_ERROR_BODY_LIMIT = 200;
constexpr std::size_t STREAM_ERROR_BODY_LIMIT = 300;

// =============================================================================
// Enums
// =============================================================================

enum class LogLevel {
    None,
    Error,
    Warning,
    Info,
    Debug,
    All
};

enum class Phase {
    Reasoning,
    Answer
};

enum class EventType {
    ConversationCreated,
    ConversationReset,
    ParentAdvanced,
    ReasoningBlock,
    AnswerStarted,
    AssistantMessage,
    SessionError
};

// =============================================================================
// Utility Functions
// =============================================================================

std::string phase_to_string(Phase phase);
Phase wire_to_phase(const std::string& wire);
std::string event_type_to_string(EventType type);

// =============================================================================
// Credential Types
// =============================================================================

struct Credentials {
    std::map<std::string, std::string> cookies;
    std::optional<std::string> token;
    std::optional<std::chrono::system_clock::time_point> issued_at;

    bool has_cookies() const { return !cookies.empty(); }
};

struct SessionPolicy {
    std::chrono::seconds max_age = std::chrono::hours(DEFAULT_SESSION_MAX_AGE_HOURS);
};

// =============================================================================
// Request Types
// =============================================================================

struct ReasoningSettings {
    bool enabled = false;
    int budget = DEFAULT_THINKING_BUDGET;
};

struct ChatTurnRequest {
    std::string prompt;
    std::optional<std::string> system_instruction;
    ReasoningSettings reasoning;
    std::string conversation_id;
    std::optional<std::string> parent_id;
    std::string message_id;
    std::string child_id;
    std::string model;
    int64_t timestamp = 0;
};

/**
 * Everything a transport call needs from the session
 */
struct RequestContext {
    std::string base_url;
    std::map<std::string, std::string> headers;
    std::map<std::string, std::string> cookies;
};

// =============================================================================
// Stream Types
// =============================================================================

struct ContentDelta {
    Phase phase = Phase::Answer;
    std::string text;
    std::string status;
};

struct StreamEvent {
    enum class Kind {
        Ignored,
        SessionCreated,
        ContentDelta,
        Unparseable,
        StreamEnd
    };

    Kind kind = Kind::Ignored;
    std::string parent_id;
    std::vector<ContentDelta> deltas;
};

struct TurnResult {
    std::string answer;
    std::string reasoning;
};

// =============================================================================
// Session Types
// =============================================================================

struct SessionConfig {
    std::optional<std::string> session_id;
    std::optional<std::string> model;
    std::optional<ReasoningSettings> reasoning;
};

struct SessionMetadata {
    std::string session_id;
    std::string model;
    std::optional<std::string> conversation_id;
    std::string start_time;
    std::string modified_time;
};

struct SessionEvent {
    EventType event_type;
    json data;
    std::string session_id;
};

// =============================================================================
// Callback Types
// =============================================================================

using EventHandler = std::function<void(const SessionEvent&)>;
using LineHandler = std::function<bool(const std::string&)>;
using CancelCheck = std::function<bool()>;
using LoginHandler = std::function<std::optional<Credentials>()>;

// =============================================================================
// Utility Functions
// =============================================================================

std::string get_home_directory();
std::string get_qwenchat_dir(const std::optional<std::string>& custom_dir = std::nullopt);
std::string generate_uuid();
std::string format_timestamp(std::chrono::system_clock::time_point tp);
int64_t to_epoch_ms(std::chrono::system_clock::time_point tp);
std::chrono::system_clock::time_point from_epoch_ms(int64_t ms);
std::string truncate(const std::string& text, std::size_t limit);

} // namespace qwenchat

#endif // QWENCHAT_TYPES_HPP
