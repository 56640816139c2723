/**
 * @file types.cpp
 * @brief Type implementations for qwenchat
 */

#include "qwenchat/types.hpp"
#include <random>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <cstdlib>

#ifdef _WIN32
#include <windows.h>
#include <shlobj.h>
#else
#include <pwd.h>
#include <unistd.h>
#endif

namespace qwenchat {

std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::Reasoning: return "think";
        case Phase::Answer: return "answer";
        default: return "answer";
    }
}

Phase wire_to_phase(const std::string& wire) {
    if (wire == "think") return Phase::Reasoning;
    return Phase::Answer;
}

std::string event_type_to_string(EventType type) {
    switch (type) {
        case EventType::ConversationCreated: return "conversation.created";
        case EventType::ConversationReset: return "conversation.reset";
        case EventType::ParentAdvanced: return "conversation.parent_advanced";
        case EventType::ReasoningBlock: return "assistant.reasoning";
        case EventType::AnswerStarted: return "assistant.answer_started";
        case EventType::AssistantMessage: return "assistant.message";
        case EventType::SessionError: return "session.error";
        default: return "unknown";
    }
}

std::string get_home_directory() {
#ifdef _WIN32
    char path[MAX_PATH];
    if (SUCCEEDED(SHGetFolderPathA(NULL, CSIDL_PROFILE, NULL, 0, path))) {
        return std::string(path);
    }
    const char* userprofile = getenv("USERPROFILE");
    if (userprofile) return std::string(userprofile);
    return "";
#else
    const char* home = getenv("HOME");
    if (home) return std::string(home);

    struct passwd* pw = getpwuid(getuid());
    if (pw) return std::string(pw->pw_dir);
    return "";
#endif
}

std::string get_qwenchat_dir(const std::optional<std::string>& custom_dir) {
    if (custom_dir.has_value()) {
        return *custom_dir;
    }

    std::string home = get_home_directory();
    if (home.empty()) return QWENCHAT_DIR;

#ifdef _WIN32
    return home + "\\" + QWENCHAT_DIR;
#else
    return home + "/" + QWENCHAT_DIR;
#endif
}

std::string generate_uuid() {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);
    std::uniform_int_distribution<> dis2(8, 11);

    std::stringstream ss;
    ss << std::hex;

    for (int i = 0; i < 8; i++) ss << dis(gen);
    ss << "-";
    for (int i = 0; i < 4; i++) ss << dis(gen);
    ss << "-4";
    for (int i = 0; i < 3; i++) ss << dis(gen);
    ss << "-";
    ss << dis2(gen);
    for (int i = 0; i < 3; i++) ss << dis(gen);
    ss << "-";
    for (int i = 0; i < 12; i++) ss << dis(gen);

    return ss.str();
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    auto time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_val{};
#ifdef _WIN32
    gmtime_s(&tm_val, &time_t_val);
#else
    gmtime_r(&time_t_val, &tm_val);
#endif

    std::stringstream ss;
    ss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

int64_t to_epoch_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()
    ).count();
}

std::chrono::system_clock::time_point from_epoch_ms(int64_t ms) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::milliseconds(ms)
        )
    );
}

std::string truncate(const std::string& text, std::size_t limit) {
    if (text.size() <= limit) return text;
    return text.substr(0, limit);
}

} // namespace qwenchat
