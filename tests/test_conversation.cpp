/**
 * @file test_conversation.cpp
 * @brief Conversation state tests
 */

#include <gtest/gtest.h>
#include <qwenchat/conversation.hpp>
#include <qwenchat/errors.hpp>

using namespace qwenchat;

namespace {

ConversationState::CreateFn counting_create(int& calls, const std::string& id) {
    return [&calls, id]() {
        calls++;
        CreateConversationResult result;
        result.conversation_id = id;
        return result;
    };
}

} // namespace

TEST(ConversationState, StartsUnset) {
    ConversationState conversation;
    EXPECT_FALSE(conversation.has_conversation());
    EXPECT_FALSE(conversation.id().has_value());
    EXPECT_FALSE(conversation.parent_id().has_value());
}

TEST(ConversationState, CreatesOnce) {
    ConversationState conversation;
    int calls = 0;

    EXPECT_EQ(conversation.ensure_conversation(counting_create(calls, "chat-a")), "chat-a");
    EXPECT_EQ(conversation.ensure_conversation(counting_create(calls, "chat-b")), "chat-a");
    EXPECT_EQ(calls, 1);
}

TEST(ConversationState, ResetForcesNewCreation) {
    ConversationState conversation;
    int calls = 0;

    conversation.ensure_conversation(counting_create(calls, "chat-a"));
    conversation.advance_parent("resp-1");
    conversation.reset();

    EXPECT_FALSE(conversation.id().has_value());
    EXPECT_FALSE(conversation.parent_id().has_value());

    EXPECT_EQ(conversation.ensure_conversation(counting_create(calls, "chat-b")), "chat-b");
    EXPECT_EQ(calls, 2);
    EXPECT_FALSE(conversation.parent_id().has_value());
}

TEST(ConversationState, FailureLeavesStateUnset) {
    ConversationState conversation;
    int calls = 0;

    auto failing = [&calls]() {
        calls++;
        return interpret_create_conversation_response(200, R"({"success": false})");
    };

    try {
        conversation.ensure_conversation(failing);
        FAIL() << "expected ConversationCreationError";
    } catch (const ConversationCreationError& e) {
        EXPECT_EQ(e.status_code(), std::optional<int>(200));
        EXPECT_EQ(e.response_body(), R"({"success": false})");
    }
    EXPECT_FALSE(conversation.has_conversation());

    // A later call retries
    EXPECT_THROW(conversation.ensure_conversation(failing), ConversationCreationError);
    EXPECT_EQ(calls, 2);

    EXPECT_EQ(conversation.ensure_conversation(counting_create(calls, "chat-ok")), "chat-ok");
}

TEST(ConversationState, NetworkFailureHasNoStatus) {
    ConversationState conversation;

    auto failing = []() {
        CreateConversationResult result;
        result.failure = TransportFailure{0, "CURL error: Couldn't connect to server", ""};
        return result;
    };

    try {
        conversation.ensure_conversation(failing);
        FAIL() << "expected ConversationCreationError";
    } catch (const ConversationCreationError& e) {
        EXPECT_FALSE(e.status_code().has_value());
        EXPECT_NE(std::string(e.what()).find("Couldn't connect"), std::string::npos);
    }
}

TEST(ConversationState, AdvanceParentOverwrites) {
    ConversationState conversation;
    conversation.advance_parent("one");
    conversation.advance_parent("two");
    EXPECT_EQ(conversation.parent_id(), std::optional<std::string>("two"));
}
