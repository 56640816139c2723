/**
 * @file test_transport.cpp
 * @brief Transport response interpretation tests
 */

#include <gtest/gtest.h>
#include <qwenchat/transport.hpp>
#include <stdexcept>

using namespace qwenchat;

namespace {

struct Collector {
    std::vector<std::string> lines;
    std::size_t stop_after = 0;

    LineHandler handler() {
        return [this](const std::string& line) {
            lines.push_back(line);
            return stop_after == 0 || lines.size() < stop_after;
        };
    }
};

bool feed(LineSplitter& splitter, const std::string& bytes) {
    return splitter.feed(bytes.data(), bytes.size());
}

} // namespace

// =============================================================================
// Line splitting
// =============================================================================

TEST(LineSplitter, LineSplitAcrossWrites) {
    Collector collector;
    LineSplitter splitter(collector.handler());
    splitter.set_status(200);

    EXPECT_TRUE(feed(splitter, "data: {\"a\""));
    EXPECT_TRUE(collector.lines.empty());
    EXPECT_TRUE(feed(splitter, ":1}\ndata: [DO"));
    EXPECT_TRUE(feed(splitter, "NE]\n"));

    EXPECT_EQ(collector.lines, (std::vector<std::string>{"data: {\"a\":1}", "data: [DONE]"}));
}

TEST(LineSplitter, StripsCrLf) {
    Collector collector;
    LineSplitter splitter(collector.handler());
    splitter.set_status(200);

    feed(splitter, "data: one\r\n\r\ndata: two\r");
    feed(splitter, "\n");

    EXPECT_EQ(collector.lines, (std::vector<std::string>{"data: one", "", "data: two"}));
}

TEST(LineSplitter, TrailingLineDeliveredAtFinish) {
    Collector collector;
    LineSplitter splitter(collector.handler());
    splitter.set_status(200);

    feed(splitter, "data: first\ndata: last");
    ASSERT_EQ(collector.lines.size(), 1u);

    EXPECT_TRUE(splitter.finish());
    EXPECT_EQ(collector.lines, (std::vector<std::string>{"data: first", "data: last"}));

    // Nothing left for a second call
    EXPECT_TRUE(splitter.finish());
    EXPECT_EQ(collector.lines.size(), 2u);
}

TEST(LineSplitter, ErrorBodyIsCapturedNotDelivered) {
    Collector collector;
    LineSplitter splitter(collector.handler());
    splitter.set_status(429);

    std::string body = "{\"error\":\"rate limited\"}\n" + std::string(1000, 'x');
    EXPECT_TRUE(feed(splitter, body));
    EXPECT_TRUE(feed(splitter, "more\n"));
    EXPECT_TRUE(splitter.finish());

    EXPECT_TRUE(collector.lines.empty());
    EXPECT_EQ(splitter.error_body().size(), STREAM_ERROR_BODY_LIMIT);
    EXPECT_EQ(splitter.error_body(), body.substr(0, STREAM_ERROR_BODY_LIMIT));
}

TEST(LineSplitter, HandlerReturningFalseStops) {
    Collector collector;
    collector.stop_after = 2;
    LineSplitter splitter(collector.handler());
    splitter.set_status(200);

    EXPECT_FALSE(feed(splitter, "a\nb\nc\n"));
    EXPECT_TRUE(splitter.cancelled());
    EXPECT_EQ(collector.lines, (std::vector<std::string>{"a", "b"}));

    EXPECT_FALSE(feed(splitter, "d\n"));
    EXPECT_FALSE(splitter.finish());
    EXPECT_EQ(collector.lines.size(), 2u);
}

TEST(LineSplitter, CancelCheckAbortsWithoutData) {
    Collector collector;
    bool cancelled = false;
    LineSplitter splitter(collector.handler(), [&cancelled]() { return cancelled; });
    splitter.set_status(200);

    feed(splitter, "data: one\n");
    EXPECT_FALSE(splitter.should_abort());

    // No bytes arrive; the progress poll alone must notice
    cancelled = true;
    EXPECT_TRUE(splitter.should_abort());
    EXPECT_TRUE(splitter.cancelled());

    EXPECT_FALSE(feed(splitter, "data: two\n"));
    EXPECT_EQ(collector.lines, (std::vector<std::string>{"data: one"}));
}

TEST(LineSplitter, HandlerExceptionIsHeldForCaller) {
    LineSplitter splitter([](const std::string& line) -> bool {
        if (line == "boom") {
            throw std::runtime_error("handler failed");
        }
        return true;
    });
    splitter.set_status(200);

    EXPECT_FALSE(feed(splitter, "ok\nboom\nafter\n"));
    EXPECT_TRUE(splitter.failed());
    EXPECT_TRUE(splitter.should_abort());
    EXPECT_FALSE(splitter.finish());
    EXPECT_THROW(splitter.rethrow_if_failed(), std::runtime_error);
}

TEST(LineSplitter, TrailingLineExceptionIsHeld) {
    LineSplitter splitter([](const std::string&) -> bool {
        throw std::runtime_error("handler failed");
    });
    splitter.set_status(200);

    EXPECT_TRUE(feed(splitter, "partial"));
    EXPECT_FALSE(splitter.finish());
    EXPECT_THROW(splitter.rethrow_if_failed(), std::runtime_error);
}

TEST(LineSplitter, NoExceptionMeansNoRethrow) {
    Collector collector;
    LineSplitter splitter(collector.handler());
    splitter.set_status(200);
    feed(splitter, "x\n");
    EXPECT_FALSE(splitter.failed());
    EXPECT_NO_THROW(splitter.rethrow_if_failed());
}

// =============================================================================
// Conversation creation
// =============================================================================

TEST(CreateConversationResponse, Success) {
    CreateConversationResult result = interpret_create_conversation_response(
        200, R"({"success": true, "data": {"id": "chat-123", "title": "New Chat"}})");

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.conversation_id, std::optional<std::string>("chat-123"));
    EXPECT_FALSE(result.failure.has_value());
}

TEST(CreateConversationResponse, NonSuccessStatus) {
    CreateConversationResult result = interpret_create_conversation_response(401, "Unauthorized");

    EXPECT_FALSE(result.ok());
    ASSERT_TRUE(result.failure.has_value());
    EXPECT_EQ(result.failure->status_code, 401);
    EXPECT_EQ(result.failure->body_excerpt, "Unauthorized");
}

TEST(CreateConversationResponse, SuccessFlagFalse) {
    CreateConversationResult result = interpret_create_conversation_response(200, R"({"success": false})");

    EXPECT_FALSE(result.ok());
    ASSERT_TRUE(result.failure.has_value());
    EXPECT_EQ(result.failure->status_code, 200);
}

TEST(CreateConversationResponse, MissingOrEmptyId) {
    EXPECT_FALSE(interpret_create_conversation_response(200, R"({"success": true})").ok());
    EXPECT_FALSE(interpret_create_conversation_response(200, R"({"success": true, "data": {}})").ok());
    EXPECT_FALSE(interpret_create_conversation_response(200, R"({"success": true, "data": {"id": ""}})").ok());
    EXPECT_FALSE(interpret_create_conversation_response(200, R"({"success": true, "data": {"id": 5}})").ok());
}

TEST(CreateConversationResponse, MalformedBody) {
    EXPECT_FALSE(interpret_create_conversation_response(200, "<html>").ok());
    EXPECT_FALSE(interpret_create_conversation_response(200, "[1, 2]").ok());
    EXPECT_FALSE(interpret_create_conversation_response(200, "").ok());
}

TEST(CreateConversationResponse, BodyExcerptIsTruncated) {
    std::string body(1000, 'x');
    CreateConversationResult result = interpret_create_conversation_response(500, body);

    ASSERT_TRUE(result.failure.has_value());
    EXPECT_EQ(result.failure->body_excerpt.size(), CREATE_ERROR_BODY_LIMIT);
}

TEST(StreamResult, Outcome) {
    StreamResult ok;
    ok.status_code = 200;
    EXPECT_TRUE(ok.ok());

    StreamResult cancelled;
    cancelled.cancelled = true;
    EXPECT_FALSE(cancelled.ok());

    StreamResult failed;
    failed.failure = TransportFailure{502, "HTTP 502", "Bad Gateway"};
    EXPECT_FALSE(failed.ok());
}
