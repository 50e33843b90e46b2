#include "test_config.h"

#include "tglogger/telegram_transport.hpp"

namespace tglogger::test {

TEST(BotApiTest, MethodUrlJoinsBaseTokenAndMethod)
{
    EXPECT_EQ(bot_api::method_url("https://api.telegram.org", "42:abc", "sendMessage"),
        "https://api.telegram.org/bot42:abc/sendMessage");
}

TEST(BotApiTest, SendMessagePayloadWithoutTopic)
{
    Json::Value payload = bot_api::build_send_message(TestConfig::CHAT_ID, 0, "```T\nhi\n```");

    EXPECT_EQ(payload["chat_id"].asInt64(), TestConfig::CHAT_ID);
    EXPECT_FALSE(payload.isMember("message_thread_id"));
    EXPECT_EQ(payload["text"].asString(), "```T\nhi\n```");
    EXPECT_EQ(payload["parse_mode"].asString(), "Markdown");
    EXPECT_TRUE(payload["disable_web_page_preview"].asBool());
}

TEST(BotApiTest, SendMessagePayloadRoutesToTopic)
{
    Json::Value payload = bot_api::build_send_message(TestConfig::CHAT_ID, 17, "x");
    EXPECT_EQ(payload["message_thread_id"].asInt64(), 17);
}

TEST(BotApiTest, EditPayloadCarriesMessageId)
{
    Json::Value payload = bot_api::build_edit_message(TestConfig::CHAT_ID, 991, "x");
    EXPECT_EQ(payload["message_id"].asInt64(), 991);
    EXPECT_EQ(payload["chat_id"].asInt64(), TestConfig::CHAT_ID);
}

TEST(BotApiTest, SuccessfulReplyReturnsResult)
{
    Json::Value result = bot_api::interpret_response(200, R"({"ok":true,"result":{"message_id":321,"chat":{"id":1}}})");
    EXPECT_EQ(bot_api::message_id_of(result), 321);
}

TEST(BotApiTest, RetryAfterBecomesFloodWait)
{
    const std::string body = R"({"ok":false,"error_code":429,"description":"Too Many Requests: retry after 12","parameters":{"retry_after":12}})";
    try {
        bot_api::interpret_response(429, body);
        FAIL() << "expected FloodWait";
    } catch (const FloodWait &e) {
        EXPECT_EQ(e.retry_after(), std::chrono::seconds(12));
        EXPECT_EQ(e.status(), 429);
    }
}

TEST(BotApiTest, Http429WithoutJsonIsStillFloodWait)
{
    EXPECT_THROW(bot_api::interpret_response(429, "<html>slow down</html>"), FloodWait);
}

TEST(BotApiTest, ApiErrorCarriesCodeAndDescription)
{
    const std::string body = R"({"ok":false,"error_code":400,"description":"Bad Request: message to edit not found"})";
    try {
        bot_api::interpret_response(400, body);
        FAIL() << "expected TransportError";
    } catch (const FloodWait &) {
        FAIL() << "not a flood wait";
    } catch (const TransportError &e) {
        EXPECT_EQ(e.status(), 400);
        EXPECT_EQ(e.description(), "Bad Request: message to edit not found");
    }
}

TEST(BotApiTest, GarbageReplyIsTransportError)
{
    try {
        bot_api::interpret_response(502, "Bad Gateway");
        FAIL() << "expected TransportError";
    } catch (const TransportError &e) {
        EXPECT_EQ(e.status(), 502);
        EXPECT_NE(e.description().find("Bad Gateway"), std::string::npos);
    }
}

TEST(BotApiTest, MissingMessageIdIsTransportError)
{
    Json::Value result = bot_api::interpret_response(200, R"({"ok":true,"result":true})");
    EXPECT_THROW(bot_api::message_id_of(result), TransportError);
}

TEST(TransportErrorTest, WhatIncludesStatusAndDescription)
{
    TransportError error(403, "Forbidden: bot was kicked");
    EXPECT_STREQ(error.what(), "transport error 403: Forbidden: bot was kicked");

    TransportError network(0, "sendMessage: Could not resolve host");
    EXPECT_STREQ(network.what(), "transport error: sendMessage: Could not resolve host");
}

}
