/*
 * Sequence: SEQ0015
 * Track: C++
 * MVP: mvp1
 * Change: Declare the Bot API transport (sendMessage, editMessageText, sendDocument) over libcurl and jsoncpp.
 * Tests: test_telegram_transport
 */
#ifndef TGLOGGER_TELEGRAM_TRANSPORT_HPP
#define TGLOGGER_TELEGRAM_TRANSPORT_HPP

#include <chrono>
#include <cstdint>
#include <string>

#include <json/json.h>

#include "tglogger/config.hpp"
#include "tglogger/transport.hpp"

namespace tglogger {

namespace bot_api {

constexpr const char *kParseMode = "Markdown";

std::string method_url(const std::string &base_url, const std::string &token, const std::string &method);

Json::Value build_send_message(std::int64_t chat_id, std::int64_t topic_id, const std::string &text);
Json::Value build_edit_message(std::int64_t chat_id, std::int64_t message_id, const std::string &text);

// Returns the "result" member of a successful reply. Throws FloodWait when the
// API asks to slow down and TransportError for every other failure.
Json::Value interpret_response(long http_status, const std::string &body);

std::int64_t message_id_of(const Json::Value &result);

} // namespace bot_api

class TelegramTransport : public Transport {
public:
    explicit TelegramTransport(const HandlerConfig &config);
    ~TelegramTransport() override;

    TelegramTransport(const TelegramTransport &) = delete;
    TelegramTransport &operator=(const TelegramTransport &) = delete;

    std::int64_t send_message(const std::string &text) override;
    void edit_message(std::int64_t message_id, const std::string &text) override;
    std::int64_t send_file(const std::string &filename,
                           const std::string &content,
                           const std::string &caption) override;

private:
    Json::Value post_json(const std::string &method, const Json::Value &payload);
    Json::Value perform(const std::string &method);

    std::string base_url_;
    std::string token_;
    std::int64_t chat_id_;
    std::int64_t topic_id_;
    std::chrono::milliseconds timeout_;
    void *curl_; // CURL*, reused across calls for connection keep-alive
};

} // namespace tglogger

#endif // TGLOGGER_TELEGRAM_TRANSPORT_HPP
