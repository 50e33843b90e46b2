/*
 * Sequence: SEQ0003
 * Track: C++
 * MVP: mvp0
 * Change: Declare the immutable handler configuration with its defaults and validation helpers.
 * Tests: test_config
 */
#ifndef TGLOGGER_CONFIG_HPP
#define TGLOGGER_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace tglogger {

struct RetryLimits {
    int max_flood_waits;
    int max_failures;
    std::chrono::milliseconds base_backoff;
    std::chrono::milliseconds max_backoff;
};

struct HandlerConfig {
    std::string token;
    std::int64_t chat_id;
    std::int64_t topic_id; // 0 posts into the chat itself
    std::string title;
    std::vector<std::string> ignore_patterns;
    std::chrono::milliseconds update_interval;
    std::size_t minimum_lines;
    std::size_t pending_logs;
    std::size_t message_limit;
    std::string api_base_url;
    std::chrono::milliseconds request_timeout;
    RetryLimits retry;
};

constexpr const char *kDefaultTitle = "TGLogger";
constexpr const char *kDefaultApiBaseUrl = "https://api.telegram.org";
constexpr std::size_t kDefaultPendingLogs = 200000;
// Telegram caps a message at 4096 characters. The body limit is further
// reduced by the title line and the code fence around it.
constexpr std::size_t kMaxMessageLength = 4096;
constexpr std::size_t kMaxMessageBody = 4050;
// Two fences of three backticks and the newline after the title.
constexpr std::size_t kMessageFraming = 7;
constexpr std::size_t kMaxTitleLength = 256;

HandlerConfig default_config();
// Clamps the message body so that title, fences and body stay within
// kMaxMessageLength.
HandlerConfig normalize_config(HandlerConfig config);
bool validate_config(const HandlerConfig &config, std::string &error);
RetryLimits default_retry_limits();

} // namespace tglogger

#endif // TGLOGGER_CONFIG_HPP
