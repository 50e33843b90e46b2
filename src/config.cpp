/*
 * Sequence: SEQ0004
 * Track: C++
 * MVP: mvp0
 * Change: Provide configuration defaults, normalization and validation for the handler.
 * Tests: test_config
 */
#include "tglogger/config.hpp"

#include <algorithm>

namespace tglogger {

namespace {

constexpr std::chrono::milliseconds kDefaultUpdateInterval{5000};
constexpr std::chrono::milliseconds kDefaultRequestTimeout{10000};
constexpr int kDefaultMaxFloodWaits = 5;
constexpr int kDefaultMaxFailures = 4;
constexpr std::chrono::milliseconds kDefaultBaseBackoff{1000};
constexpr std::chrono::milliseconds kDefaultMaxBackoff{8000};

} // namespace

RetryLimits default_retry_limits() {
    RetryLimits limits{};
    limits.max_flood_waits = kDefaultMaxFloodWaits;
    limits.max_failures = kDefaultMaxFailures;
    limits.base_backoff = kDefaultBaseBackoff;
    limits.max_backoff = kDefaultMaxBackoff;
    return limits;
}

HandlerConfig default_config() {
    HandlerConfig config{};
    config.chat_id = 0;
    config.topic_id = 0;
    config.title = kDefaultTitle;
    config.update_interval = kDefaultUpdateInterval;
    config.minimum_lines = 1;
    config.pending_logs = kDefaultPendingLogs;
    config.message_limit = kMaxMessageBody;
    config.api_base_url = kDefaultApiBaseUrl;
    config.request_timeout = kDefaultRequestTimeout;
    config.retry = default_retry_limits();
    return config;
}

HandlerConfig normalize_config(HandlerConfig config) {
    if (config.minimum_lines == 0) {
        config.minimum_lines = 1;
    }
    if (config.title.empty()) {
        config.title = kDefaultTitle;
    }
    if (config.title.size() > kMaxTitleLength) {
        std::size_t cut = kMaxTitleLength;
        while (cut > 0 && (static_cast<unsigned char>(config.title[cut]) & 0xC0) == 0x80) {
            --cut;
        }
        config.title.resize(cut);
        if (config.title.empty()) {
            config.title = kDefaultTitle;
        }
    }

    const std::size_t body_ceiling =
        std::min(kMaxMessageBody, kMaxMessageLength - kMessageFraming - config.title.size());
    if (config.message_limit == 0 || config.message_limit > body_ceiling) {
        config.message_limit = body_ceiling;
    }
    if (config.api_base_url.empty()) {
        config.api_base_url = kDefaultApiBaseUrl;
    }
    while (!config.api_base_url.empty() && config.api_base_url.back() == '/') {
        config.api_base_url.pop_back();
    }
    if (config.topic_id < 0) {
        config.topic_id = 0;
    }

    config.ignore_patterns.erase(
        std::remove_if(config.ignore_patterns.begin(), config.ignore_patterns.end(),
                       [](const std::string &pattern) { return pattern.empty(); }),
        config.ignore_patterns.end());

    if (config.retry.max_flood_waits < 0) {
        config.retry.max_flood_waits = 0;
    }
    if (config.retry.max_failures < 1) {
        config.retry.max_failures = 1;
    }
    if (config.retry.max_backoff < config.retry.base_backoff) {
        config.retry.max_backoff = config.retry.base_backoff;
    }
    return config;
}

bool validate_config(const HandlerConfig &config, std::string &error) {
    if (config.token.empty()) {
        error = "bot token is empty";
        return false;
    }
    if (config.chat_id == 0) {
        error = "chat id is not set";
        return false;
    }
    if (config.update_interval.count() <= 0) {
        error = "update interval must be positive";
        return false;
    }
    if (config.pending_logs == 0) {
        error = "pending logs threshold must be positive";
        return false;
    }
    if (config.message_limit == 0) {
        error = "message limit must be positive";
        return false;
    }
    if (config.request_timeout.count() <= 0) {
        error = "request timeout must be positive";
        return false;
    }
    error.clear();
    return true;
}

} // namespace tglogger
