/*
 * Sequence: SEQ0024
 * Track: C++
 * MVP: mvp3
 * Change: Add tglogger_pipe, which tees stdin to stdout and ships every line to a Telegram chat.
 * Tests: test_spdlog_sink
 */
#include <getopt.h>
#include <signal.h>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <spdlog/logger.h>

#include "tglogger/spdlog_sink.hpp"
#include "tglogger/telegram_log_handler.hpp"

namespace {

volatile sig_atomic_t g_stop = 0;

void handle_signal(int signo) {
    (void)signo;
    g_stop = 1;
}

void install_signal_handlers() {
    struct sigaction sa;
    sa.sa_handler = handle_signal;
    sigemptyset(&sa.sa_mask);
    // No SA_RESTART: a blocked read on stdin must return so the loop can close.
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

void print_usage(const char *prog) {
    std::cout << "Usage: " << prog << " --chat-id ID [options]" << std::endl;
    std::cout << "Copies stdin to stdout and ships every line to a Telegram chat." << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --token TOKEN        Bot token (default: $TGLOGGER_TOKEN)" << std::endl;
    std::cout << "  --chat-id ID         Target chat id" << std::endl;
    std::cout << "  --topic-id ID        Forum topic id (default: none)" << std::endl;
    std::cout << "  --title TEXT         Message title (default: " << tglogger::kDefaultTitle << ")" << std::endl;
    std::cout << "  --ignore TEXT        Drop lines containing TEXT, repeatable" << std::endl;
    std::cout << "  --interval-ms MS     Flush interval (default: 5000)" << std::endl;
    std::cout << "  --min-lines N        Lines needed before a flush (default: 1)" << std::endl;
    std::cout << "  --pending-logs N     Characters before switching to a file (default: "
              << tglogger::kDefaultPendingLogs << ")" << std::endl;
    std::cout << "  --api-url URL        Bot API base url (default: " << tglogger::kDefaultApiBaseUrl << ")" << std::endl;
    std::cout << "  -h, --help           Show this help message" << std::endl;
}

enum OptionId {
    kOptToken = 1000,
    kOptChatId,
    kOptTopicId,
    kOptTitle,
    kOptIgnore,
    kOptIntervalMs,
    kOptMinLines,
    kOptPendingLogs,
    kOptApiUrl
};

} // namespace

int main(int argc, char *argv[]) {
    tglogger::HandlerConfig config = tglogger::default_config();
    const char *env_token = std::getenv("TGLOGGER_TOKEN");
    if (env_token != nullptr) {
        config.token = env_token;
    }

    static const struct option long_options[] = {
        {"token", required_argument, nullptr, kOptToken},
        {"chat-id", required_argument, nullptr, kOptChatId},
        {"topic-id", required_argument, nullptr, kOptTopicId},
        {"title", required_argument, nullptr, kOptTitle},
        {"ignore", required_argument, nullptr, kOptIgnore},
        {"interval-ms", required_argument, nullptr, kOptIntervalMs},
        {"min-lines", required_argument, nullptr, kOptMinLines},
        {"pending-logs", required_argument, nullptr, kOptPendingLogs},
        {"api-url", required_argument, nullptr, kOptApiUrl},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0}};

    int opt;
    while ((opt = getopt_long(argc, argv, "h", long_options, nullptr)) != -1) {
        try {
            switch (opt) {
            case kOptToken:
                config.token = optarg;
                break;
            case kOptChatId:
                config.chat_id = std::stoll(optarg);
                break;
            case kOptTopicId:
                config.topic_id = std::stoll(optarg);
                break;
            case kOptTitle:
                config.title = optarg;
                break;
            case kOptIgnore:
                config.ignore_patterns.push_back(optarg);
                break;
            case kOptIntervalMs:
                config.update_interval = std::chrono::milliseconds(std::stoll(optarg));
                break;
            case kOptMinLines:
                config.minimum_lines = std::stoul(optarg);
                break;
            case kOptPendingLogs:
                config.pending_logs = std::stoul(optarg);
                break;
            case kOptApiUrl:
                config.api_base_url = optarg;
                break;
            case 'h':
                print_usage(argv[0]);
                return 0;
            default:
                print_usage(argv[0]);
                return 1;
            }
        } catch (const std::exception &) {
            std::cerr << "Invalid value for option: " << optarg << std::endl;
            return 1;
        }
    }

    auto handler = std::make_shared<tglogger::TelegramLogHandler>(config);
    if (handler->start() != 0) {
        return 1;
    }

    // The pattern is the bare payload: stdin lines are already formatted.
    auto sink = std::make_shared<tglogger::telegram_sink_mt>(handler);
    spdlog::logger logger("tglogger_pipe", sink);
    logger.set_pattern("%v");
    logger.set_level(spdlog::level::trace);

    install_signal_handlers();

    std::string line;
    while (!g_stop && std::getline(std::cin, line)) {
        std::cout << line << '\n';
        logger.info(line);
    }
    std::cout.flush();

    handler->close();
    const tglogger::HandlerStats stats = handler->stats();
    std::cerr << "tglogger_pipe: " << stats.accepted_lines << " lines shipped, "
              << stats.ignored_lines << " ignored, "
              << stats.delivery.dropped_batches << " batches dropped" << std::endl;
    return stats.delivery.dropped_batches == 0 ? 0 : 2;
}
