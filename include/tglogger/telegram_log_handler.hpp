/*
 * Sequence: SEQ0021
 * Track: C++
 * MVP: mvp2
 * Change: Declare the handler that wires filter, buffer, scheduler and delivery behind one emit call.
 * Tests: test_telegram_log_handler
 */
#ifndef TGLOGGER_TELEGRAM_LOG_HANDLER_HPP
#define TGLOGGER_TELEGRAM_LOG_HANDLER_HPP

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include "tglogger/cancellation_token.hpp"
#include "tglogger/config.hpp"
#include "tglogger/delivery_cycle.hpp"
#include "tglogger/diagnostics.hpp"
#include "tglogger/flush_scheduler.hpp"
#include "tglogger/log_buffer.hpp"
#include "tglogger/transport.hpp"

namespace tglogger {

struct HandlerStats {
    LogBufferStats buffer;
    DeliveryStats delivery;
    SchedulerStats scheduler;
    unsigned long accepted_lines;
    unsigned long ignored_lines;
};

class TelegramLogHandler {
public:
    explicit TelegramLogHandler(const HandlerConfig &config);
    TelegramLogHandler(const HandlerConfig &config,
                       std::unique_ptr<Transport> transport,
                       std::shared_ptr<DiagnosticLogger> diagnostics = nullptr);
    ~TelegramLogHandler();

    TelegramLogHandler(const TelegramLogHandler &) = delete;
    TelegramLogHandler &operator=(const TelegramLogHandler &) = delete;

    // Returns 0 once the flush loop runs, -1 on an invalid configuration or a
    // transport that cannot be created. The reason goes to diagnostics.
    int start();

    // Accepts one formatted record. Returns false if the record was filtered
    // out or the handler is closed. Never throws.
    bool emit(const std::string &formatted);

    void flush();

    // Stops the loop after a final drain. Safe to call more than once.
    void close();

    bool running() const;
    HandlerStats stats() const;
    const HandlerConfig &config() const { return config_; }

private:
    HandlerConfig config_;
    std::shared_ptr<DiagnosticLogger> diagnostics_;
    std::unique_ptr<Transport> transport_;

    LogBuffer buffer_;
    CancellationToken token_;
    std::unique_ptr<DeliveryCycle> delivery_;
    std::unique_ptr<FlushScheduler> scheduler_;

    mutable std::mutex lifecycle_mutex_;
    std::atomic<bool> closed_;
    std::atomic<unsigned long> accepted_lines_;
    std::atomic<unsigned long> ignored_lines_;
};

} // namespace tglogger

#endif // TGLOGGER_TELEGRAM_LOG_HANDLER_HPP
