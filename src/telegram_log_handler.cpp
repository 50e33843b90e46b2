/*
 * Sequence: SEQ0022
 * Track: C++
 * MVP: mvp2
 * Change: Implement handler start, emit, flush and close on top of the buffer and the flush loop.
 * Tests: test_telegram_log_handler
 */
#include "tglogger/telegram_log_handler.hpp"

#include <chrono>
#include <exception>
#include <memory>
#include <utility>

#include "tglogger/filter.hpp"
#include "tglogger/telegram_transport.hpp"

namespace tglogger {

TelegramLogHandler::TelegramLogHandler(const HandlerConfig &config)
    : TelegramLogHandler(config, nullptr, nullptr) {}

TelegramLogHandler::TelegramLogHandler(const HandlerConfig &config,
                                       std::unique_ptr<Transport> transport,
                                       std::shared_ptr<DiagnosticLogger> diagnostics)
    : config_(normalize_config(config)),
      diagnostics_(diagnostics ? std::move(diagnostics) : make_console_diagnostics()),
      transport_(std::move(transport)),
      closed_(false),
      accepted_lines_(0),
      ignored_lines_(0) {}

TelegramLogHandler::~TelegramLogHandler() {
    close();
}

int TelegramLogHandler::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (closed_.load(std::memory_order_acquire)) {
        diagnostics_->error("cannot start a closed handler");
        return -1;
    }
    if (scheduler_ && scheduler_->running()) {
        return 0;
    }

    std::string error;
    if (!validate_config(config_, error)) {
        diagnostics_->error("invalid configuration: " + error);
        return -1;
    }

    if (!transport_) {
        try {
            transport_ = std::make_unique<TelegramTransport>(config_);
        } catch (const TransportError &e) {
            diagnostics_->error(std::string("failed to create transport: ") + e.what());
            return -1;
        }
    }

    // Retry sleeps end early on close only. A flush request must not shorten
    // a flood wait.
    delivery_ = std::make_unique<DeliveryCycle>(
        config_, *transport_,
        [this](std::chrono::milliseconds delay) { return !token_.wait_for_stop(delay); },
        diagnostics_);
    scheduler_ = std::make_unique<FlushScheduler>(buffer_, *delivery_, token_, diagnostics_);

    if (scheduler_->start(config_.update_interval, config_.minimum_lines) != 0) {
        diagnostics_->error("failed to start flush loop");
        scheduler_.reset();
        delivery_.reset();
        return -1;
    }

    diagnostics_->info("shipping logs to chat " + std::to_string(config_.chat_id) +
                       (config_.topic_id > 0 ? " topic " + std::to_string(config_.topic_id) : std::string()) +
                       " every " + std::to_string(config_.update_interval.count()) + " ms");
    return 0;
}

bool TelegramLogHandler::emit(const std::string &formatted) {
    if (closed_.load(std::memory_order_acquire)) {
        return false;
    }

    try {
        if (!should_include(formatted, config_.ignore_patterns)) {
            ignored_lines_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }

        if (!formatted.empty() && formatted.back() == '\n') {
            buffer_.append(formatted);
        } else {
            buffer_.append(formatted + '\n');
        }
        accepted_lines_.fetch_add(1, std::memory_order_relaxed);
        return true;
    } catch (const std::exception &e) {
        diagnostics_->error(std::string("failed to buffer record: ") + e.what());
        return false;
    }
}

void TelegramLogHandler::flush() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (scheduler_) {
        scheduler_->request_flush();
    }
}

void TelegramLogHandler::close() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (closed_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    if (!scheduler_) {
        const std::size_t pending = buffer_.size();
        if (pending > 0) {
            diagnostics_->warn("closed before start, " + std::to_string(pending) + " bytes never shipped");
        }
        return;
    }

    scheduler_->stop();

    const std::size_t remaining = delivery_->backlog_size() + buffer_.size();
    if (remaining > 0) {
        diagnostics_->warn("closed with " + std::to_string(remaining) + " bytes undelivered");
    }
    diagnostics_->info("handler closed");
}

bool TelegramLogHandler::running() const {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    return scheduler_ && scheduler_->running();
}

HandlerStats TelegramLogHandler::stats() const {
    HandlerStats snapshot{};
    snapshot.buffer = buffer_.stats();

    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (delivery_) {
        snapshot.delivery = delivery_->stats();
    }
    if (scheduler_) {
        snapshot.scheduler = scheduler_->stats();
    }
    snapshot.accepted_lines = accepted_lines_.load(std::memory_order_relaxed);
    snapshot.ignored_lines = ignored_lines_.load(std::memory_order_relaxed);
    return snapshot;
}

} // namespace tglogger
