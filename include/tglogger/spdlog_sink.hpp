/*
 * Sequence: SEQ0023
 * Track: C++
 * MVP: mvp3
 * Change: Expose the handler as an spdlog sink so formatted records flow into emit.
 * Tests: test_spdlog_sink
 */
#ifndef TGLOGGER_SPDLOG_SINK_HPP
#define TGLOGGER_SPDLOG_SINK_HPP

#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include <spdlog/details/null_mutex.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/base_sink.h>

#include "tglogger/telegram_log_handler.hpp"

namespace tglogger {

// spdlog decides level and format; the sink hands each formatted record to the
// handler. The handler is shared so several sinks or loggers can feed it.
template <typename Mutex>
class TelegramSink : public spdlog::sinks::base_sink<Mutex> {
public:
    explicit TelegramSink(std::shared_ptr<TelegramLogHandler> handler)
        : handler_(std::move(handler)) {}

    const std::shared_ptr<TelegramLogHandler> &handler() const { return handler_; }

protected:
    void sink_it_(const spdlog::details::log_msg &msg) override {
        if (!handler_) {
            return;
        }
        spdlog::memory_buf_t formatted;
        this->formatter_->format(msg, formatted);
        handler_->emit(std::string(formatted.data(), formatted.size()));
    }

    void flush_() override {
        if (handler_) {
            handler_->flush();
        }
    }

private:
    std::shared_ptr<TelegramLogHandler> handler_;
};

using telegram_sink_mt = TelegramSink<std::mutex>;
using telegram_sink_st = TelegramSink<spdlog::details::null_mutex>;

inline std::shared_ptr<telegram_sink_mt> attach_telegram_sink(const std::shared_ptr<spdlog::logger> &logger,
                                                              std::shared_ptr<TelegramLogHandler> handler) {
    auto sink = std::make_shared<telegram_sink_mt>(std::move(handler));
    logger->sinks().push_back(sink);
    return sink;
}

} // namespace tglogger

#endif // TGLOGGER_SPDLOG_SINK_HPP
