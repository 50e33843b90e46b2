/*
 * Sequence: SEQ0018
 * Track: C++
 * MVP: mvp2
 * Change: Implement the tick loop with minimum-line gating, forced flushes and a final drain on stop.
 * Tests: test_flush_scheduler
 */
#include "tglogger/flush_scheduler.hpp"

#include <exception>
#include <system_error>
#include <string>
#include <utility>

namespace tglogger {

FlushScheduler::FlushScheduler(LogBuffer &buffer,
                               FlushTarget &target,
                               CancellationToken &token,
                               std::shared_ptr<DiagnosticLogger> diagnostics)
    : buffer_(buffer),
      target_(target),
      token_(token),
      diagnostics_(diagnostics ? std::move(diagnostics) : make_console_diagnostics()),
      interval_(0),
      minimum_lines_(1),
      running_(false),
      flush_requested_(false),
      stats_{0, 0, 0} {}

FlushScheduler::~FlushScheduler() {
    stop();
}

int FlushScheduler::start(std::chrono::milliseconds interval, std::size_t minimum_lines) {
    if (running_.load(std::memory_order_acquire)) {
        return 0;
    }
    if (interval.count() <= 0) {
        return -1;
    }

    interval_ = interval;
    minimum_lines_ = minimum_lines == 0 ? 1 : minimum_lines;
    flush_requested_.store(false, std::memory_order_release);

    try {
        worker_ = std::thread(&FlushScheduler::run_loop, this);
    } catch (const std::system_error &e) {
        diagnostics_->error(std::string("failed to start flush thread: ") + e.what());
        return -1;
    }

    running_.store(true, std::memory_order_release);
    return 0;
}

void FlushScheduler::stop() {
    token_.request_stop();
    if (worker_.joinable()) {
        worker_.join();
    }
    running_.store(false, std::memory_order_release);
}

void FlushScheduler::request_flush() {
    flush_requested_.store(true, std::memory_order_release);
    token_.wake();
}

SchedulerStats FlushScheduler::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void FlushScheduler::run_loop() {
    while (true) {
        if (token_.wait_for(interval_)) {
            break;
        }
        const bool forced = flush_requested_.exchange(false, std::memory_order_acq_rel);
        tick(forced);
    }

    final_flush();
}

void FlushScheduler::tick(bool forced) {
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ++stats_.ticks;
    }

    if (forced || buffer_.line_count() >= minimum_lines_) {
        DrainedLogs batch = buffer_.drain_all();
        if (!batch.text.empty() || target_.has_backlog()) {
            deliver_guarded(batch);
            return;
        }
    } else if (target_.has_backlog()) {
        // Below the threshold: the buffer is left alone, but text carried over
        // from an earlier drain keeps flowing.
        deliver_guarded(DrainedLogs{std::string(), 0});
        return;
    }

    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++stats_.skipped_ticks;
}

void FlushScheduler::final_flush() {
    DrainedLogs batch = buffer_.drain_all();
    if (!batch.text.empty() || target_.has_backlog()) {
        deliver_guarded(batch);
    }

    int rounds = 0;
    while (target_.has_backlog() && rounds < kMaxFinalRounds) {
        deliver_guarded(DrainedLogs{std::string(), 0});
        ++rounds;
    }
}

void FlushScheduler::deliver_guarded(const DrainedLogs &batch) {
    try {
        target_.deliver(batch);
    } catch (const std::exception &e) {
        diagnostics_->error(std::string("flush failed: ") + e.what());
    }

    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++stats_.flushes;
}

} // namespace tglogger
