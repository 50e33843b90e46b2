/*
 * Sequence: SEQ0017
 * Track: C++
 * MVP: mvp2
 * Change: Declare the single background flush loop that drains the buffer on a fixed cadence.
 * Tests: test_flush_scheduler
 */
#ifndef TGLOGGER_FLUSH_SCHEDULER_HPP
#define TGLOGGER_FLUSH_SCHEDULER_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>

#include "tglogger/cancellation_token.hpp"
#include "tglogger/diagnostics.hpp"
#include "tglogger/log_buffer.hpp"

namespace tglogger {

// Consumer side of a flush. Only ever called from the scheduler thread.
class FlushTarget {
public:
    virtual ~FlushTarget() = default;
    virtual void deliver(const DrainedLogs &batch) = 0;
    virtual bool has_backlog() const = 0;
};

struct SchedulerStats {
    unsigned long ticks;
    unsigned long flushes;
    unsigned long skipped_ticks;
};

class FlushScheduler {
public:
    FlushScheduler(LogBuffer &buffer,
                   FlushTarget &target,
                   CancellationToken &token,
                   std::shared_ptr<DiagnosticLogger> diagnostics);
    ~FlushScheduler();

    FlushScheduler(const FlushScheduler &) = delete;
    FlushScheduler &operator=(const FlushScheduler &) = delete;

    int start(std::chrono::milliseconds interval, std::size_t minimum_lines);

    // Requests a stop through the shared token and joins the loop. The loop
    // performs one last drain before it exits.
    void stop();

    // Runs the next tick immediately and ignores the minimum line count.
    void request_flush();

    bool running() const { return running_.load(std::memory_order_acquire); }
    SchedulerStats stats() const;

    static constexpr int kMaxFinalRounds = 64;

private:
    void run_loop();
    void tick(bool forced);
    void final_flush();
    void deliver_guarded(const DrainedLogs &batch);

    LogBuffer &buffer_;
    FlushTarget &target_;
    CancellationToken &token_;
    std::shared_ptr<DiagnosticLogger> diagnostics_;

    std::chrono::milliseconds interval_;
    std::size_t minimum_lines_;

    std::thread worker_;
    std::atomic<bool> running_;
    std::atomic<bool> flush_requested_;

    mutable std::mutex stats_mutex_;
    SchedulerStats stats_;
};

} // namespace tglogger

#endif // TGLOGGER_FLUSH_SCHEDULER_HPP
