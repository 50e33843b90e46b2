/*
 * Sequence: SEQ0009
 * Track: C++
 * MVP: mvp1
 * Change: Declare the stop token shared by the flush loop and the delivery back-off sleeps.
 * Tests: test_flush_scheduler
 */
#ifndef TGLOGGER_CANCELLATION_TOKEN_HPP
#define TGLOGGER_CANCELLATION_TOKEN_HPP

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace tglogger {

class CancellationToken {
public:
    CancellationToken();

    CancellationToken(const CancellationToken &) = delete;
    CancellationToken &operator=(const CancellationToken &) = delete;

    void request_stop();
    bool stop_requested() const;
    void reset();

    // Sleeps up to `timeout`. Returns true if stop was requested before or
    // during the wait.
    bool wait_for(std::chrono::milliseconds timeout);

    // Like wait_for, but only a stop ends it early; wake() is ignored.
    bool wait_for_stop(std::chrono::milliseconds timeout);

    // Ends the current wait_for early without requesting a stop.
    void wake();

private:
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    bool stop_;
    unsigned long wake_generation_;
};

} // namespace tglogger

#endif // TGLOGGER_CANCELLATION_TOKEN_HPP
