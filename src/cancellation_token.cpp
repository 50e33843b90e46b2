/*
 * Sequence: SEQ0010
 * Track: C++
 * MVP: mvp1
 * Change: Implement interruptible waits backed by a condition variable.
 * Tests: test_flush_scheduler
 */
#include "tglogger/cancellation_token.hpp"

namespace tglogger {

CancellationToken::CancellationToken() : stop_(false), wake_generation_(0) {}

void CancellationToken::request_stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    condition_.notify_all();
}

bool CancellationToken::stop_requested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stop_;
}

void CancellationToken::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_ = false;
}

bool CancellationToken::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    const unsigned long generation = wake_generation_;
    condition_.wait_for(lock, timeout, [this, generation]() {
        return stop_ || wake_generation_ != generation;
    });
    return stop_;
}

bool CancellationToken::wait_for_stop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    condition_.wait_for(lock, timeout, [this]() { return stop_; });
    return stop_;
}

void CancellationToken::wake() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++wake_generation_;
    }
    condition_.notify_all();
}

} // namespace tglogger
