/*
 * Sequence: SEQ0011
 * Track: C++
 * MVP: mvp1
 * Change: Declare the bounded retry state machine driving one transport call.
 * Tests: test_retry_state
 */
#ifndef TGLOGGER_RETRY_STATE_HPP
#define TGLOGGER_RETRY_STATE_HPP

#include <chrono>
#include <functional>

#include "tglogger/config.hpp"

namespace tglogger {

enum class DeliveryPhase {
    Idle,
    Sending,
    Backoff,
    Dropped
};

const char *phase_name(DeliveryPhase phase);

// Performs the delay chosen by the state machine. Returns false when the wait
// was cancelled, in which case the caller abandons the attempt.
using Sleeper = std::function<bool(std::chrono::milliseconds)>;

class RetryStateMachine {
public:
    explicit RetryStateMachine(const RetryLimits &limits);

    void begin();
    void on_success();
    std::chrono::milliseconds on_flood_wait(std::chrono::seconds retry_after);
    std::chrono::milliseconds on_failure();
    void resume();
    void abandon();

    DeliveryPhase phase() const { return phase_; }
    int flood_waits() const { return flood_waits_; }
    int failures() const { return failures_; }
    int attempts() const { return attempts_; }

private:
    std::chrono::milliseconds backoff_for(int failure_count) const;

    RetryLimits limits_;
    DeliveryPhase phase_;
    int flood_waits_;
    int failures_;
    int attempts_;
};

} // namespace tglogger

#endif // TGLOGGER_RETRY_STATE_HPP
