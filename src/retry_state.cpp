/*
 * Sequence: SEQ0012
 * Track: C++
 * MVP: mvp1
 * Change: Implement Idle/Sending/Backoff/Dropped transitions with flood-wait and exponential back-off budgets.
 * Tests: test_retry_state
 */
#include "tglogger/retry_state.hpp"

#include <stdexcept>

namespace tglogger {

const char *phase_name(DeliveryPhase phase) {
    switch (phase) {
    case DeliveryPhase::Idle:
        return "idle";
    case DeliveryPhase::Sending:
        return "sending";
    case DeliveryPhase::Backoff:
        return "backoff";
    case DeliveryPhase::Dropped:
        return "dropped";
    }
    return "unknown";
}

RetryStateMachine::RetryStateMachine(const RetryLimits &limits)
    : limits_(limits),
      phase_(DeliveryPhase::Idle),
      flood_waits_(0),
      failures_(0),
      attempts_(0) {}

void RetryStateMachine::begin() {
    if (phase_ == DeliveryPhase::Sending || phase_ == DeliveryPhase::Backoff) {
        throw std::logic_error("retry state machine already in flight");
    }
    phase_ = DeliveryPhase::Sending;
    flood_waits_ = 0;
    failures_ = 0;
    attempts_ = 1;
}

void RetryStateMachine::on_success() {
    if (phase_ != DeliveryPhase::Sending) {
        throw std::logic_error("success reported outside of sending phase");
    }
    phase_ = DeliveryPhase::Idle;
}

std::chrono::milliseconds RetryStateMachine::on_flood_wait(std::chrono::seconds retry_after) {
    if (phase_ != DeliveryPhase::Sending) {
        throw std::logic_error("flood wait reported outside of sending phase");
    }
    ++flood_waits_;
    if (flood_waits_ > limits_.max_flood_waits) {
        phase_ = DeliveryPhase::Dropped;
        return std::chrono::milliseconds(0);
    }
    phase_ = DeliveryPhase::Backoff;
    if (retry_after.count() < 1) {
        retry_after = std::chrono::seconds(1);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(retry_after);
}

std::chrono::milliseconds RetryStateMachine::on_failure() {
    if (phase_ != DeliveryPhase::Sending) {
        throw std::logic_error("failure reported outside of sending phase");
    }
    ++failures_;
    if (failures_ >= limits_.max_failures) {
        phase_ = DeliveryPhase::Dropped;
        return std::chrono::milliseconds(0);
    }
    phase_ = DeliveryPhase::Backoff;
    return backoff_for(failures_);
}

void RetryStateMachine::resume() {
    if (phase_ != DeliveryPhase::Backoff) {
        throw std::logic_error("resume outside of backoff phase");
    }
    phase_ = DeliveryPhase::Sending;
    ++attempts_;
}

void RetryStateMachine::abandon() {
    phase_ = DeliveryPhase::Dropped;
}

std::chrono::milliseconds RetryStateMachine::backoff_for(int failure_count) const {
    std::chrono::milliseconds delay = limits_.base_backoff;
    for (int i = 1; i < failure_count; ++i) {
        delay *= 2;
        if (delay >= limits_.max_backoff) {
            return limits_.max_backoff;
        }
    }
    return delay < limits_.max_backoff ? delay : limits_.max_backoff;
}

} // namespace tglogger
