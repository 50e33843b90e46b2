/*
 * Sequence: SEQ0019
 * Track: C++
 * MVP: mvp2
 * Change: Declare the delivery cycle that edits, posts or uploads drained log text.
 * Tests: test_delivery_cycle
 */
#ifndef TGLOGGER_DELIVERY_CYCLE_HPP
#define TGLOGGER_DELIVERY_CYCLE_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "tglogger/config.hpp"
#include "tglogger/diagnostics.hpp"
#include "tglogger/flush_scheduler.hpp"
#include "tglogger/log_buffer.hpp"
#include "tglogger/retry_state.hpp"
#include "tglogger/transport.hpp"

namespace tglogger {

// The remote message currently being extended. message_id == 0 means the next
// chunk starts a new message.
struct DeliveryState {
    std::int64_t message_id;
    std::string text;

    bool active() const { return message_id != 0; }
};

struct DeliveryStats {
    unsigned long messages_sent;
    unsigned long messages_edited;
    unsigned long files_sent;
    unsigned long flood_waits;
    unsigned long retries;
    unsigned long dropped_batches;
    std::size_t dropped_bytes;
    std::size_t backlog_bytes;
};

std::string format_message(const std::string &title, const std::string &body);
std::string file_name_for(const std::string &title);
std::string file_caption_for(const std::string &title);

class DeliveryCycle : public FlushTarget {
public:
    DeliveryCycle(const HandlerConfig &config,
                  Transport &transport,
                  Sleeper sleeper,
                  std::shared_ptr<DiagnosticLogger> diagnostics);

    DeliveryCycle(const DeliveryCycle &) = delete;
    DeliveryCycle &operator=(const DeliveryCycle &) = delete;

    void deliver(const DrainedLogs &batch) override;
    bool has_backlog() const override { return !backlog_.empty(); }

    const DeliveryState &state() const { return state_; }
    std::size_t backlog_size() const { return backlog_.size(); }
    DeliveryStats stats() const;

private:
    enum class CallResult {
        Delivered,
        Rejected,
        Dropped
    };

    CallResult run_with_retry(const char *operation,
                              const std::function<void()> &call,
                              bool reject_bad_request);
    void deliver_file();
    void deliver_chunk(const std::string &chunk);
    void start_new_message(const std::string &chunk);
    std::string take_chunk();
    void reset_state();
    void record_drop(const char *operation, const std::string &text);
    void update_backlog_stat();

    HandlerConfig config_;
    Transport &transport_;
    Sleeper sleeper_;
    std::shared_ptr<DiagnosticLogger> diagnostics_;

    DeliveryState state_;
    std::string backlog_;

    mutable std::mutex stats_mutex_;
    DeliveryStats stats_;
};

} // namespace tglogger

#endif // TGLOGGER_DELIVERY_CYCLE_HPP
