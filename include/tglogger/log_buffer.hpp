/*
 * Sequence: SEQ0007
 * Track: C++
 * MVP: mvp0
 * Change: Declare the multi-writer pending-text buffer with atomic drain-and-reset.
 * Tests: test_log_buffer
 */
#ifndef TGLOGGER_LOG_BUFFER_HPP
#define TGLOGGER_LOG_BUFFER_HPP

#include <cstddef>
#include <mutex>
#include <string>

namespace tglogger {

struct DrainedLogs {
    std::string text;
    std::size_t line_count;
};

struct LogBufferStats {
    std::size_t pending_bytes;
    std::size_t pending_lines;
    unsigned long total_lines;
    unsigned long drains;
};

class LogBuffer {
public:
    LogBuffer();

    LogBuffer(const LogBuffer &) = delete;
    LogBuffer &operator=(const LogBuffer &) = delete;

    void append(const std::string &text);
    DrainedLogs drain_all();

    std::size_t line_count() const;
    std::size_t size() const;
    LogBufferStats stats() const;

    static std::size_t count_lines(const std::string &text);

private:
    mutable std::mutex mutex_;
    std::string text_;
    std::size_t lines_;
    unsigned long total_lines_;
    unsigned long drains_;
};

} // namespace tglogger

#endif // TGLOGGER_LOG_BUFFER_HPP
