/*
 * Sequence: SEQ0008
 * Track: C++
 * MVP: mvp0
 * Change: Implement append and swap-based drain so producers only contend for the copy and the swap.
 * Tests: test_log_buffer
 */
#include "tglogger/log_buffer.hpp"

#include <algorithm>

namespace tglogger {

LogBuffer::LogBuffer()
    : text_(),
      lines_(0),
      total_lines_(0),
      drains_(0) {}

std::size_t LogBuffer::count_lines(const std::string &text) {
    return static_cast<std::size_t>(std::count(text.begin(), text.end(), '\n'));
}

void LogBuffer::append(const std::string &text) {
    if (text.empty()) {
        return;
    }

    // Counted outside the lock; only the copy into text_ is serialized.
    const std::size_t lines = count_lines(text);

    std::lock_guard<std::mutex> lock(mutex_);
    text_.append(text);
    lines_ += lines;
    total_lines_ += lines;
}

DrainedLogs LogBuffer::drain_all() {
    DrainedLogs drained{std::string(), 0};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drained.text.swap(text_);
        drained.line_count = lines_;
        lines_ = 0;
        ++drains_;
    }
    return drained;
}

std::size_t LogBuffer::line_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
}

std::size_t LogBuffer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return text_.size();
}

LogBufferStats LogBuffer::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return LogBufferStats{text_.size(), lines_, total_lines_, drains_};
}

} // namespace tglogger
