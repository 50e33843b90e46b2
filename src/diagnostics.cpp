/*
 * Sequence: SEQ0002
 * Track: C++
 * MVP: mvp0
 * Change: Write handler diagnostics to stderr with a timestamp and level tag.
 * Tests: test_delivery_cycle
 */
#include "tglogger/diagnostics.hpp"

#include <cstdio>
#include <cstring>
#include <ctime>
#include <iostream>

namespace tglogger {

namespace {

void format_now(char *buffer, std::size_t capacity) {
    std::time_t now = std::time(nullptr);
    std::tm tm_value{};
    if (localtime_r(&now, &tm_value) == nullptr) {
        std::memset(&tm_value, 0, sizeof(tm_value));
        tm_value.tm_year = 70;
        tm_value.tm_mday = 1;
    }
    if (std::strftime(buffer, capacity, "%Y-%m-%d %H:%M:%S", &tm_value) == 0) {
        std::snprintf(buffer, capacity, "1970-01-01 00:00:00");
    }
}

} // namespace

void ConsoleDiagnostics::info(const std::string &message) {
    write_line("info", message);
}

void ConsoleDiagnostics::warn(const std::string &message) {
    write_line("warn", message);
}

void ConsoleDiagnostics::error(const std::string &message) {
    write_line("error", message);
}

void ConsoleDiagnostics::write_line(const char *level, const std::string &message) {
    char timestamp[32];
    format_now(timestamp, sizeof(timestamp));

    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << '[' << timestamp << "] [tglogger][" << level << "] " << message << std::endl;
}

std::shared_ptr<DiagnosticLogger> make_console_diagnostics() {
    return std::make_shared<ConsoleDiagnostics>();
}

} // namespace tglogger
