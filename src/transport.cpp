/*
 * Sequence: SEQ0014
 * Track: C++
 * MVP: mvp1
 * Change: Implement transport failure types carrying status, description and retry-after.
 * Tests: test_telegram_transport
 */
#include "tglogger/transport.hpp"

namespace tglogger {

namespace {

std::string describe(long status, const std::string &description) {
    std::string what = "transport error";
    if (status != 0) {
        what += " " + std::to_string(status);
    }
    if (!description.empty()) {
        what += ": " + description;
    }
    return what;
}

} // namespace

TransportError::TransportError(long status, const std::string &description)
    : std::runtime_error(describe(status, description)),
      status_(status),
      description_(description) {}

FloodWait::FloodWait(std::chrono::seconds retry_after, const std::string &description)
    : TransportError(429, description),
      retry_after_(retry_after) {}

} // namespace tglogger
