/*
 * Sequence: SEQ0013
 * Track: C++
 * MVP: mvp1
 * Change: Declare the three-call messaging transport and its failure types.
 * Tests: test_delivery_cycle
 */
#ifndef TGLOGGER_TRANSPORT_HPP
#define TGLOGGER_TRANSPORT_HPP

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace tglogger {

class TransportError : public std::runtime_error {
public:
    TransportError(long status, const std::string &description);

    // API error_code or HTTP status; 0 when the request never got a response.
    long status() const { return status_; }
    const std::string &description() const { return description_; }

private:
    long status_;
    std::string description_;
};

class FloodWait : public TransportError {
public:
    FloodWait(std::chrono::seconds retry_after, const std::string &description);

    std::chrono::seconds retry_after() const { return retry_after_; }

private:
    std::chrono::seconds retry_after_;
};

// Routing (chat, topic) is fixed per instance. Implementations are called from
// the delivery thread only.
class Transport {
public:
    virtual ~Transport() = default;

    virtual std::int64_t send_message(const std::string &text) = 0;
    virtual void edit_message(std::int64_t message_id, const std::string &text) = 0;
    virtual std::int64_t send_file(const std::string &filename,
                                   const std::string &content,
                                   const std::string &caption) = 0;
};

} // namespace tglogger

#endif // TGLOGGER_TRANSPORT_HPP
