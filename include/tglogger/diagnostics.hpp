/*
 * Sequence: SEQ0001
 * Track: C++
 * MVP: mvp0
 * Change: Declare the local diagnostic channel kept apart from the shipped log stream.
 * Tests: test_delivery_cycle
 */
#ifndef TGLOGGER_DIAGNOSTICS_HPP
#define TGLOGGER_DIAGNOSTICS_HPP

#include <memory>
#include <mutex>
#include <string>

namespace tglogger {

// Messages about the handler itself. Implementations must never route back
// into a TelegramLogHandler, otherwise a delivery failure feeds itself.
class DiagnosticLogger {
public:
    virtual ~DiagnosticLogger() = default;
    virtual void info(const std::string &message) = 0;
    virtual void warn(const std::string &message) = 0;
    virtual void error(const std::string &message) = 0;
};

class ConsoleDiagnostics : public DiagnosticLogger {
public:
    void info(const std::string &message) override;
    void warn(const std::string &message) override;
    void error(const std::string &message) override;

private:
    void write_line(const char *level, const std::string &message);

    std::mutex mutex_;
};

std::shared_ptr<DiagnosticLogger> make_console_diagnostics();

} // namespace tglogger

#endif // TGLOGGER_DIAGNOSTICS_HPP
