/*
 * Sequence: SEQ0006
 * Track: C++
 * MVP: mvp0
 * Change: Implement literal substring suppression for ignored log lines.
 * Tests: test_filter
 */
#include "tglogger/filter.hpp"

namespace tglogger {

bool should_include(const std::string &line, const std::vector<std::string> &ignore_patterns) {
    for (const std::string &pattern : ignore_patterns) {
        if (!pattern.empty() && line.find(pattern) != std::string::npos) {
            return false;
        }
    }
    return true;
}

} // namespace tglogger
