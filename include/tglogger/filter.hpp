/*
 * Sequence: SEQ0005
 * Track: C++
 * MVP: mvp0
 * Change: Declare the ignore-pattern filter applied before a line reaches the buffer.
 * Tests: test_filter
 */
#ifndef TGLOGGER_FILTER_HPP
#define TGLOGGER_FILTER_HPP

#include <string>
#include <vector>

namespace tglogger {

// False iff the line contains one of the patterns (literal, case-sensitive).
bool should_include(const std::string &line, const std::vector<std::string> &ignore_patterns);

} // namespace tglogger

#endif // TGLOGGER_FILTER_HPP
