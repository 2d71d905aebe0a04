#pragma once

#include <regex>
#include <string>
#include <vector>

namespace blitz {

/**
 * @brief Title matcher compiled from a comma separated list of patterns.
 *
 * Each entry is an ECMAScript regular expression searched case-insensitively
 * in the window title; a title matches when any entry matches. Patterns are
 * compiled once so repeated readiness polls do not recompile them.
 */
class WindowPattern
{
public:
    explicit WindowPattern(std::string source);

    bool matches(std::string const& title) const;
    std::string const& source() const { return source_; }
    bool empty() const { return regexes_.empty(); }

private:
    std::string source_;
    std::vector<std::regex> regexes_;
};

} // namespace blitz
