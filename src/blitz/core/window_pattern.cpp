#include "window_pattern.hpp"
#include <algorithm>
#include <sstream>

namespace blitz {

namespace {

std::string trim(std::string const& s)
{
    auto begin = s.find_first_not_of(" \t\"'");
    if (begin == std::string::npos)
        return "";
    auto end = s.find_last_not_of(" \t\"'");
    return s.substr(begin, end - begin + 1);
}

} // namespace

WindowPattern::WindowPattern(std::string source)
    : source_(std::move(source))
{
    std::istringstream stream(source_);
    std::string token;
    while (std::getline(stream, token, ','))
    {
        token = trim(token);
        if (token.empty())
            continue;
        regexes_.emplace_back(token, std::regex::ECMAScript | std::regex::icase);
    }
}

bool WindowPattern::matches(std::string const& title) const
{
    return std::ranges::any_of(regexes_, [&title](std::regex const& re) { return std::regex_search(title, re); });
}

} // namespace blitz
