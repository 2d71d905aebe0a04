#pragma once

#include "blitz/core/desktop.hpp"
#include <string>
#include <vector>

namespace blitz {

/// Feeds text on stdin to an external clipboard tool, trying a fallback tool second.
class CommandClipboard : public ClipboardSink
{
public:
    CommandClipboard(std::vector<std::string> command, std::vector<std::string> fallback);

    bool set_text(std::string const& text) override;

private:
    std::vector<std::string> command_;
    std::vector<std::string> fallback_;

    static bool pipe_to(std::vector<std::string> const& command, std::string const& text);
};

} // namespace blitz
