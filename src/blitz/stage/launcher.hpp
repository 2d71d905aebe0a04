#pragma once

#include "blitz/config/config.hpp"
#include "blitz/core/desktop.hpp"
#include <string>
#include <vector>

namespace blitz {

namespace launch_policy {

/// command flags_head flags_middle flags_tail, with the URL glued onto the last tail flag.
std::vector<std::string> command_line(BrowserConfig const& browser, std::string const& url);

} // namespace launch_policy

/// Starts the browser detached in its own session.
class ProcessLauncher : public WindowLauncher
{
public:
    explicit ProcessLauncher(BrowserConfig browser);

    std::optional<pid_t> spawn(std::string const& url) override;

private:
    BrowserConfig browser_;
};

} // namespace blitz
