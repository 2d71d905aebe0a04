#pragma once

#include "blitz/core/desktop.hpp"
#include "blitz/core/ewmh.hpp"
#include <string>

namespace blitz {

/**
 * @brief Shows fire progress in the title of an operator panel window.
 *
 * The panel is the first client whose title starts with the configured
 * prefix; its title becomes "prefix: status". Nothing happens when the
 * prefix is empty or no such window exists.
 */
class PanelTitleStatus : public StatusSurface
{
public:
    PanelTitleStatus(Connection& conn, Ewmh& ewmh, std::string title_prefix);

    void set_status(std::string const& text) override;

private:
    Connection& conn_;
    Ewmh& ewmh_;
    std::string prefix_;
    xcb_window_t panel_ = XCB_NONE;

    xcb_window_t find_panel();
};

/// Status surface that only logs; used when no panel is configured.
class LogStatus : public StatusSurface
{
public:
    void set_status(std::string const& text) override;
};

} // namespace blitz
