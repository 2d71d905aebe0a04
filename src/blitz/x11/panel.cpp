#include "panel.hpp"
#include "blitz/core/log.hpp"

namespace blitz {

PanelTitleStatus::PanelTitleStatus(Connection& conn, Ewmh& ewmh, std::string title_prefix)
    : conn_(conn)
    , ewmh_(ewmh)
    , prefix_(std::move(title_prefix))
{ }

xcb_window_t PanelTitleStatus::find_panel()
{
    if (panel_ != XCB_NONE && ewmh_.window_geometry(panel_))
        return panel_;

    panel_ = ewmh_.find_window_by_title_prefix(prefix_).value_or(XCB_NONE);
    return panel_;
}

void PanelTitleStatus::set_status(std::string const& text)
{
    LOG_DEBUG("Status: {}", text);
    if (prefix_.empty())
        return;

    xcb_window_t panel = find_panel();
    if (panel == XCB_NONE)
        return;

    ewmh_.set_window_name(panel, prefix_ + ": " + text);
    conn_.flush();
}

void LogStatus::set_status(std::string const& text) { LOG_DEBUG("Status: {}", text); }

} // namespace blitz
