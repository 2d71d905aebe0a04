#pragma once

#include "blitz/core/connection.hpp"
#include "blitz/core/desktop.hpp"
#include "blitz/core/ewmh.hpp"

namespace blitz {

/// Enumerates and arranges top-level windows through the running window manager.
class X11Windows
    : public WindowEnumerator
    , public WindowArranger
{
public:
    X11Windows(Connection& conn, Ewmh& ewmh);

    std::vector<WindowHandle> query(WindowPattern const& pattern, std::span<pid_t const> pids) override;
    std::optional<Geometry> geometry(xcb_window_t window) override;

    /// _NET_WORKAREA of the first desktop, or the whole screen without a WM.
    Geometry screen_area() const override;
    bool place(xcb_window_t window, Geometry const& geometry) override;
    void close(xcb_window_t window) override;

private:
    Connection& conn_;
    Ewmh& ewmh_;
};

} // namespace blitz
