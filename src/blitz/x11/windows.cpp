#include "windows.hpp"
#include "blitz/core/log.hpp"
#include <algorithm>

namespace blitz {

X11Windows::X11Windows(Connection& conn, Ewmh& ewmh)
    : conn_(conn)
    , ewmh_(ewmh)
{ }

std::vector<WindowHandle> X11Windows::query(WindowPattern const& pattern, std::span<pid_t const> pids)
{
    std::vector<WindowHandle> result;

    for (xcb_window_t window : ewmh_.client_list())
    {
        std::string title = ewmh_.window_name(window);
        if (!pattern.matches(title))
            continue;

        uint32_t pid = ewmh_.window_pid(window).value_or(0);
        if (!pids.empty() && std::ranges::find(pids, static_cast<pid_t>(pid)) == pids.end())
            continue;

        // Unmapped or destroyed between the list read and now
        auto geometry = ewmh_.window_geometry(window);
        if (!geometry)
            continue;

        result.push_back(WindowHandle{ window, *geometry, std::move(title), pid });
    }

    return result;
}

std::optional<Geometry> X11Windows::geometry(xcb_window_t window) { return ewmh_.window_geometry(window); }

Geometry X11Windows::screen_area() const
{
    xcb_screen_t* screen = conn_.screen();
    Geometry area{ 0, 0, screen->width_in_pixels, screen->height_in_pixels };

    if (!ewmh_.has_window_manager())
        return area;

    xcb_ewmh_get_workarea_reply_t workarea;
    auto cookie = xcb_ewmh_get_workarea(ewmh_.get(), 0);
    if (xcb_ewmh_get_workarea_reply(ewmh_.get(), cookie, &workarea, nullptr))
    {
        if (workarea.workarea_len > 0 && workarea.workarea[0].width > 0 && workarea.workarea[0].height > 0)
        {
            auto const& wa = workarea.workarea[0];
            area = Geometry{ static_cast<int16_t>(wa.x),
                             static_cast<int16_t>(wa.y),
                             static_cast<uint16_t>(wa.width),
                             static_cast<uint16_t>(wa.height) };
        }
        xcb_ewmh_get_workarea_reply_wipe(&workarea);
    }
    return area;
}

bool X11Windows::place(xcb_window_t window, Geometry const& geometry)
{
    if (!ewmh_.window_geometry(window))
        return false;

    ewmh_.request_moveresize(window, geometry);
    conn_.flush();
    return true;
}

void X11Windows::close(xcb_window_t window)
{
    LOG_DEBUG("Closing window {:#x}", window);
    ewmh_.request_close(window);
    conn_.flush();
}

} // namespace blitz
