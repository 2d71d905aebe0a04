#include "ewmh.hpp"
#include <cstdlib>
#include <stdexcept>
#include <xcb/xcb_icccm.h>

namespace blitz {

Ewmh::Ewmh(Connection& conn)
    : conn_(conn)
{
    xcb_intern_atom_cookie_t* cookies = xcb_ewmh_init_atoms(conn_.get(), &ewmh_);
    if (!xcb_ewmh_init_atoms_replies(&ewmh_, cookies, nullptr))
    {
        throw std::runtime_error("Failed to initialize EWMH atoms");
    }
}

Ewmh::~Ewmh()
{
    xcb_ewmh_connection_wipe(&ewmh_);
}

bool Ewmh::has_window_manager() const
{
    xcb_window_t check = XCB_NONE;
    auto cookie = xcb_ewmh_get_supporting_wm_check(&ewmh_, conn_.root());
    return xcb_ewmh_get_supporting_wm_check_reply(&ewmh_, cookie, &check, nullptr) && check != XCB_NONE;
}

std::vector<xcb_window_t> Ewmh::client_list() const
{
    xcb_ewmh_get_windows_reply_t list;
    auto cookie = xcb_ewmh_get_client_list(&ewmh_, 0);
    if (!xcb_ewmh_get_client_list_reply(&ewmh_, cookie, &list, nullptr))
    {
        return viewable_root_children();
    }

    std::vector<xcb_window_t> windows(list.windows, list.windows + list.windows_len);
    xcb_ewmh_get_windows_reply_wipe(&list);
    return windows;
}

std::vector<xcb_window_t> Ewmh::viewable_root_children() const
{
    std::vector<xcb_window_t> result;

    auto cookie = xcb_query_tree(conn_.get(), conn_.root());
    auto* reply = xcb_query_tree_reply(conn_.get(), cookie, nullptr);
    if (!reply)
        return result;

    int length = xcb_query_tree_children_length(reply);
    xcb_window_t* children = xcb_query_tree_children(reply);

    for (int i = 0; i < length; ++i)
    {
        xcb_window_t window = children[i];
        auto attr_cookie = xcb_get_window_attributes(conn_.get(), window);
        auto* attr_reply = xcb_get_window_attributes_reply(conn_.get(), attr_cookie, nullptr);
        if (!attr_reply)
            continue;

        bool is_viewable = attr_reply->map_state == XCB_MAP_STATE_VIEWABLE;
        bool override_redirect = attr_reply->override_redirect;
        free(attr_reply);

        if (is_viewable && !override_redirect)
            result.push_back(window);
    }

    free(reply);
    return result;
}

std::string Ewmh::window_name(xcb_window_t window) const
{
    xcb_ewmh_get_utf8_strings_reply_t utf8;
    auto cookie = xcb_ewmh_get_wm_name(&ewmh_, window);
    if (xcb_ewmh_get_wm_name_reply(&ewmh_, cookie, &utf8, nullptr))
    {
        std::string name(utf8.strings, utf8.strings_len);
        xcb_ewmh_get_utf8_strings_reply_wipe(&utf8);
        if (!name.empty())
            return name;
    }

    xcb_icccm_get_text_property_reply_t prop;
    auto icccm_cookie = xcb_icccm_get_wm_name(conn_.get(), window);
    if (xcb_icccm_get_wm_name_reply(conn_.get(), icccm_cookie, &prop, nullptr))
    {
        std::string name(prop.name, prop.name_len);
        xcb_icccm_get_text_property_reply_wipe(&prop);
        return name;
    }

    return "";
}

std::optional<uint32_t> Ewmh::window_pid(xcb_window_t window) const
{
    uint32_t pid = 0;
    auto cookie = xcb_ewmh_get_wm_pid(&ewmh_, window);
    if (!xcb_ewmh_get_wm_pid_reply(&ewmh_, cookie, &pid, nullptr))
        return std::nullopt;
    return pid;
}

std::optional<Geometry> Ewmh::window_geometry(xcb_window_t window) const
{
    auto geom_cookie = xcb_get_geometry(conn_.get(), window);
    auto* geom = xcb_get_geometry_reply(conn_.get(), geom_cookie, nullptr);
    if (!geom)
        return std::nullopt;

    Geometry result;
    result.width = geom->width;
    result.height = geom->height;
    free(geom);

    // Reparenting window managers put the client inside a frame, so ask the
    // server where the client's origin sits on the root window.
    auto tr_cookie = xcb_translate_coordinates(conn_.get(), window, conn_.root(), 0, 0);
    auto* tr = xcb_translate_coordinates_reply(conn_.get(), tr_cookie, nullptr);
    if (!tr)
        return std::nullopt;

    result.x = tr->dst_x;
    result.y = tr->dst_y;
    free(tr);
    return result;
}

std::optional<xcb_window_t> Ewmh::find_window_by_title_prefix(std::string const& prefix) const
{
    for (xcb_window_t window : client_list())
    {
        if (window_name(window).starts_with(prefix))
            return window;
    }
    return std::nullopt;
}

void Ewmh::request_active_window(xcb_window_t window)
{
    if (has_window_manager())
    {
        xcb_ewmh_request_change_active_window(
            &ewmh_,
            0,
            window,
            XCB_EWMH_CLIENT_SOURCE_TYPE_OTHER,
            XCB_CURRENT_TIME,
            XCB_NONE
        );
    }
    else
    {
        uint32_t stack_mode = XCB_STACK_MODE_ABOVE;
        xcb_configure_window(conn_.get(), window, XCB_CONFIG_WINDOW_STACK_MODE, &stack_mode);
        xcb_set_input_focus(conn_.get(), XCB_INPUT_FOCUS_POINTER_ROOT, window, XCB_CURRENT_TIME);
    }
    conn_.flush();
}

void Ewmh::request_moveresize(xcb_window_t window, Geometry const& geometry)
{
    if (has_window_manager())
    {
        auto flags = static_cast<xcb_ewmh_moveresize_window_opt_flags_t>(
            XCB_EWMH_MOVERESIZE_WINDOW_X | XCB_EWMH_MOVERESIZE_WINDOW_Y | XCB_EWMH_MOVERESIZE_WINDOW_WIDTH
            | XCB_EWMH_MOVERESIZE_WINDOW_HEIGHT
        );
        xcb_ewmh_request_moveresize_window(
            &ewmh_,
            0,
            window,
            XCB_GRAVITY_NORTH_WEST,
            XCB_EWMH_CLIENT_SOURCE_TYPE_OTHER,
            flags,
            static_cast<uint32_t>(geometry.x),
            static_cast<uint32_t>(geometry.y),
            geometry.width,
            geometry.height
        );
    }
    else
    {
        uint32_t values[] = {
            static_cast<uint32_t>(geometry.x),
            static_cast<uint32_t>(geometry.y),
            geometry.width,
            geometry.height,
        };
        xcb_configure_window(
            conn_.get(),
            window,
            XCB_CONFIG_WINDOW_X | XCB_CONFIG_WINDOW_Y | XCB_CONFIG_WINDOW_WIDTH | XCB_CONFIG_WINDOW_HEIGHT,
            values
        );
    }
    conn_.flush();
}

void Ewmh::request_close(xcb_window_t window)
{
    if (has_window_manager())
    {
        xcb_ewmh_request_close_window(&ewmh_, 0, window, XCB_CURRENT_TIME, XCB_EWMH_CLIENT_SOURCE_TYPE_OTHER);
    }
    else
    {
        xcb_kill_client(conn_.get(), window);
    }
    conn_.flush();
}

void Ewmh::set_window_name(xcb_window_t window, std::string const& name)
{
    xcb_ewmh_set_wm_name(&ewmh_, window, name.length(), name.c_str());
    xcb_icccm_set_wm_name(conn_.get(), window, XCB_ATOM_STRING, 8, name.length(), name.c_str());
    conn_.flush();
}

} // namespace blitz
