#pragma once

#include "connection.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <vector>
#include <xcb/xcb_ewmh.h>

namespace blitz {

/**
 * @brief Client-side view of the running window manager's EWMH state.
 *
 * Reads the root client list and per-window properties, and sends the
 * request messages (activate, move/resize, close) a pager would send.
 * When no EWMH window manager is running, reads fall back to the root
 * window's children and requests fall back to direct configure calls.
 */
class Ewmh
{
public:
    explicit Ewmh(Connection& conn);
    ~Ewmh();

    Ewmh(Ewmh const&) = delete;
    Ewmh& operator=(Ewmh const&) = delete;

    bool has_window_manager() const;

    // Reads
    std::vector<xcb_window_t> client_list() const;
    std::string window_name(xcb_window_t window) const;
    std::optional<uint32_t> window_pid(xcb_window_t window) const;
    std::optional<Geometry> window_geometry(xcb_window_t window) const;
    std::optional<xcb_window_t> find_window_by_title_prefix(std::string const& prefix) const;

    // Requests
    void request_active_window(xcb_window_t window);
    void request_moveresize(xcb_window_t window, Geometry const& geometry);
    void request_close(xcb_window_t window);
    void set_window_name(xcb_window_t window, std::string const& name);

    xcb_ewmh_connection_t* get() { return &ewmh_; }
    xcb_ewmh_connection_t* get() const { return &ewmh_; }

private:
    Connection& conn_;
    mutable xcb_ewmh_connection_t ewmh_; // mutable: XCB EWMH API isn't const-correct

    std::vector<xcb_window_t> viewable_root_children() const;
};

} // namespace blitz
