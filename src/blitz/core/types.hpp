#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <xcb/xcb.h>

namespace blitz {

// ─────────────────────────────────────────────────────────────────────────────
// Basic geometry types
// ─────────────────────────────────────────────────────────────────────────────

struct Geometry
{
    int16_t x = 0;
    int16_t y = 0;
    uint16_t width = 0;
    uint16_t height = 0;
};

struct Point
{
    int32_t x = 0;
    int32_t y = 0;

    bool operator==(Point const&) const = default;
};

// ─────────────────────────────────────────────────────────────────────────────
// Window records
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief A live top-level window owned by the external window system.
 *
 * Only referenced, never owned: the window may disappear between any two
 * calls, so every consumer must tolerate a handle that no longer resolves.
 */
struct WindowHandle
{
    xcb_window_t id = XCB_NONE;
    Geometry geometry;
    std::string title;
    uint32_t pid = 0; ///< _NET_WM_PID, 0 when the client does not set it

    bool operator==(WindowHandle const& other) const { return id == other.id; }
};

/// One grid assignment: the window and the top-left corner it is moved to.
struct Placement
{
    xcb_window_t window = XCB_NONE;
    int32_t x = 0;
    int32_t y = 0;

    bool operator==(Placement const&) const = default;
};

/// Row-major ordered placements, one per ready window.
using GridPlan = std::vector<Placement>;

// ─────────────────────────────────────────────────────────────────────────────
// Fire session state
// ─────────────────────────────────────────────────────────────────────────────

enum class FireMode
{
    Safe,
    Semi,
    Auto,
    Stopping
};

inline std::string_view to_string(FireMode mode)
{
    switch (mode)
    {
        case FireMode::Safe:
            return "safe";
        case FireMode::Semi:
            return "semi";
        case FireMode::Auto:
            return "auto";
        case FireMode::Stopping:
            return "stopping";
    }
    return "safe";
}

inline std::optional<FireMode> parse_fire_mode(std::string_view text)
{
    if (text == "safe")
        return FireMode::Safe;
    if (text == "semi")
        return FireMode::Semi;
    if (text == "auto")
        return FireMode::Auto;
    if (text == "stopping")
        return FireMode::Stopping;
    return std::nullopt;
}

/// Injection anchor measured from one window edge: pixels, or percent of the extent.
struct Anchor
{
    int32_t value = 0;
    bool percent = false;

    int32_t resolve(int32_t extent) const { return percent ? extent * value / 100 : value; }
};

} // namespace blitz
