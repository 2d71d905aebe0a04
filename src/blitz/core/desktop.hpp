#pragma once

#include "blitz/core/types.hpp"
#include "blitz/core/window_pattern.hpp"
#include <optional>
#include <span>
#include <string>
#include <sys/types.h>
#include <vector>

namespace blitz {

// Narrow seams to the desktop. The core only talks to these; the X11 and
// process backends live behind them and tests substitute fakes.

class WindowEnumerator
{
public:
    virtual ~WindowEnumerator() = default;

    /// Live windows whose title matches, in client-list order. A non-empty
    /// pid list restricts the result to windows owned by those processes.
    /// May under-report while windows are still mapping.
    virtual std::vector<WindowHandle> query(WindowPattern const& pattern, std::span<pid_t const> pids) = 0;

    /// Current geometry in root coordinates, nullopt once the window is gone.
    virtual std::optional<Geometry> geometry(xcb_window_t window) = 0;
};

class WindowArranger
{
public:
    virtual ~WindowArranger() = default;

    virtual Geometry screen_area() const = 0;
    virtual bool place(xcb_window_t window, Geometry const& geometry) = 0;
    virtual void close(xcb_window_t window) = 0;
};

class WindowLauncher
{
public:
    virtual ~WindowLauncher() = default;

    /// Start a process that will (eventually) open a window on url.
    virtual std::optional<pid_t> spawn(std::string const& url) = 0;
};

/// Synthetic input. Fire-and-forget: nothing here confirms delivery.
class InputInjector
{
public:
    virtual ~InputInjector() = default;

    /// Root position of the pointer, nullopt when the server cannot report it.
    virtual std::optional<Point> pointer() = 0;
    virtual void warp(Point root_position) = 0;
    virtual void activate(xcb_window_t window) = 0;
    virtual void move(xcb_window_t window, int32_t x, int32_t y) = 0;
    virtual void click(uint8_t button) = 0;
    /// Space separated chords, e.g. "ctrl+a ctrl+v Return".
    virtual void send_keys(xcb_window_t window, std::string const& key_sequence) = 0;
    /// Positive ticks scroll up, negative down.
    virtual void scroll(int ticks) = 0;
};

class ClipboardSink
{
public:
    virtual ~ClipboardSink() = default;
    virtual bool set_text(std::string const& text) = 0;
};

class StatusSurface
{
public:
    virtual ~StatusSurface() = default;
    virtual void set_status(std::string const& text) = 0;
};

} // namespace blitz
