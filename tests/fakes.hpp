#pragma once

#include "blitz/core/clock.hpp"
#include "blitz/core/desktop.hpp"
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <set>
#include <string>
#include <vector>

namespace blitz::test {

/// Manual clock: sleeping advances time instantly.
class FakeClock
{
public:
    std::chrono::steady_clock::time_point now() const { return now_; }
    void advance(std::chrono::milliseconds d) { now_ += d; slept_ += d; }
    std::chrono::milliseconds slept() const { return slept_; }

    PollTiming timing()
    {
        return PollTiming{ [this] { return now(); }, [this](std::chrono::milliseconds d) { advance(d); } };
    }

private:
    std::chrono::steady_clock::time_point now_{};
    std::chrono::milliseconds slept_{ 0 };
};

/// Enumerator replaying a scripted count per query; the last count repeats.
class FakeWindows
    : public WindowEnumerator
    , public WindowArranger
{
public:
    std::vector<int> counts{ 0 };
    std::set<xcb_window_t> gone;
    Geometry window_geometry{ 0, 0, 800, 600 };
    Geometry area{ 0, 0, 3000, 2000 };

    size_t queries = 0;
    std::vector<std::vector<pid_t>> queried_pids;
    std::vector<xcb_window_t> geometry_calls;
    std::vector<std::pair<xcb_window_t, Geometry>> placed;
    std::vector<xcb_window_t> closed;

    std::vector<WindowHandle> query(WindowPattern const&, std::span<pid_t const> pids) override
    {
        int count = counts[std::min(queries, counts.size() - 1)];
        ++queries;
        queried_pids.emplace_back(pids.begin(), pids.end());

        std::vector<WindowHandle> handles;
        for (int i = 1; i <= count; ++i)
        {
            auto id = static_cast<xcb_window_t>(i);
            if (!gone.contains(id))
                handles.push_back(WindowHandle{ id, window_geometry, "Target " + std::to_string(i), 0 });
        }
        return handles;
    }

    std::optional<Geometry> geometry(xcb_window_t window) override
    {
        geometry_calls.push_back(window);
        if (gone.contains(window))
            return std::nullopt;
        return window_geometry;
    }

    size_t geometry_calls_for(xcb_window_t window) const
    {
        return static_cast<size_t>(std::ranges::count(geometry_calls, window));
    }

    Geometry screen_area() const override { return area; }

    bool place(xcb_window_t window, Geometry const& geometry) override
    {
        if (gone.contains(window))
            return false;
        placed.emplace_back(window, geometry);
        return true;
    }

    void close(xcb_window_t window) override { closed.push_back(window); }
};

/// Records every injected action as a readable line.
class FakeInput : public InputInjector
{
public:
    Point position{ 5, 7 };
    bool pointer_known = true;
    std::vector<std::string> events;
    std::function<void(xcb_window_t)> on_keys; ///< runs after each recorded key sequence

    std::optional<Point> pointer() override
    {
        if (!pointer_known)
            return std::nullopt;
        return position;
    }

    void warp(Point root_position) override
    {
        position = root_position;
        events.push_back("warp " + std::to_string(root_position.x) + " " + std::to_string(root_position.y));
    }

    void activate(xcb_window_t window) override { events.push_back("activate " + std::to_string(window)); }

    void move(xcb_window_t window, int32_t x, int32_t y) override
    {
        position = Point{ static_cast<int32_t>(window) * 1000 + x, y };
        events.push_back("move " + std::to_string(window) + " " + std::to_string(x) + " " + std::to_string(y));
    }

    void click(uint8_t button) override { events.push_back("click " + std::to_string(button)); }

    void send_keys(xcb_window_t window, std::string const& key_sequence) override
    {
        events.push_back("keys " + std::to_string(window) + " " + key_sequence);
        if (on_keys)
            on_keys(window);
    }

    void scroll(int ticks) override { events.push_back("scroll " + std::to_string(ticks)); }

    size_t count_prefix(std::string const& prefix) const
    {
        return static_cast<size_t>(
            std::ranges::count_if(events, [&](std::string const& e) { return e.starts_with(prefix); })
        );
    }
};

class FakeClipboard : public ClipboardSink
{
public:
    bool available = true;
    std::vector<std::string> texts;

    bool set_text(std::string const& text) override
    {
        if (!available)
            return false;
        texts.push_back(text);
        return true;
    }
};

class FakeStatus : public StatusSurface
{
public:
    std::vector<std::string> lines;
    void set_status(std::string const& text) override { lines.push_back(text); }
};

class FakeLauncher : public WindowLauncher
{
public:
    std::vector<std::string> urls;

    std::optional<pid_t> spawn(std::string const& url) override
    {
        urls.push_back(url);
        return static_cast<pid_t>(100 + urls.size());
    }
};

/// Scratch directory removed on destruction.
class TempDir
{
public:
    TempDir()
    {
        std::string tmpl = (std::filesystem::temp_directory_path() / "blitz-test-XXXXXX").string();
        std::vector<char> buffer(tmpl.begin(), tmpl.end());
        buffer.push_back('\0');
        if (char* made = mkdtemp(buffer.data()))
            path_ = made;
    }

    ~TempDir()
    {
        std::error_code ec;
        if (!path_.empty())
            std::filesystem::remove_all(path_, ec);
    }

    TempDir(TempDir const&) = delete;
    TempDir& operator=(TempDir const&) = delete;

    std::filesystem::path const& path() const { return path_; }
    std::filesystem::path operator/(std::string const& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

inline std::vector<std::string> read_lines(std::filesystem::path const& path)
{
    std::vector<std::string> lines;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line))
        lines.push_back(line);
    return lines;
}

} // namespace blitz::test
