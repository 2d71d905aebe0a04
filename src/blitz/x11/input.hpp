#pragma once

#include "blitz/core/connection.hpp"
#include "blitz/core/desktop.hpp"
#include "blitz/core/ewmh.hpp"
#include <optional>
#include <string>
#include <vector>

namespace blitz {

namespace input_policy {

/// "ctrl+shift+a": modifiers in order, then the key name.
struct Chord
{
    std::vector<std::string> modifiers;
    std::string key;
};

std::optional<Chord> parse_chord(std::string const& text);

/// Splits a space separated chord sequence.
std::vector<std::string> split_sequence(std::string const& sequence);

/// Keysym name for a modifier token, empty if unknown.
std::string modifier_keysym_name(std::string const& modifier);

/// X button for a scroll direction.
inline uint8_t scroll_button(int ticks) { return ticks >= 0 ? 4 : 5; }

} // namespace input_policy

/// Synthetic pointer and keyboard input through the XTEST extension.
class XTestInjector : public InputInjector
{
public:
    XTestInjector(Connection& conn, Ewmh& ewmh);

    std::optional<Point> pointer() override;
    void warp(Point root_position) override;
    void activate(xcb_window_t window) override;
    void move(xcb_window_t window, int32_t x, int32_t y) override;
    void click(uint8_t button) override;
    void send_keys(xcb_window_t window, std::string const& key_sequence) override;
    void scroll(int ticks) override;

private:
    Connection& conn_;
    Ewmh& ewmh_;

    bool available();
    std::optional<xcb_keycode_t> keycode_for(std::string const& name) const;
    void fake(uint8_t type, uint8_t detail);
    void sync();
};

} // namespace blitz
