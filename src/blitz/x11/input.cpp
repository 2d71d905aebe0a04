#include "input.hpp"
#include "blitz/core/log.hpp"
#include <X11/Xlib.h>
#include <cstdlib>
#include <sstream>
#include <xcb/xtest.h>

namespace blitz {

namespace input_policy {

std::optional<Chord> parse_chord(std::string const& text)
{
    if (text.empty() || text.back() == '+')
        return std::nullopt;

    Chord chord;
    std::istringstream stream(text);
    std::string token;
    std::vector<std::string> tokens;

    while (std::getline(stream, token, '+'))
        tokens.push_back(token);

    if (tokens.empty() || tokens.back().empty())
        return std::nullopt;

    chord.key = tokens.back();
    tokens.pop_back();
    for (auto const& mod : tokens)
    {
        if (modifier_keysym_name(mod).empty())
            return std::nullopt;
        chord.modifiers.push_back(mod);
    }
    return chord;
}

std::vector<std::string> split_sequence(std::string const& sequence)
{
    std::vector<std::string> chords;
    std::istringstream stream(sequence);
    std::string chord;
    while (stream >> chord)
        chords.push_back(chord);
    return chords;
}

std::string modifier_keysym_name(std::string const& modifier)
{
    if (modifier == "super")
        return "Super_L";
    if (modifier == "shift")
        return "Shift_L";
    if (modifier == "ctrl" || modifier == "control")
        return "Control_L";
    if (modifier == "alt")
        return "Alt_L";
    return {};
}

} // namespace input_policy

XTestInjector::XTestInjector(Connection& conn, Ewmh& ewmh)
    : conn_(conn)
    , ewmh_(ewmh)
{
    if (!conn_.has_xtest())
        LOG_WARN("XTEST extension missing, synthetic input is disabled");
}

bool XTestInjector::available() { return conn_.has_xtest(); }

std::optional<Point> XTestInjector::pointer()
{
    auto cookie = xcb_query_pointer(conn_.get(), conn_.root());
    auto* reply = xcb_query_pointer_reply(conn_.get(), cookie, nullptr);
    if (!reply)
        return std::nullopt;

    Point position{ reply->root_x, reply->root_y };
    free(reply);
    return position;
}

void XTestInjector::warp(Point root_position)
{
    xcb_warp_pointer(
        conn_.get(),
        XCB_NONE,
        conn_.root(),
        0,
        0,
        0,
        0,
        static_cast<int16_t>(root_position.x),
        static_cast<int16_t>(root_position.y)
    );
    sync();
}

void XTestInjector::activate(xcb_window_t window)
{
    ewmh_.request_active_window(window);
    sync();
}

void XTestInjector::move(xcb_window_t window, int32_t x, int32_t y)
{
    xcb_warp_pointer(conn_.get(), XCB_NONE, window, 0, 0, 0, 0, static_cast<int16_t>(x), static_cast<int16_t>(y));
    sync();
}

void XTestInjector::click(uint8_t button)
{
    if (!available())
        return;
    fake(XCB_BUTTON_PRESS, button);
    fake(XCB_BUTTON_RELEASE, button);
    sync();
}

void XTestInjector::scroll(int ticks)
{
    if (!available())
        return;
    uint8_t button = input_policy::scroll_button(ticks);
    for (int i = 0; i < std::abs(ticks); ++i)
    {
        fake(XCB_BUTTON_PRESS, button);
        fake(XCB_BUTTON_RELEASE, button);
    }
    sync();
}

void XTestInjector::send_keys(xcb_window_t window, std::string const& key_sequence)
{
    if (!available())
        return;

    for (auto const& text : input_policy::split_sequence(key_sequence))
    {
        auto chord = input_policy::parse_chord(text);
        if (!chord)
        {
            LOG_WARN("Ignoring malformed key chord '{}'", text);
            continue;
        }

        auto key = keycode_for(chord->key);
        if (!key)
        {
            LOG_WARN("No keycode for '{}'", chord->key);
            continue;
        }

        std::vector<xcb_keycode_t> modifiers;
        for (auto const& mod : chord->modifiers)
        {
            if (auto code = keycode_for(input_policy::modifier_keysym_name(mod)))
                modifiers.push_back(*code);
        }

        LOG_CHORD(window, text);
        for (auto code : modifiers)
            fake(XCB_KEY_PRESS, code);
        fake(XCB_KEY_PRESS, *key);
        fake(XCB_KEY_RELEASE, *key);
        for (auto it = modifiers.rbegin(); it != modifiers.rend(); ++it)
            fake(XCB_KEY_RELEASE, *it);
        sync();
    }
}

std::optional<xcb_keycode_t> XTestInjector::keycode_for(std::string const& name) const
{
    KeySym sym = XStringToKeysym(name.c_str());
    if (sym == NoSymbol)
        return std::nullopt;

    xcb_keycode_t* codes = xcb_key_symbols_get_keycode(conn_.keysyms(), static_cast<xcb_keysym_t>(sym));
    if (!codes)
        return std::nullopt;

    std::optional<xcb_keycode_t> code;
    if (codes[0] != XCB_NO_SYMBOL)
        code = codes[0];
    free(codes);
    return code;
}

void XTestInjector::fake(uint8_t type, uint8_t detail)
{
    xcb_test_fake_input(conn_.get(), type, detail, XCB_CURRENT_TIME, XCB_NONE, 0, 0, 0);
}

void XTestInjector::sync()
{
    // Round-trip so the server has processed everything before the next step
    auto* reply = xcb_get_input_focus_reply(conn_.get(), xcb_get_input_focus(conn_.get()), nullptr);
    free(reply);
}

} // namespace blitz
