#include "connection.hpp"
#include <cstdlib>
#include <stdexcept>
#include <xcb/xtest.h>

namespace blitz {

Connection::Connection()
    : conn_(xcb_connect(nullptr, nullptr), xcb_disconnect)
    , screen_(nullptr)
    , keysyms_(nullptr, xcb_key_symbols_free)
{
    if (xcb_connection_has_error(conn_.get()))
    {
        throw std::runtime_error("Failed to connect to X server");
    }

    screen_ = xcb_setup_roots_iterator(xcb_get_setup(conn_.get())).data;
    if (!screen_)
    {
        throw std::runtime_error("Failed to get screen");
    }

    keysyms_.reset(xcb_key_symbols_alloc(conn_.get()));
    if (!keysyms_)
    {
        throw std::runtime_error("Failed to allocate key symbols");
    }

    init_xtest();
}

void Connection::init_xtest()
{
    auto ext_cookie = xcb_query_extension(conn_.get(), 5, "XTEST");
    auto* ext_reply = xcb_query_extension_reply(conn_.get(), ext_cookie, nullptr);
    if (!ext_reply)
        return;

    bool present = ext_reply->present;
    free(ext_reply);
    if (!present)
        return;

    auto cookie = xcb_test_get_version(conn_.get(), XCB_TEST_MAJOR_VERSION, XCB_TEST_MINOR_VERSION);
    auto* reply = xcb_test_get_version_reply(conn_.get(), cookie, nullptr);
    if (!reply)
        return;

    free(reply);
    xtest_available_ = true;
}

} // namespace blitz
