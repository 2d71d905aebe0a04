#include "blitz/stage/readiness.hpp"
#include "fakes.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace blitz;
using namespace std::chrono_literals;

namespace {

ReadinessParams make_params(int expected, std::chrono::milliseconds stable, int attempts)
{
    return ReadinessParams{ expected, 100ms, stable, attempts };
}

} // namespace

TEST_CASE("Readiness waits for the count to settle at its final value", "[readiness]")
{
    test::FakeClock clock;
    test::FakeWindows windows;
    windows.counts = { 0, 2, 5, 5, 5 };
    ReadinessPoller poller(windows, clock.timing());
    WindowPattern pattern("Target");

    auto result = poller.await_stable(pattern, make_params(5, 200ms, 20));

    REQUIRE(result.stable);
    REQUIRE(result.handles.size() == 5);
    REQUIRE(result.shortfall == 0);
    REQUIRE(windows.queries == 5);
}

TEST_CASE("Readiness does not settle on an intermediate count", "[readiness]")
{
    test::FakeClock clock;
    test::FakeWindows windows;
    windows.counts = { 0, 2, 2, 5, 5, 5 };
    ReadinessPoller poller(windows, clock.timing());
    WindowPattern pattern("Target");

    auto result = poller.await_stable(pattern, make_params(5, 200ms, 20));

    REQUIRE(result.stable);
    REQUIRE(result.handles.size() == 5);
    REQUIRE(windows.queries == 6);
}

TEST_CASE("Readiness returns the partial set and shortfall on timeout", "[readiness]")
{
    test::FakeClock clock;
    test::FakeWindows windows;
    windows.counts = { 1, 2, 3, 4 };
    ReadinessPoller poller(windows, clock.timing());
    WindowPattern pattern("Target");

    auto result = poller.await_stable(pattern, make_params(6, 300ms, 4));

    REQUIRE_FALSE(result.stable);
    REQUIRE(result.handles.size() == 4);
    REQUIRE(result.shortfall == 2);
    REQUIRE(windows.queries == 4);
    REQUIRE(clock.slept() == 300ms);
}

TEST_CASE("Readiness never treats an empty set as stable", "[readiness]")
{
    test::FakeClock clock;
    test::FakeWindows windows;
    windows.counts = { 0 };
    ReadinessPoller poller(windows, clock.timing());
    WindowPattern pattern("Target");

    auto result = poller.await_stable(pattern, make_params(3, 100ms, 10));

    REQUIRE_FALSE(result.stable);
    REQUIRE(result.handles.empty());
    REQUIRE(result.shortfall == 3);
    REQUIRE(windows.queries == 10);
}

TEST_CASE("Readiness with nothing expected returns immediately", "[readiness]")
{
    test::FakeClock clock;
    test::FakeWindows windows;
    windows.counts = { 4 };
    ReadinessPoller poller(windows, clock.timing());
    WindowPattern pattern("Target");

    auto result = poller.await_stable(pattern, make_params(0, 3000ms, 300));

    REQUIRE(result.handles.empty());
    REQUIRE(result.shortfall == 0);
    REQUIRE(windows.queries == 0);
    REQUIRE(clock.slept() == 0ms);
}

TEST_CASE("Readiness reports more windows than expected without a shortfall", "[readiness]")
{
    test::FakeClock clock;
    test::FakeWindows windows;
    windows.counts = { 7 };
    ReadinessPoller poller(windows, clock.timing());
    WindowPattern pattern("Target");

    auto result = poller.await_stable(pattern, make_params(5, 100ms, 10));

    REQUIRE(result.stable);
    REQUIRE(result.handles.size() == 7);
    REQUIRE(result.shortfall == 0);
}

TEST_CASE("Recent-window wait filters by the launched processes", "[readiness]")
{
    test::FakeClock clock;
    test::FakeWindows windows;
    windows.counts = { 2 };
    ReadinessPoller poller(windows, clock.timing());
    WindowPattern pattern("Target");
    std::vector<pid_t> pids{ 41, 42 };

    auto result = poller.await_recent(pattern, pids, make_params(2, 100ms, 10));

    REQUIRE(result.stable);
    REQUIRE_FALSE(windows.queried_pids.empty());
    REQUIRE(windows.queried_pids.front() == pids);

    auto none = poller.await_recent(pattern, {}, make_params(2, 100ms, 10));
    REQUIRE(none.handles.empty());
}
