#include "blitz/layout/grid.hpp"
#include "fakes.hpp"
#include <catch2/catch_test_macros.hpp>
#include <map>

using namespace blitz;

namespace {

std::vector<WindowHandle> make_handles(size_t count)
{
    std::vector<WindowHandle> handles;
    for (size_t i = 0; i < count; ++i)
        handles.push_back(WindowHandle{ static_cast<xcb_window_t>(0x100 + i), {}, "Target", 0 });
    return handles;
}

GridParams make_params(int32_t screen_w, int32_t screen_h, int32_t window_w, int32_t window_h)
{
    GridParams params;
    params.screen_width = screen_w;
    params.screen_height = screen_h;
    params.window_width = window_w;
    params.window_height = window_h;
    params.margin = 10;
    params.max_overlap_percent = 25;
    params.vertical_gap = 10;
    return params;
}

} // namespace

TEST_CASE("Grid policy splits seven windows into rows of four and three", "[grid][policy]")
{
    auto handles = make_handles(7);
    GridParams params = make_params(3000, 2000, 800, 600);
    params.max_columns = 4;

    auto plan = grid_policy::plan(handles, params);

    REQUIRE(plan.size() == 7);

    // (2980 - 800) / 3 = 726 between origins
    REQUIRE(plan[0] == Placement{ 0x100, 11, 395 });
    REQUIRE(plan[1] == Placement{ 0x101, 737, 395 });
    REQUIRE(plan[2] == Placement{ 0x102, 1463, 395 });
    REQUIRE(plan[3] == Placement{ 0x103, 2189, 395 });

    // Short last row is centered on its own
    REQUIRE(plan[4] == Placement{ 0x104, 374, 1005 });
    REQUIRE(plan[5] == Placement{ 0x105, 1100, 1005 });
    REQUIRE(plan[6] == Placement{ 0x106, 1826, 1005 });
}

TEST_CASE("Grid policy keeps input order in row-major placement", "[grid][policy]")
{
    auto handles = make_handles(5);
    GridParams params = make_params(3000, 2000, 800, 600);
    params.max_columns = 2;

    auto plan = grid_policy::plan(handles, params);

    REQUIRE(plan.size() == 5);
    for (size_t i = 0; i < plan.size(); ++i)
        REQUIRE(plan[i].window == handles[i].id);
    REQUIRE(plan[0].y == plan[1].y);
    REQUIRE(plan[2].y == plan[0].y + 610);
    REQUIRE(plan[4].y == plan[0].y + 1220);
}

TEST_CASE("Grid policy computes column count from the overlap bound", "[grid][policy]")
{
    GridParams params = make_params(3000, 2000, 800, 600);

    REQUIRE(grid_policy::min_shift(800, 25) == 600);
    REQUIRE(grid_policy::min_shift(800, 100) == 50);
    REQUIRE(grid_policy::min_shift(40, 0) == 50);

    // 800 + 3 * 600 = 2600 <= 2980 < 3200
    REQUIRE(grid_policy::column_count(params) == 4);

    params.max_columns = 2;
    REQUIRE(grid_policy::column_count(params) == 2);

    params.max_columns = 10;
    REQUIRE(grid_policy::column_count(params) == 4);
}

TEST_CASE("Grid policy keeps same-row windows at least the minimum shift apart", "[grid][policy]")
{
    for (int32_t overlap : { 0, 10, 25, 50, 75, 90 })
    {
        for (int32_t width : { 300, 640, 800, 1200 })
        {
            for (size_t count : { 2u, 5u, 9u, 17u })
            {
                auto handles = make_handles(count);
                GridParams params = make_params(2560, 1440, width, 400);
                params.max_overlap_percent = overlap;
                if (grid_policy::column_count(params) <= 1)
                    continue;

                auto plan = grid_policy::plan(handles, params);
                REQUIRE(plan.size() == count);

                std::map<int32_t, std::vector<int32_t>> rows;
                for (auto const& p : plan)
                    rows[p.y].push_back(p.x);

                int32_t bound = width * (100 - overlap) / 100;
                for (auto const& [y, xs] : rows)
                {
                    for (size_t i = 1; i < xs.size(); ++i)
                        REQUIRE(xs[i] - xs[i - 1] >= bound);
                }
            }
        }
    }
}

TEST_CASE("Grid policy is deterministic", "[grid][policy]")
{
    auto handles = make_handles(11);
    GridParams params = make_params(1920, 1080, 500, 300);
    params.max_overlap_percent = 40;

    auto first = grid_policy::plan(handles, params);
    for (int i = 0; i < 5; ++i)
        REQUIRE(grid_policy::plan(handles, params) == first);
}

TEST_CASE("Grid policy returns an empty plan for no windows", "[grid][policy]")
{
    GridParams params = make_params(1920, 1080, 500, 300);
    REQUIRE(grid_policy::plan({}, params).empty());
}

TEST_CASE("Grid policy stacks windows wider than the screen in one column", "[grid][policy]")
{
    auto handles = make_handles(3);
    GridParams params = make_params(1000, 500, 1500, 300);

    REQUIRE(grid_policy::column_count(params) == 1);

    auto plan = grid_policy::plan(handles, params);
    REQUIRE(plan.size() == 3);
    for (auto const& p : plan)
        REQUIRE(p.x == 10);

    // Taller than the screen: clamped to the margin instead of going negative
    REQUIRE(plan[0].y == 10);
    REQUIRE(plan[1].y == 320);
    REQUIRE(plan[2].y == 630);
}

TEST_CASE("Grid policy centers a single window", "[grid][policy]")
{
    auto handles = make_handles(1);
    GridParams params = make_params(1000, 800, 400, 200);

    auto plan = grid_policy::plan(handles, params);

    REQUIRE(plan.size() == 1);
    REQUIRE(plan[0].x == 300);
    REQUIRE(plan[0].y == 300);
}

TEST_CASE("Grid layout offsets by the work area and resizes every window", "[grid]")
{
    test::FakeWindows windows;
    windows.area = Geometry{ 100, 40, 3000, 2000 };
    windows.gone = { 0x102 };

    GridLayout layout(windows);
    GridParams params = make_params(0, 0, 800, 600);
    params.max_columns = 4;

    auto handles = make_handles(3);
    auto plan = layout.plan(handles, params);

    REQUIRE(plan.size() == 3);
    REQUIRE(plan[0].x == 100 + 374);
    REQUIRE(plan[0].y == 40 + 700);

    size_t placed = layout.apply(plan, 800, 600);
    REQUIRE(placed == 2);
    REQUIRE(windows.placed.size() == 2);
    REQUIRE(windows.placed[0].second.width == 800);
    REQUIRE(windows.placed[0].second.height == 600);
    REQUIRE(windows.placed[1].first == 0x101);
}
