#include "grid.hpp"
#include "blitz/core/log.hpp"
#include <algorithm>

namespace blitz {

namespace grid_policy {

int32_t min_shift(int32_t window_width, int32_t max_overlap_percent)
{
    return std::max<int32_t>(50, window_width * (100 - max_overlap_percent) / 100);
}

int32_t column_count(GridParams const& params)
{
    int32_t available_width = params.screen_width - 2 * params.margin;
    int32_t shift = min_shift(params.window_width, params.max_overlap_percent);

    int32_t columns = 1;
    while (params.window_width + columns * shift <= available_width)
        ++columns;

    if (params.max_columns && *params.max_columns > 0)
        columns = std::min(columns, *params.max_columns);
    return columns;
}

GridPlan plan(std::span<WindowHandle const> handles, GridParams const& params)
{
    GridPlan result;
    if (handles.empty())
        return result;

    int32_t const count = static_cast<int32_t>(handles.size());
    int32_t const available_width = params.screen_width - 2 * params.margin;
    int32_t const available_height = params.screen_height - 2 * params.margin;

    int32_t const columns = column_count(params);
    int32_t const rows = (count + columns - 1) / columns;

    int32_t const step_x = columns > 1 ? (available_width - params.window_width) / (columns - 1) : 0;
    int32_t const step_y = params.window_height + params.vertical_gap;

    int32_t const total_height = (rows - 1) * step_y + params.window_height;
    int32_t const start_y = std::max(params.margin, params.margin + (available_height - total_height) / 2);

    result.reserve(handles.size());
    for (int32_t row = 0; row < rows; ++row)
    {
        int32_t const first = row * columns;
        int32_t const in_row = std::min(columns, count - first);
        int32_t const row_span = (in_row - 1) * step_x + params.window_width;
        int32_t const start_x = std::max(params.margin, params.margin + (available_width - row_span) / 2);
        int32_t const y = start_y + row * step_y;

        for (int32_t col = 0; col < in_row; ++col)
        {
            result.push_back({ handles[first + col].id, start_x + col * step_x, y });
        }
    }
    return result;
}

} // namespace grid_policy

GridLayout::GridLayout(WindowArranger& arranger)
    : arranger_(arranger)
{ }

GridPlan GridLayout::plan(std::span<WindowHandle const> handles, GridParams params) const
{
    Geometry area = arranger_.screen_area();
    params.screen_width = area.width;
    params.screen_height = area.height;

    GridPlan result = grid_policy::plan(handles, params);
    for (auto& placement : result)
    {
        placement.x += area.x;
        placement.y += area.y;
    }

    LOG_DEBUG(
        "Grid: {} windows, {} columns on {}x{}+{}+{}",
        handles.size(),
        handles.empty() ? 0 : grid_policy::column_count(params),
        area.width,
        area.height,
        area.x,
        area.y
    );
    return result;
}

size_t GridLayout::apply(GridPlan const& plan, int32_t window_width, int32_t window_height)
{
    size_t placed = 0;
    for (auto const& placement : plan)
    {
        Geometry target{ static_cast<int16_t>(placement.x),
                         static_cast<int16_t>(placement.y),
                         static_cast<uint16_t>(window_width),
                         static_cast<uint16_t>(window_height) };
        if (arranger_.place(placement.window, target))
        {
            ++placed;
            LOG_TRACE("Placed {:#x} at {},{}", placement.window, placement.x, placement.y);
        }
        else
        {
            LOG_WARN("Window {:#x} vanished before it could be placed", placement.window);
        }
    }
    return placed;
}

} // namespace blitz
