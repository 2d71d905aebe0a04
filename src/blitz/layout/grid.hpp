#pragma once

#include "blitz/core/desktop.hpp"
#include "blitz/core/types.hpp"
#include <optional>
#include <span>

namespace blitz {

struct GridParams
{
    int32_t screen_width = 0;
    int32_t screen_height = 0;
    int32_t window_width = 0;
    int32_t window_height = 0;
    int32_t margin = 10;
    int32_t max_overlap_percent = 25;
    std::optional<int32_t> max_columns; // hard cap, nullopt = none
    int32_t vertical_gap = 10;
};

namespace grid_policy {

/// Minimum horizontal distance between neighbouring window origins.
int32_t min_shift(int32_t window_width, int32_t max_overlap_percent);

/// Largest column count whose tightest packing still fits the available width.
int32_t column_count(GridParams const& params);

/**
 * @brief Centered, overlap-bounded grid over the given windows.
 *
 * Windows fill rows left to right in input order. Every row is centered on
 * its own; rows advance by window height plus a fixed gap, and the block of
 * rows is centered vertically (never above the margin). Pure: equal input
 * gives equal output.
 */
GridPlan plan(std::span<WindowHandle const> handles, GridParams const& params);

} // namespace grid_policy

/// Applies a GridPlan through the desktop arranger, resizing every window.
class GridLayout
{
public:
    explicit GridLayout(WindowArranger& arranger);

    /// Plans against the arranger's usable screen area.
    GridPlan plan(std::span<WindowHandle const> handles, GridParams params) const;

    /// Returns the number of windows that accepted the move.
    size_t apply(GridPlan const& plan, int32_t window_width, int32_t window_height);

private:
    WindowArranger& arranger_;
};

} // namespace blitz
