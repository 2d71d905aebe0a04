#pragma once

#include "blitz/config/config.hpp"
#include "blitz/core/clock.hpp"
#include "blitz/core/desktop.hpp"
#include "blitz/fire/ledger.hpp"
#include <filesystem>
#include <optional>
#include <vector>

namespace blitz {

namespace staging_ledger {

/// One decimal window id per line, in placement order. Replaces the previous file.
bool write(std::filesystem::path const& path, GridPlan const& plan);

/// Window ids of the last successful stage; nullopt when there is none.
std::optional<std::vector<xcb_window_t>> read(std::filesystem::path const& path);

} // namespace staging_ledger

struct StageReport
{
    int requested = 0; ///< windows expected (launched plus already open)
    int ready = 0;     ///< windows confirmed by the readiness poller
    int shortfall = 0;
    int placed = 0;
    bool aborted = false; ///< nothing was ready; no ledger was written
    bool ledger_failed = false; ///< windows were arranged but the staging ledger was not saved
};

/**
 * @brief Stage operation: open the target windows and lay them out in a grid.
 *
 * Optionally wipes matching windows first, launches the requested count
 * cycling over the URLs, waits for the set to settle and places every ready
 * window. The staging ledger is only replaced when at least one window is
 * ready.
 */
class Stager
{
public:
    Stager(
        Config const& config,
        WindowEnumerator& windows,
        WindowArranger& arranger,
        WindowLauncher& launcher,
        TargetLedger& ledger,
        PollTiming timing = PollTiming::system()
    );

    StageReport run();

private:
    Config const& config_;
    WindowEnumerator& windows_;
    WindowArranger& arranger_;
    WindowLauncher& launcher_;
    TargetLedger& ledger_;
    PollTiming timing_;

    void wipe(WindowPattern const& pattern);
    void ensure_target_records(std::vector<std::string> const& urls);
};

} // namespace blitz
