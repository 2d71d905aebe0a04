#include "stager.hpp"
#include "blitz/core/atomic_file.hpp"
#include "blitz/core/log.hpp"
#include "blitz/layout/grid.hpp"
#include "blitz/stage/readiness.hpp"
#include <algorithm>
#include <charconv>
#include <sstream>

namespace blitz {

namespace staging_ledger {

bool write(std::filesystem::path const& path, GridPlan const& plan)
{
    std::string contents;
    for (auto const& placement : plan)
        contents += std::to_string(placement.window) + "\n";
    return atomic_file::write(path, contents);
}

std::optional<std::vector<xcb_window_t>> read(std::filesystem::path const& path)
{
    auto contents = atomic_file::read(path);
    if (!contents)
        return std::nullopt;

    std::vector<xcb_window_t> windows;
    std::istringstream stream(*contents);
    std::string line;
    while (std::getline(stream, line))
    {
        xcb_window_t id = 0;
        auto [ptr, ec] = std::from_chars(line.data(), line.data() + line.size(), id);
        if (ec == std::errc() && id != XCB_NONE)
            windows.push_back(id);
        else if (!line.empty())
            LOG_WARN("Ignoring malformed staging ledger line '{}'", line);
    }
    return windows;
}

} // namespace staging_ledger

Stager::Stager(
    Config const& config,
    WindowEnumerator& windows,
    WindowArranger& arranger,
    WindowLauncher& launcher,
    TargetLedger& ledger,
    PollTiming timing
)
    : config_(config)
    , windows_(windows)
    , arranger_(arranger)
    , launcher_(launcher)
    , ledger_(ledger)
    , timing_(std::move(timing))
{ }

void Stager::wipe(WindowPattern const& pattern)
{
    auto existing = windows_.query(pattern, {});
    if (existing.empty())
        return;

    LOG_INFO("Wiping {} existing windows", existing.size());
    for (auto const& handle : existing)
        arranger_.close(handle.id);

    auto interval = to_millis(config_.stage.poll_interval);
    for (int attempt = 0; attempt < config_.stage.max_attempts; ++attempt)
    {
        if (windows_.query(pattern, {}).empty())
            return;
        timing_.sleep(interval);
    }
    LOG_WARN("Some windows survived the wipe");
}

void Stager::ensure_target_records(std::vector<std::string> const& urls)
{
    std::optional<std::string> header;
    if (urls.size() == 1)
        header = "# target: " + urls.front();

    for (auto const& url : urls)
        ledger_.ensure_exists(url, header);
}

StageReport Stager::run()
{
    StageReport report;
    auto const& stage = config_.stage;

    WindowPattern pattern(stage.window_pattern);
    std::vector<std::string> urls = resolve_urls(config_.targets.url, config_.paths.config_dir);

    if (stage.wipe)
        wipe(pattern);

    int already_open = static_cast<int>(windows_.query(pattern, {}).size());
    int to_launch = urls.empty() ? 0 : stage.count;

    std::vector<pid_t> launched;
    for (int i = 0; i < to_launch; ++i)
    {
        auto const& url = urls[static_cast<size_t>(i) % urls.size()];
        if (auto pid = launcher_.spawn(url))
            launched.push_back(*pid);
        if (i + 1 < to_launch)
            timing_.sleep(to_millis(stage.launch_delay));
    }

    ReadinessPoller poller(windows_, timing_);

    // The last few launched processes must actually show a window
    int recent = std::min(static_cast<int>(launched.size()), stage.recent_windows);
    if (recent > 0)
    {
        std::span<pid_t const> recent_pids(launched.data() + launched.size() - recent, static_cast<size_t>(recent));
        auto waited = poller.await_recent(
            pattern,
            recent_pids,
            ReadinessParams{ recent, to_millis(stage.poll_interval), to_millis(stage.stable_seconds), stage.recent_max_attempts }
        );
        if (waited.shortfall > 0)
            LOG_WARN("{} of the last {} launched windows did not appear", waited.shortfall, recent);
    }

    report.requested = already_open + static_cast<int>(launched.size());
    auto ready = poller.await_stable(
        pattern,
        ReadinessParams{ report.requested, to_millis(stage.poll_interval), to_millis(stage.stable_seconds), stage.max_attempts }
    );

    report.ready = static_cast<int>(ready.handles.size());
    report.shortfall = ready.shortfall;
    if (ready.handles.empty())
    {
        LOG_ERROR("No windows matching '{}' found, staging aborted", pattern.source());
        report.aborted = true;
        return report;
    }

    GridParams params;
    params.window_width = stage.window_width;
    params.window_height = stage.window_height;
    params.margin = stage.margin;
    params.max_overlap_percent = stage.max_overlap_percent;
    if (stage.max_columns > 0)
        params.max_columns = stage.max_columns;
    params.vertical_gap = stage.vertical_gap;

    GridLayout layout(arranger_);
    GridPlan plan = layout.plan(ready.handles, params);
    report.placed = static_cast<int>(layout.apply(plan, stage.window_width, stage.window_height));

    if (!staging_ledger::write(stage.ledger, plan))
    {
        LOG_ERROR("Failed to write staging ledger {}", stage.ledger.string());
        report.ledger_failed = true;
    }

    ensure_target_records(urls);

    if (report.shortfall > 0)
        LOG_WARN("Staged {} of {} windows", report.ready, report.requested);
    else
        LOG_INFO("Staged {} windows", report.ready);
    return report;
}

} // namespace blitz
