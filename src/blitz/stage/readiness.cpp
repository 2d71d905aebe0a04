#include "readiness.hpp"
#include "blitz/core/log.hpp"
#include <algorithm>

namespace blitz {

ReadinessPoller::ReadinessPoller(WindowEnumerator& enumerator, PollTiming timing)
    : enumerator_(enumerator)
    , timing_(std::move(timing))
{ }

ReadinessResult ReadinessPoller::await_stable(WindowPattern const& pattern, ReadinessParams const& params)
{
    return poll(pattern, {}, params);
}

ReadinessResult
ReadinessPoller::await_recent(WindowPattern const& pattern, std::span<pid_t const> pids, ReadinessParams const& params)
{
    if (pids.empty())
        return {};
    return poll(pattern, pids, params);
}

ReadinessResult
ReadinessPoller::poll(WindowPattern const& pattern, std::span<pid_t const> pids, ReadinessParams const& params)
{
    ReadinessResult result;
    if (params.expected <= 0)
        return result;

    size_t last_total = 0;
    bool seen = false;
    auto stable_since = timing_.now();

    for (int attempt = 0; attempt < params.max_attempts; ++attempt)
    {
        if (attempt > 0)
            timing_.sleep(params.poll_interval);

        result.handles = enumerator_.query(pattern, pids);
        size_t total = result.handles.size();
        auto now = timing_.now();

        if (!seen || total != last_total)
        {
            LOG_DEBUG("Readiness poll {}: {} of {} windows", attempt, total, params.expected);
            last_total = total;
            stable_since = now;
            seen = true;
            continue;
        }

        if (total > 0 && now - stable_since >= params.stable_duration)
        {
            result.stable = true;
            break;
        }
    }

    result.shortfall = std::max(0, params.expected - static_cast<int>(result.handles.size()));
    if (!result.stable)
    {
        LOG_WARN(
            "Window count did not settle after {} polls ({} of {} found)",
            params.max_attempts,
            result.handles.size(),
            params.expected
        );
    }
    return result;
}

} // namespace blitz
