#pragma once

#include "blitz/core/clock.hpp"
#include "blitz/core/desktop.hpp"
#include <chrono>
#include <span>
#include <vector>

namespace blitz {

struct ReadinessResult
{
    std::vector<WindowHandle> handles; ///< last observed set
    int shortfall = 0;                 ///< expected minus observed, never negative
    bool stable = false;               ///< false when max_attempts ran out first
};

struct ReadinessParams
{
    int expected = 0;
    std::chrono::milliseconds poll_interval{ 100 };
    std::chrono::milliseconds stable_duration{ 3000 };
    int max_attempts = 300;
};

/**
 * @brief Waits for the set of matching windows to stop changing.
 *
 * Polls the enumerator and restarts the stability timer whenever the
 * observed count changes. Once a non-zero count has held for
 * stable_duration the set is returned. Running out of attempts is not an
 * error: the last observed set is returned together with the shortfall.
 */
class ReadinessPoller
{
public:
    explicit ReadinessPoller(WindowEnumerator& enumerator, PollTiming timing = PollTiming::system());

    ReadinessResult await_stable(WindowPattern const& pattern, ReadinessParams const& params);

    /// Same rule restricted to windows owned by the given processes.
    ReadinessResult
    await_recent(WindowPattern const& pattern, std::span<pid_t const> pids, ReadinessParams const& params);

private:
    WindowEnumerator& enumerator_;
    PollTiming timing_;

    ReadinessResult poll(WindowPattern const& pattern, std::span<pid_t const> pids, ReadinessParams const& params);
};

} // namespace blitz
