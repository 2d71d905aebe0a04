#pragma once

#include <chrono>
#include <functional>
#include <thread>

namespace blitz {

/// Clock and sleep used by polling and pacing loops; tests substitute a fake clock.
struct PollTiming
{
    std::function<std::chrono::steady_clock::time_point()> now;
    std::function<void(std::chrono::milliseconds)> sleep;

    static PollTiming system()
    {
        return PollTiming{ [] { return std::chrono::steady_clock::now(); },
                           [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); } };
    }
};

inline std::chrono::milliseconds to_millis(double seconds)
{
    return std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0));
}

} // namespace blitz
