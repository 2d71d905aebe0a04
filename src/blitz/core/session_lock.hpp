#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <sys/types.h>

namespace blitz {

class LockError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Advisory single-session lock (flock) recording the owner pid.
 *
 * Only one Stage/Fire session may hold it. A newer requester wins: it asks
 * the owner to stop (SIGTERM), waits a grace period, then kills it.
 * Released when the object is destroyed or the owner process dies.
 */
class SessionLock
{
public:
    explicit SessionLock(std::filesystem::path path);
    ~SessionLock();

    SessionLock(SessionLock const&) = delete;
    SessionLock& operator=(SessionLock const&) = delete;

    bool try_acquire();
    void acquire_taking_over(std::chrono::milliseconds grace);
    void release();

    bool held() const { return fd_ >= 0; }
    std::filesystem::path const& path() const { return path_; }

    static std::optional<pid_t> read_owner(std::filesystem::path const& path);

private:
    std::filesystem::path path_;
    int fd_ = -1;

    bool wait_for_lock(std::chrono::milliseconds timeout);
};

} // namespace blitz
