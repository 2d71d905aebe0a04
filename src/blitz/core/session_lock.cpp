#include "session_lock.hpp"
#include "blitz/core/log.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <string>
#include <sys/file.h>
#include <thread>
#include <unistd.h>

namespace blitz {

SessionLock::SessionLock(std::filesystem::path path)
    : path_(std::move(path))
{ }

SessionLock::~SessionLock()
{
    release();
}

bool SessionLock::try_acquire()
{
    if (fd_ >= 0)
        return true;

    std::error_code ec;
    if (path_.has_parent_path())
        std::filesystem::create_directories(path_.parent_path(), ec);

    int fd = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0)
    {
        throw LockError("Cannot open lock file " + path_.string() + ": " + std::strerror(errno));
    }

    if (::flock(fd, LOCK_EX | LOCK_NB) != 0)
    {
        ::close(fd);
        return false;
    }

    std::string pid = std::to_string(::getpid()) + "\n";
    if (::ftruncate(fd, 0) != 0 || ::pwrite(fd, pid.data(), pid.size(), 0) != static_cast<ssize_t>(pid.size()))
    {
        LOG_WARN("Could not record owner pid in {}: {}", path_.string(), std::strerror(errno));
    }

    fd_ = fd;
    LOG_DEBUG("Session lock {} acquired by pid {}", path_.string(), ::getpid());
    return true;
}

bool SessionLock::wait_for_lock(std::chrono::milliseconds timeout)
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (try_acquire())
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return try_acquire();
}

void SessionLock::acquire_taking_over(std::chrono::milliseconds grace)
{
    if (try_acquire())
        return;

    auto owner = read_owner(path_);
    if (!owner || *owner == ::getpid())
    {
        // Owner not recorded yet; give it a moment to finish writing.
        if (wait_for_lock(grace))
            return;
        owner = read_owner(path_);
    }

    if (owner && *owner != ::getpid())
    {
        LOG_WARN("Session held by pid {}; asking it to stop", *owner);
        ::kill(*owner, SIGTERM);
        if (wait_for_lock(grace))
            return;

        LOG_WARN("Pid {} ignored stop request; killing it", *owner);
        ::kill(*owner, SIGKILL);
        if (wait_for_lock(grace))
            return;
    }

    throw LockError("Could not take over session lock " + path_.string());
}

void SessionLock::release()
{
    if (fd_ < 0)
        return;

    if (::ftruncate(fd_, 0) != 0)
        LOG_DEBUG("Could not clear owner pid in {}", path_.string());
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
}

std::optional<pid_t> SessionLock::read_owner(std::filesystem::path const& path)
{
    std::ifstream in(path);
    long pid = 0;
    if (!(in >> pid) || pid <= 0)
        return std::nullopt;
    return static_cast<pid_t>(pid);
}

} // namespace blitz
