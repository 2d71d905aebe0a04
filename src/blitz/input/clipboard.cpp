#include "clipboard.hpp"
#include "blitz/core/log.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace blitz {

CommandClipboard::CommandClipboard(std::vector<std::string> command, std::vector<std::string> fallback)
    : command_(std::move(command))
    , fallback_(std::move(fallback))
{ }

bool CommandClipboard::set_text(std::string const& text)
{
    if (pipe_to(command_, text))
        return true;
    if (!fallback_.empty())
    {
        LOG_DEBUG("Clipboard command failed, trying {}", fallback_.front());
        return pipe_to(fallback_, text);
    }
    return false;
}

bool CommandClipboard::pipe_to(std::vector<std::string> const& command, std::string const& text)
{
    if (command.empty())
        return false;

    std::vector<char*> argv;
    for (auto const& arg : command)
        argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    int pipefd[2];
    if (::pipe(pipefd) < 0)
    {
        LOG_ERROR("pipe() failed: {}", std::strerror(errno));
        return false;
    }

    pid_t pid = ::fork();
    if (pid < 0)
    {
        ::close(pipefd[0]);
        ::close(pipefd[1]);
        LOG_ERROR("fork() failed: {}", std::strerror(errno));
        return false;
    }

    if (pid == 0)
    {
        // Child: stdin from the pipe, output discarded (xclip lingers to serve the selection)
        ::close(pipefd[1]);
        ::dup2(pipefd[0], STDIN_FILENO);
        ::close(pipefd[0]);
        int devnull = ::open("/dev/null", O_WRONLY);
        if (devnull >= 0)
        {
            ::dup2(devnull, STDOUT_FILENO);
            ::dup2(devnull, STDERR_FILENO);
            ::close(devnull);
        }
        ::execvp(argv[0], argv.data());
        ::_exit(127);
    }

    ::close(pipefd[0]);

    // A tool that exits early must not kill us with SIGPIPE
    auto previous = std::signal(SIGPIPE, SIG_IGN);
    size_t total_written = 0;
    bool write_ok = true;
    while (total_written < text.size())
    {
        ssize_t n = ::write(pipefd[1], text.data() + total_written, text.size() - total_written);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            LOG_WARN("Writing to {} failed: {}", command.front(), std::strerror(errno));
            write_ok = false;
            break;
        }
        total_written += static_cast<size_t>(n);
    }
    ::close(pipefd[1]);
    std::signal(SIGPIPE, previous);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0)
    {
        if (errno == EINTR)
            continue;
        LOG_ERROR("waitpid() failed: {}", std::strerror(errno));
        return false;
    }

    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0)
    {
        LOG_DEBUG("{} exited with status {}", command.front(), WIFEXITED(status) ? WEXITSTATUS(status) : -1);
        return false;
    }
    return write_ok;
}

} // namespace blitz
