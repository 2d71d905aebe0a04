#include "launcher.hpp"
#include "blitz/core/log.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace blitz {

namespace launch_policy {

std::vector<std::string> command_line(BrowserConfig const& browser, std::string const& url)
{
    std::vector<std::string> argv = split_args(browser.command);
    argv.insert(argv.end(), browser.flags_head.begin(), browser.flags_head.end());
    argv.insert(argv.end(), browser.flags_middle.begin(), browser.flags_middle.end());
    argv.insert(argv.end(), browser.flags_tail.begin(), browser.flags_tail.end());

    if (!browser.flags_tail.empty())
        argv.back() += url;
    else
        argv.push_back(url);
    return argv;
}

} // namespace launch_policy

ProcessLauncher::ProcessLauncher(BrowserConfig browser)
    : browser_(std::move(browser))
{ }

std::optional<pid_t> ProcessLauncher::spawn(std::string const& url)
{
    std::vector<std::string> args = launch_policy::command_line(browser_, url);
    if (args.empty())
    {
        LOG_ERROR("Empty browser command, cannot open {}", url);
        return std::nullopt;
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0)
    {
        LOG_ERROR("fork failed for {}: {}", url, std::strerror(errno));
        return std::nullopt;
    }
    if (pid == 0)
    {
        setsid();
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0)
        {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
            if (devnull > STDERR_FILENO)
                close(devnull);
        }
        execvp(argv[0], argv.data());
        _exit(127);
    }

    LOG_INFO("Launched {} (pid {}) for {}", args.front(), pid, url);
    return pid;
}

} // namespace blitz
