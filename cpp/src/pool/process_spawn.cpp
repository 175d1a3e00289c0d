#include "pool/process_spawn.hpp"
#include "zw_base.hpp"

#include <stdexcept>
#include <system_error>

#include <cerrno>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace zworkers::pool
{

namespace
{

std::vector<char *> make_argv(const std::vector<std::string> &argv)
{
    std::vector<char *> out;
    out.reserve(argv.size() + 1);
    for (const auto &arg : argv)
    {
        out.push_back(const_cast<char *>(arg.c_str()));
    }
    out.push_back(nullptr);
    return out;
}

// Only async-signal-safe calls between fork and exec.
[[noreturn]] void exec_child(std::vector<char *> &argv) noexcept
{
    ::execvp(argv[0], argv.data());
    ::_exit(127);
}

void check_argv(const std::vector<std::string> &argv, const char *who)
{
    if (argv.empty() || argv[0].empty())
    {
        throw std::invalid_argument(fmt::format("{}: empty command line", who));
    }
}

} // namespace

pid_t spawn_process(const std::vector<std::string> &argv)
{
    check_argv(argv, "spawn_process");
    auto cargv = make_argv(argv);
    const pid_t pid = ::fork();
    if (pid < 0)
    {
        throw std::system_error(errno, std::generic_category(), "fork");
    }
    if (pid == 0)
    {
        exec_child(cargv);
    }
    return pid;
}

void spawn_detached(const std::vector<std::string> &argv)
{
    check_argv(argv, "spawn_detached");
    auto cargv = make_argv(argv);
    const pid_t pid = ::fork();
    if (pid < 0)
    {
        throw std::system_error(errno, std::generic_category(), "fork");
    }
    if (pid == 0)
    {
        ::setsid();
        const pid_t grandchild = ::fork();
        if (grandchild != 0)
        {
            ::_exit(grandchild < 0 ? 1 : 0);
        }
        const int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0)
        {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        exec_child(cargv);
    }
    const int status = reap_process(pid);
    if (status != 0)
    {
        throw std::system_error(ECHILD, std::generic_category(),
                                fmt::format("detached launch of '{}' failed", argv[0]));
    }
}

int reap_process(pid_t pid) noexcept
{
    int status = 0;
    while (::waitpid(pid, &status, 0) == -1)
    {
        if (errno != EINTR)
        {
            return -1;
        }
    }
    if (WIFEXITED(status))
    {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status))
    {
        return -WTERMSIG(status);
    }
    return -1;
}

std::string join_command_line(const std::vector<std::string> &argv)
{
    std::string out;
    for (const auto &arg : argv)
    {
        if (!out.empty())
        {
            out += ' ';
        }
        out += arg;
    }
    return out;
}

} // namespace zworkers::pool
