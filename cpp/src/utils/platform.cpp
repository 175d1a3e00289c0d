/**
 * @file platform.cpp
 * @brief Implementations for core OS-specific utilities.
 *
 * This file contains the platform-specific logic for functions declared in the
 * `zworkers::platform` namespace, such as retrieving process and thread IDs,
 * getting the current executable's path, the host name and processor count.
 * Linux is the primary target; macOS and FreeBSD take the generic POSIX paths.
 */
#include "zw_base.hpp"
#include "zworkers_version.h"

#include <chrono>
#include <thread>
#include <vector>

#include <cerrno>
#include <climits>
#include <csignal>
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>

#if defined(ZWORKERS_PLATFORM_LINUX)
#include <sys/prctl.h>
#endif

#if defined(ZWORKERS_PLATFORM_FREEBSD)
#include <sys/sysctl.h>
#endif

#if defined(ZWORKERS_PLATFORM_APPLE)
#include <libproc.h>     // proc_pidpath
#include <mach-o/dyld.h> // _NSGetExecutablePath
#endif

#include <fmt/core.h>

namespace zworkers::platform
{

uint64_t get_pid()
{
    return static_cast<uint64_t>(getpid());
}

/**
 * @brief Gets a platform-native thread ID.
 * @details Suitable for logging and debugging. Uses `pthread_threadid_np` on macOS and
 *          `syscall(SYS_gettid)` on Linux.
 */
uint64_t get_native_thread_id() noexcept
{
#if defined(ZWORKERS_PLATFORM_APPLE)
    uint64_t tid;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(ZWORKERS_PLATFORM_LINUX)
    return static_cast<uint64_t>(syscall(SYS_gettid));
#else
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

/**
 * @brief Discovers the name and optionally the full path of the current executable.
 * @details The worker pool re-executes its own binary to start worker processes, so the
 *          full path must be exact. Uses `readlink` on `/proc/self/exe` (Linux),
 *          `_NSGetExecutablePath` (macOS), and `sysctl` (FreeBSD).
 */
std::string get_executable_name(bool include_path) noexcept
{
    try
    {
        std::string full_path;
#if defined(ZWORKERS_PLATFORM_LINUX)
        std::vector<char> buf;
        buf.resize(PATH_MAX);
        ssize_t count = readlink("/proc/self/exe", buf.data(), buf.size());
        if (count == -1)
        {
            return "unknown_linux";
        }
        if (static_cast<size_t>(count) >= buf.size())
        {
            buf.resize(buf.size() * 2);
            count = readlink("/proc/self/exe", buf.data(), buf.size());
            if (count == -1)
                return "unknown_linux";
        }
        full_path.assign(buf.data(), static_cast<size_t>(count));

#elif defined(ZWORKERS_PLATFORM_APPLE)
        uint32_t size = 0;
        if (_NSGetExecutablePath(nullptr, &size) == -1 && size > 0)
        {
            std::vector<char> buf(size);
            if (_NSGetExecutablePath(buf.data(), &size) == 0)
            {
                char resolved[PATH_MAX];
                if (realpath(buf.data(), resolved) != nullptr)
                {
                    full_path = resolved;
                }
                else
                {
                    full_path.assign(buf.data(), size);
                }
            }
        }
        if (full_path.empty())
        {
            char procbuf[PROC_PIDPATHINFO_MAXSIZE];
            if (proc_pidpath(getpid(), procbuf, sizeof(procbuf)) > 0)
            {
                full_path = procbuf;
            }
        }
        if (full_path.empty())
        {
            return "unknown_macos";
        }
#elif defined(ZWORKERS_PLATFORM_FREEBSD)
        int mib[4] = {CTL_KERN, KERN_PROC, KERN_PROC_PATHNAME, -1};
        size_t buffer_size;
        if (sysctl(mib, 4, nullptr, &buffer_size, nullptr, 0) == -1)
        {
            return "unknown_freebsd";
        }
        std::vector<char> buf(buffer_size);
        if (sysctl(mib, 4, buf.data(), &buffer_size, nullptr, 0) == -1)
        {
            return "unknown_freebsd";
        }
        full_path.assign(buf.data(), buffer_size - 1);
#else
        (void)include_path;
        return "unknown";
#endif

        if (include_path)
        {
            return full_path;
        }
        return std::filesystem::path(full_path).filename().string();
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "Warning: get_executable_name failed: {}.\n", e.what());
    }
    return "unknown";
}

std::string get_hostname() noexcept
{
    char buf[HOST_NAME_MAX + 1] = {};
    if (::gethostname(buf, sizeof(buf) - 1) != 0 || buf[0] == '\0')
    {
        return "localhost";
    }
    return std::string(buf);
}

int get_cpu_count() noexcept
{
    const long online = ::sysconf(_SC_NPROCESSORS_ONLN);
    if (online > 0)
    {
        return static_cast<int>(online);
    }
    const unsigned hw = std::thread::hardware_concurrency();
    return hw > 0 ? static_cast<int>(hw) : 1;
}

void set_process_name(const std::string &name) noexcept
{
#if defined(ZWORKERS_PLATFORM_LINUX)
    // The kernel keeps 16 bytes including the terminator.
    constexpr size_t kCommLen = 15;
    const std::string truncated = name.substr(0, kCommLen);
    ::prctl(PR_SET_NAME, truncated.c_str(), 0, 0, 0);
#elif defined(ZWORKERS_PLATFORM_FREEBSD) || defined(ZWORKERS_PLATFORM_APPLE)
    ::setprogname(name.c_str());
#else
    (void)name;
#endif
}

// --- Version information (zworkers_version.h is generated at configure time) ---

int get_version_major() noexcept
{
    return ZWORKERS_VERSION_MAJOR;
}

int get_version_minor() noexcept
{
    return ZWORKERS_VERSION_MINOR;
}

int get_version_patch() noexcept
{
    return ZWORKERS_VERSION_PATCH;
}

const char *get_version_string() noexcept
{
    return ZWORKERS_VERSION_STRING;
}

/**
 * @brief Checks if a process with the given PID is currently alive.
 * @details kill(pid, 0) checks existence without sending a signal.
 *          ESRCH means "No such process"; EPERM means alive but inaccessible.
 *          A zombie child still counts as alive until it is reaped.
 */
bool is_process_alive(uint64_t pid) noexcept
{
    if (pid == 0)
    {
        return false;
    }
    if (kill(static_cast<pid_t>(pid), 0) == 0)
    {
        return true;
    }
    return errno != ESRCH;
}

uint64_t monotonic_time_ns() noexcept
{
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
                                     std::chrono::steady_clock::now().time_since_epoch())
                                     .count());
}

uint64_t elapsed_time_ns(uint64_t start_ns) noexcept
{
    uint64_t now = monotonic_time_ns();
    if (now < start_ns)
    {
        return 0;
    }
    return now - start_ns;
}

} // namespace zworkers::platform
