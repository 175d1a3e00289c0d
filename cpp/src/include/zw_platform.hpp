#pragma once
/**
 * @file zw_platform.hpp
 * @brief Layer 0: Platform detection and platform utility declarations.
 *
 * This is the foundational umbrella for all platform-specific support. Every file that
 * needs platform macros (ZWORKERS_PLATFORM_LINUX, ZWORKERS_IS_POSIX, etc.) should include
 * this. It is self-contained and can be included at any point.
 *
 * Prefer build-system macros (PLATFORM_LINUX, etc.); fall back to compiler predefined macros.
 */
#include <cstddef>
#include <cstdint>
#include <string>

#if defined(PLATFORM_APPLE)
#define ZWORKERS_PLATFORM_APPLE 1
#elif defined(PLATFORM_FREEBSD)
#define ZWORKERS_PLATFORM_FREEBSD 1
#elif defined(PLATFORM_LINUX)
#define ZWORKERS_PLATFORM_LINUX 1
#elif defined(PLATFORM_UNKNOWN)
#define ZWORKERS_PLATFORM_UNKNOWN 1
#else
// Fallback detection
#if defined(__APPLE__) && defined(__MACH__)
#define ZWORKERS_PLATFORM_APPLE 1
#elif defined(__FreeBSD__)
#define ZWORKERS_PLATFORM_FREEBSD 1
#elif defined(__linux__)
#define ZWORKERS_PLATFORM_LINUX 1
#else
#define ZWORKERS_PLATFORM_UNKNOWN 1
#endif
#endif

#if defined(ZWORKERS_PLATFORM_APPLE) || defined(ZWORKERS_PLATFORM_FREEBSD) ||                       \
    defined(ZWORKERS_PLATFORM_LINUX)
#define ZWORKERS_IS_POSIX 1
#else
#error "zworkers requires a POSIX platform (fork/exec, signals, kill)."
#endif

// --- Require C++20 or later --------------------------------------------------
#if __cplusplus < 202002L
#error "This project requires C++20 or later. Please compile with -std=c++20 or newer."
#endif

#include "zworkers_utils_export.h"

namespace zworkers::platform
{

/**
 * @brief Gets the native thread ID for the calling thread.
 * @return A 64-bit unsigned integer representing the thread ID.
 */
ZWORKERS_UTILS_EXPORT uint64_t get_native_thread_id() noexcept;
/**
 * @brief Gets the process ID (PID) for the current process.
 * @return A 64-bit unsigned integer representing the process ID.
 */
ZWORKERS_UTILS_EXPORT uint64_t get_pid();
/**
 * @brief Gets the name of the current executable.
 * @param include_path If `true`, returns the full absolute path to the executable.
 *                     If `false` (default), returns only the filename.
 * @return A string containing the name of the executable. Returns "unknown" on failure.
 */
ZWORKERS_UTILS_EXPORT std::string get_executable_name(bool include_path = false) noexcept;

/**
 * @brief Gets the network host name of this machine.
 * @return The host name, or "localhost" if it cannot be determined.
 */
ZWORKERS_UTILS_EXPORT std::string get_hostname() noexcept;

/**
 * @brief Number of processors currently online.
 * @return At least 1.
 */
ZWORKERS_UTILS_EXPORT int get_cpu_count() noexcept;

/**
 * @brief Sets the calling process' short name as shown by `ps -o comm` / `top`.
 * @details Linux: prctl(PR_SET_NAME), truncated to 15 characters. FreeBSD/macOS:
 *          setprogname where available; otherwise a no-op.
 */
ZWORKERS_UTILS_EXPORT void set_process_name(const std::string &name) noexcept;

ZWORKERS_UTILS_EXPORT int get_version_major() noexcept;
ZWORKERS_UTILS_EXPORT int get_version_minor() noexcept;
ZWORKERS_UTILS_EXPORT int get_version_patch() noexcept;
/**
 * @brief Gets the full version string (major.minor.patch).
 */
ZWORKERS_UTILS_EXPORT const char *get_version_string() noexcept;

/**
 * @brief Checks if a process with the given PID is currently alive.
 * @details Uses kill(pid, 0) with errno check.
 * @param pid The process ID to check.
 * @return True if the process is alive, false otherwise.
 * @note PID 0 always returns false (invalid/system PID).
 * @note EPERM (permission denied) is treated as "alive".
 */
ZWORKERS_UTILS_EXPORT bool is_process_alive(uint64_t pid) noexcept;

/**
 * @brief Gets a monotonic timestamp in nanoseconds.
 * @return Monotonic timestamp in nanoseconds since an unspecified epoch.
 * @note The absolute value is meaningless; use for computing time deltas only.
 */
ZWORKERS_UTILS_EXPORT uint64_t monotonic_time_ns() noexcept;

/**
 * @brief Computes elapsed time in nanoseconds since a start timestamp.
 * @param start_ns A previous timestamp from monotonic_time_ns().
 * @return Nanoseconds elapsed since start_ns, or 0 if start_ns is in the future.
 */
ZWORKERS_UTILS_EXPORT uint64_t elapsed_time_ns(uint64_t start_ns) noexcept;

} // namespace zworkers::platform
