/**
 * @file debug_info.hpp
 * @brief Debugging utilities: stack trace printing, panic handling for fatal errors,
 *        symbol demangling and debug messaging.
 *
 * This header defines a set of functions and macros within the `zworkers::debug`
 * namespace designed for robust error reporting and debugging. It leverages `fmt`
 * for compile-time format string checks and `std::source_location` for automatic
 * source code location reporting.
 */
#pragma once

#include <cstdio>           // for fflush
#include <cstdlib>          // for std::abort
#include <fmt/format.h>     // for fmt::format_string, fmt::print, fmt::format
#include <source_location>  // for std::source_location
#include <string>           // for std::string
#include <string_view>      // for std::string_view

#include "utils/format_tools.hpp" // for zworkers::format_tools::filename_only
#include "zworkers_utils_export.h"

/**
 * @brief Renders a source location as "file:line:function".
 */
inline std::string SRCLOC_TO_STR(std::source_location loc)
{
    return fmt::format("{}:{}:{}", zworkers::format_tools::filename_only(loc.file_name()),
                       loc.line(), loc.function_name());
}

#ifndef ZW_LOC_HERE_STR
#define ZW_LOC_HERE_STR (SRCLOC_TO_STR(std::source_location::current()))
#endif

namespace zworkers::debug
{

/**
 * @brief Prints the current call stack (stack trace) to `stderr`.
 *
 * Uses `backtrace`, `backtrace_symbols` and `dladdr`, demangling C++ symbol names
 * where possible. Errors during capture or symbol resolution are reported to `stderr`.
 *
 * @warning Not async-signal-safe: it allocates and formats.
 */
ZWORKERS_UTILS_EXPORT void print_stack_trace() noexcept;

/**
 * @brief Demangles a C++ ABI symbol or `typeid(...).name()` string.
 * @return The readable name, or the input unchanged when it cannot be demangled.
 */
ZWORKERS_UTILS_EXPORT std::string demangle(const char *mangled);

/**
 * @brief Halts program execution with a fatal error message and prints a stack trace.
 *
 * This function is intended for unrecoverable errors (API misuse, broken invariants).
 * It prints the message and the source location where `panic` was called to `stderr`,
 * calls `print_stack_trace()` and then `std::abort()`.
 *
 * @param loc The source location where `panic` was called. Captured by `ZW_PANIC`.
 * @param fmt_str The `fmt`-style format string for the error message.
 * @param args The arguments to be formatted into `fmt_str`.
 */
template <typename... Args>
[[noreturn]] inline void panic(std::source_location loc, fmt::format_string<Args...> fmt_str,
                               Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[PANIC] {} -- {}\n", SRCLOC_TO_STR(loc), body);
    }
    catch (const fmt::format_error &e)
    {
        fmt::print(stderr,
                   "[PANIC] {} -- FATAL FORMAT ERROR WHEN PANIC fmt_str['{}']\n"
                   "[PANIC]  Exception: '{}'\n",
                   SRCLOC_TO_STR(loc), fmt::string_view(fmt_str), e.what());
    }
    catch (const std::exception &e)
    {
        std::fputs("[PANIC] FATAL EXCEPTION DURING PANIC: ", stderr);
        std::fputs(e.what(), stderr);
        std::fputs("\n", stderr);
    }
    std::fflush(stderr);
    print_stack_trace();
    std::abort();
}

/**
 * @brief Prints a debug message to `stderr` with compile-time format string checking.
 */
template <typename... Args>
inline void debug_msg(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[DBG]  {}\n", body);
    }
    catch (const std::exception &e)
    {
        std::fputs("[DBG]  FORMAT ERROR DURING DEBUG_MSG: ", stderr);
        std::fputs(e.what(), stderr);
        std::fputs("\n", stderr);
        std::fflush(stderr);
    }
}

} // namespace zworkers::debug

// ---------------- thin macros for convenience --------------

/**
 * @brief Calls `zworkers::debug::panic` with the current source location.
 */
#ifndef ZW_PANIC
#define ZW_PANIC(fmt, ...)                                                                         \
    ::zworkers::debug::panic(std::source_location::current(),                                     \
                             FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#endif

/**
 * @brief Debug message, compiled in only with ZWORKERS_ENABLE_DEBUG_MESSAGES.
 */
#ifndef ZW_DEBUG
#if defined(ZWORKERS_ENABLE_DEBUG_MESSAGES)
#define ZW_DEBUG(fmt, ...) ::zworkers::debug::debug_msg(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#else
#define ZW_DEBUG(fmt, ...)                                                                         \
    do                                                                                             \
    {                                                                                              \
    } while (0)
#endif
#endif

