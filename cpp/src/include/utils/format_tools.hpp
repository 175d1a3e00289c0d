// Tools for formatting and tokenizing strings
#pragma once
#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "zworkers_utils_export.h"

namespace zworkers::format_tools
{

/**
 * @brief Formats a system_clock time_point into a string with microsecond precision.
 * @param timestamp The time_point to format.
 * @return A string in the format "YYYY-MM-DD HH:MM:SS.us".
 */
ZWORKERS_UTILS_EXPORT std::string formatted_time(std::chrono::system_clock::time_point timestamp);

/**
 * @brief Strips ASCII whitespace from both ends of a string_view.
 */
ZWORKERS_UTILS_EXPORT std::string_view trim_whitespace(std::string_view str) noexcept;

/**
 * @brief Splits a string on runs of ASCII whitespace.
 *
 * Leading and trailing whitespace is ignored, so "  a  b " yields {"a", "b"} and a
 * blank input yields an empty vector.
 */
ZWORKERS_UTILS_EXPORT std::vector<std::string> split_whitespace(std::string_view input);

/**
 * @brief Creates a `fmt::memory_buffer` from a compile-time format string and arguments.
 * @tparam Args Argument types for the format string.
 * @param fmt_str The `fmt`-style format string.
 * @param args The arguments to format.
 * @return A `fmt::memory_buffer` containing the formatted result.
 */
template <typename... Args>
fmt::memory_buffer make_buffer(fmt::format_string<Args...> fmt_str, Args &&...args)
{
    fmt::memory_buffer mb;
    mb.reserve(128); // small reserve to avoid many reallocs
    fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
    return mb;
}

/**
 * @brief Extracts the filename from a full path at compile time.
 * @param file_path A string_view of the full path.
 * @return A string_view of just the filename portion of the path.
 */
constexpr std::string_view filename_only(std::string_view file_path) noexcept
{
    const auto last_slash = file_path.find_last_of('/');
    if (last_slash == std::string_view::npos)
    {
        return file_path;
    }
    return file_path.substr(last_slash + 1);
}

} // namespace zworkers::format_tools
