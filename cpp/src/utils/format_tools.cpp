// format_tools.cpp
#include "zw_base.hpp"

namespace zworkers::format_tools
{

namespace
{
constexpr std::string_view kWhitespace = " \t\n\r\f\v";
} // namespace

// Seconds are formatted by fmt; the microsecond fraction is appended separately so the
// output does not depend on how the installed fmt prints sub-second durations.
std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    auto tp_us = std::chrono::time_point_cast<std::chrono::microseconds>(timestamp);
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp_us);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp_us - secs).count();
    // normalize to 0..999999 even for negative timestamps
    int fractional_us = static_cast<int>(us % 1000000);
    if (fractional_us < 0)
        fractional_us += 1000000;
    auto sec_part = fmt::format("{:%Y-%m-%d %H:%M:%S}", secs);
    return fmt::format("{}.{:06d}", sec_part, fractional_us);
}

std::string_view trim_whitespace(std::string_view str) noexcept
{
    auto first = str.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos)
    {
        // all whitespace
        return str.substr(0, 0);
    }
    auto last = str.find_last_not_of(kWhitespace);
    return str.substr(first, last - first + 1);
}

std::vector<std::string> split_whitespace(std::string_view input)
{
    std::vector<std::string> tokens;
    std::string_view::size_type pos = 0;
    while (pos < input.size())
    {
        auto begin = input.find_first_not_of(kWhitespace, pos);
        if (begin == std::string_view::npos)
        {
            break;
        }
        auto end = input.find_first_of(kWhitespace, begin);
        if (end == std::string_view::npos)
        {
            end = input.size();
        }
        tokens.emplace_back(input.substr(begin, end - begin));
        pos = end;
    }
    return tokens;
}

} // namespace zworkers::format_tools
