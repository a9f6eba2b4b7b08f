// format_tools.cpp
#include "tsp_base.hpp"

namespace treespec::format_tools
{

// Formatted local time with microsecond resolution. fmt's handling of
// sub-second chrono values differs between releases, so the fractional part
// is computed and appended manually.
std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    auto tp_us = std::chrono::time_point_cast<std::chrono::microseconds>(timestamp);
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp_us);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp_us - secs).count();
    // normalize to 0..999999 even for negative timestamps
    int fractional_us = static_cast<int>(us % 1000000);
    if (fractional_us < 0)
        fractional_us += 1000000;
    auto sec_part = fmt::format("{:%Y-%m-%d %H:%M:%S}", fmt::localtime(std::chrono::system_clock::to_time_t(secs)));
    return fmt::format("{}.{:06d}", sec_part, fractional_us);
}

std::string trim(std::string_view s)
{
    constexpr std::string_view kWhitespace = " \t\n\r\f\v";
    const auto first = s.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos)
    {
        return {};
    }
    const auto last = s.find_last_not_of(kWhitespace);
    return std::string(s.substr(first, last - first + 1));
}

std::string join_trimmed(std::string_view head, std::string_view tail)
{
    if (head.empty())
        return trim(tail);
    if (tail.empty())
        return trim(head);
    return trim(fmt::format("{} {}", head, tail));
}

} // namespace treespec::format_tools
