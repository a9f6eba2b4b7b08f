// Tools for formatting strings
#pragma once
#include <chrono>
#include <string>
#include <string_view>

#include "treespec_export.h"

namespace treespec::format_tools
{

/**
 * @brief Formats a system_clock time_point into a string with microsecond precision.
 * @param timestamp The time_point to format.
 * @return A string in the format "YYYY-MM-DD HH:MM:SS.us".
 */
TREESPEC_EXPORT std::string formatted_time(std::chrono::system_clock::time_point timestamp);

/**
 * @brief Returns a copy of @p s without leading and trailing whitespace.
 */
TREESPEC_EXPORT std::string trim(std::string_view s);

/**
 * @brief Joins two name fragments with a single space, then trims the result.
 *
 * Empty fragments contribute nothing, so `join_trimmed("", "x") == "x"`.
 * Test names and branch prefixes are all built through this function.
 */
TREESPEC_EXPORT std::string join_trimmed(std::string_view head, std::string_view tail);

/**
 * @brief Extracts the filename from a full path at compile time.
 * @param file_path A string_view of the full path.
 * @return A string_view of just the filename portion of the path.
 */
constexpr std::string_view filename_only(std::string_view file_path) noexcept
{
    const auto pos = file_path.find_last_of("/\\");
    if (pos == std::string_view::npos)
    {
        return file_path;
    }
    return file_path.substr(pos + 1);
}

} // namespace treespec::format_tools
