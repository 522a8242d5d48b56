// Tools for formatting strings and timestamps
#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "scenefix_utils_export.h"

namespace scenefix::format_tools
{

/**
 * @brief Formats a system_clock time_point into a string with microsecond precision.
 * @param timestamp The time_point to format.
 * @return A string in the format "YYYY-MM-DD HH:MM:SS.us" (local time).
 */
SCENEFIX_UTILS_EXPORT std::string formatted_time(std::chrono::system_clock::time_point timestamp);

/**
 * @brief Formats a time_point as a compact, lexically sortable local timestamp.
 * @return A string in the format "YYYYMMDD_HHMMSS".
 */
SCENEFIX_UTILS_EXPORT std::string
compact_timestamp(std::chrono::system_clock::time_point timestamp);

/**
 * @brief Parses a string produced by compact_timestamp() back into a time_point.
 * @return The time_point, or std::nullopt if @p text is not of the form "YYYYMMDD_HHMMSS".
 */
SCENEFIX_UTILS_EXPORT std::optional<std::chrono::system_clock::time_point>
parse_compact_timestamp(std::string_view text);

/**
 * @brief Creates a `fmt::memory_buffer` from a compile-time format string and arguments.
 */
template <typename... Args>
fmt::memory_buffer make_buffer(fmt::format_string<Args...> fmt_str, Args &&...args)
{
    fmt::memory_buffer mb;
    mb.reserve(128);
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
    const auto last_backslash = file_path.find_last_of('\\');

    const std::string_view::size_type last_separator_pos = [&]()
    {
        if (last_slash == std::string_view::npos)
        {
            return last_backslash;
        }
        if (last_backslash == std::string_view::npos)
        {
            return last_slash;
        }
        return last_slash > last_backslash ? last_slash : last_backslash;
    }();

    if (last_separator_pos == std::string_view::npos)
    {
        return file_path;
    }
    return file_path.substr(last_separator_pos + 1);
}

} // namespace scenefix::format_tools
