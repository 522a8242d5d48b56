// format_tools.cpp
#include "sfx_base.hpp"

#include <cctype>
#include <ctime>

#include <fmt/chrono.h>

namespace scenefix::format_tools
{

// Formatted local time with microsecond resolution. fmt's chrono support for
// sub-seconds varies across versions, so the fraction is appended manually.
std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    auto tp_us = std::chrono::time_point_cast<std::chrono::microseconds>(timestamp);
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp_us);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp_us - secs).count();
    // normalize to 0..999999 even for negative timestamps
    int fractional_us = static_cast<int>(us % 1000000);
    if (fractional_us < 0)
        fractional_us += 1000000;
    const std::tm local = fmt::localtime(std::chrono::system_clock::to_time_t(secs));
    auto sec_part = fmt::format("{:%Y-%m-%d %H:%M:%S}", local);
    return fmt::format("{}.{:06d}", sec_part, fractional_us);
}

std::string compact_timestamp(std::chrono::system_clock::time_point timestamp)
{
    const std::tm local = fmt::localtime(std::chrono::system_clock::to_time_t(timestamp));
    return fmt::format("{:%Y%m%d_%H%M%S}", local);
}

std::optional<std::chrono::system_clock::time_point> parse_compact_timestamp(std::string_view text)
{
    constexpr std::size_t kCompactLength = 15; // YYYYMMDD_HHMMSS
    if (text.size() != kCompactLength || text[8] != '_')
    {
        return std::nullopt;
    }
    auto field = [&](std::size_t pos, std::size_t len) -> int
    {
        int value = 0;
        for (std::size_t i = pos; i < pos + len; ++i)
        {
            const char c = text[i];
            if (std::isdigit(static_cast<unsigned char>(c)) == 0)
            {
                return -1;
            }
            value = value * 10 + (c - '0');
        }
        return value;
    };

    std::tm tm_value{};
    const int year = field(0, 4);
    const int month = field(4, 2);
    const int day = field(6, 2);
    const int hour = field(9, 2);
    const int minute = field(11, 2);
    const int second = field(13, 2);
    if (year < 0 || month < 1 || month > 12 || day < 1 || day > 31 || hour < 0 || hour > 23 ||
        minute < 0 || minute > 59 || second < 0 || second > 60)
    {
        return std::nullopt;
    }
    tm_value.tm_year = year - 1900;
    tm_value.tm_mon = month - 1;
    tm_value.tm_mday = day;
    tm_value.tm_hour = hour;
    tm_value.tm_min = minute;
    tm_value.tm_sec = second;
    tm_value.tm_isdst = -1;

    const std::time_t as_time = std::mktime(&tm_value);
    if (as_time == static_cast<std::time_t>(-1))
    {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(as_time);
}

} // namespace scenefix::format_tools
