// format_tools.cpp
#include "utils/format_tools.hpp"

#include <charconv>

#include <fmt/chrono.h>

namespace pubhub::format_tools
{

// Formatted local time with sub-second resolution.
//  - If the build system detected fmt chrono subseconds support (HAVE_FMT_CHRONO_SUBSECONDS),
//    use single-step fmt formatting on a microsecond-truncated time_point.
//  - Otherwise compute the fractional microsecond part and append it manually.
std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    auto tp_us = std::chrono::time_point_cast<std::chrono::microseconds>(timestamp);
#if defined(HAVE_FMT_CHRONO_SUBSECONDS) && HAVE_FMT_CHRONO_SUBSECONDS
    return fmt::format("{:%Y-%m-%d %H:%M:%S}", tp_us);
#else
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp_us);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp_us - secs).count();
    // normalize to 0..999999 even for negative timestamps
    int fractional_us = static_cast<int>(us % 1000000);
    if (fractional_us < 0)
        fractional_us += 1000000;
    auto sec_part = fmt::format("{:%Y-%m-%d %H:%M:%S}", secs);
    return fmt::format("{}.{:06d}", sec_part, fractional_us);
#endif
}

std::optional<std::string> extract_value_from_string(std::string_view keyword,
                                                     std::string_view input, char separator,
                                                     char assignment_symbol)
{
    std::string_view::size_type start = 0;
    while (start < input.size())
    {
        // Find the next separator or the end of the string
        std::string_view::size_type end = input.find(separator, start);
        if (end == std::string_view::npos)
        {
            end = input.size();
        }

        std::string_view segment = input.substr(start, end - start);
        start = end + 1;

        std::string_view::size_type assignment_pos = segment.find(assignment_symbol);
        if (assignment_pos == std::string_view::npos)
        {
            continue; // No assignment symbol, so it's not a valid pair
        }

        std::string_view key_sv = trim_whitespace(segment.substr(0, assignment_pos));
        if (key_sv == keyword)
        {
            return std::string(trim_whitespace(segment.substr(assignment_pos + 1)));
        }
    }
    return std::nullopt;
}

std::optional<int64_t> parse_integer(std::string_view text) noexcept
{
    text = trim_whitespace(text);
    if (!text.empty() && text.front() == '+')
    {
        text.remove_prefix(1);
        if (!text.empty() && text.front() == '-')
        {
            return std::nullopt;
        }
    }
    if (text.empty())
    {
        return std::nullopt;
    }

    int64_t value = 0;
    const char *first = text.data();
    const char *last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last)
    {
        return std::nullopt;
    }
    return value;
}

} // namespace pubhub::format_tools
