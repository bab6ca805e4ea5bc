// Tools for formatting and parsing strings
#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "pubhub_utils_export.h"

namespace pubhub::format_tools
{

/**
 * @brief Formats a system_clock time_point into a string with microsecond precision.
 * @param timestamp The time_point to format.
 * @return A string in the format "YYYY-MM-DD HH:MM:SS.us".
 */
PUBHUB_UTILS_EXPORT std::string formatted_time(std::chrono::system_clock::time_point timestamp);

/**
 * @brief Trims whitespace (space, tab, CR, LF, FF, VT) from both ends.
 */
constexpr std::string_view trim_whitespace(std::string_view str) noexcept
{
    constexpr std::string_view whitespace = " \t\n\r\f\v";

    auto first = str.find_first_not_of(whitespace);
    if (first == std::string_view::npos)
    {
        return str.substr(0, 0);
    }
    auto last = str.find_last_not_of(whitespace);
    return str.substr(first, last - first + 1);
}

/**
 * @brief Extracts a value from a dictionary-like string.
 *
 * This function parses a string containing key-value pairs (e.g.,
 * "key1=val1; key2=val2") and returns the value for a specified key.
 * It handles whitespace around separators and assignment symbols.
 *
 * @param keyword The key to search for.
 * @param input The string_view to parse.
 * @param separator The character separating key-value pairs.
 * @param assignment_symbol The character separating a key from its value.
 * @return The value if found, otherwise std::nullopt.
 */
PUBHUB_UTILS_EXPORT std::optional<std::string>
extract_value_from_string(std::string_view keyword, std::string_view input, char separator = ';',
                          char assignment_symbol = '=');

/**
 * @brief Parses a base-10 integer, tolerating surrounding whitespace and a leading '+'.
 * @return The value, or std::nullopt if the text is not entirely an integer or overflows.
 */
PUBHUB_UTILS_EXPORT std::optional<int64_t> parse_integer(std::string_view text) noexcept;

} // namespace pubhub::format_tools
