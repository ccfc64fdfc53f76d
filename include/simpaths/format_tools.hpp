// Tools for formatting strings
#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include "simpaths/platform.hpp"

namespace simpaths::format_tools
{

/**
 * @brief Formats a system_clock time_point with microsecond precision.
 * @return A string in the format "YYYY-MM-DD HH:MM:SS.uuuuuu".
 */
SIMPATHS_EXPORT std::string formatted_time(std::chrono::system_clock::time_point timestamp);

/**
 * @brief Percent-encodes @p input for use as a query parameter value.
 *
 * Unreserved characters (RFC 3986) and '/' pass through unchanged; every
 * other byte becomes "%XX" with uppercase hex digits.
 */
SIMPATHS_EXPORT std::string percent_encode(std::string_view input);

/**
 * @brief Reverses percent_encode().
 * @return std::nullopt if a '%' is not followed by two hex digits.
 */
SIMPATHS_EXPORT std::optional<std::string> percent_decode(std::string_view input);

/// Seconds since the Unix epoch as a double, the representation used for `created`.
SIMPATHS_EXPORT double to_epoch_seconds(std::chrono::system_clock::time_point timestamp) noexcept;

} // namespace simpaths::format_tools
