/**
 * @file timestamp.hpp
 * @brief Conversion of numbers, time points and date text to Unix timestamps.
 */
#ifndef SPF_UTIL_TIMESTAMP_HPP
#define SPF_UTIL_TIMESTAMP_HPP

#include <chrono>
#include <cstdint>
#include <limits>
#include <string>
#include <type_traits>

namespace spf {

/**
 * Truncate a floating point value to whole seconds.
 *
 * @return The value truncated toward zero, or 0 when it is not finite or does
 *         not fit a 64-bit integer.
 */
std::int64_t truncate_timestamp(double value);

/**
 * Convert a numeric value to a timestamp by truncation. Unsigned values
 * beyond the int64 range saturate.
 */
template <typename Number,
          typename = std::enable_if_t<std::is_arithmetic_v<Number>>>
std::int64_t to_timestamp(Number value) {
  if constexpr (std::is_floating_point_v<Number>) {
    return truncate_timestamp(static_cast<double>(value));
  } else if constexpr (std::is_unsigned_v<Number> &&
                       sizeof(Number) >= sizeof(std::int64_t)) {
    // saturate like oversized numeric text
    constexpr auto max = std::numeric_limits<std::int64_t>::max();
    return value > static_cast<Number>(max) ? max
                                            : static_cast<std::int64_t>(value);
  } else {
    return static_cast<std::int64_t>(value);
  }
}

/**
 * Epoch seconds of a point in time.
 */
std::int64_t to_timestamp(std::chrono::system_clock::time_point value);

/**
 * Convert text to a timestamp.
 *
 * Numeric text is truncated like a number. Anything else is parsed as a date,
 * a date-time, a time of day, a keyword (`now`, `today`, `midnight`, `noon`,
 * `tomorrow`, `yesterday`), an `@<epoch>` literal or a relative offset such
 * as `+1 day` or `3 hours ago`. Times without an explicit offset are UTC.
 *
 * @param text Text to convert.
 * @param now Reference instant for relative forms, in epoch seconds.
 * @throws InvalidTimeRepresentation When @p text cannot be resolved.
 */
std::int64_t to_timestamp(const std::string &text, std::int64_t now);

/// Convert text relative to the current system time.
std::int64_t to_timestamp(const std::string &text);

/// Convert a C string relative to the current system time.
inline std::int64_t to_timestamp(const char *text) {
  return to_timestamp(std::string(text != nullptr ? text : ""));
}

/**
 * Check whether @p text is a plain number (optional surrounding whitespace,
 * sign, fraction and exponent).
 */
bool is_numeric_text(const std::string &text);

} // namespace spf

#endif // SPF_UTIL_TIMESTAMP_HPP
