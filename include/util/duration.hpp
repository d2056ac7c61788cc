/**
 * @file duration.hpp
 * @brief Human-readable duration parsing utilities.
 *
 * Converts strings such as "3 hours 4 minutes 10 seconds", "5min", "4.5h" or
 * "12:30:00" into a total number of seconds.
 */
#ifndef SPF_UTIL_DURATION_HPP
#define SPF_UTIL_DURATION_HPP

#include <cstdint>
#include <string>

namespace spf {

/**
 * Convert a duration string containing one or more of hours, minutes and
 * seconds into a total number of seconds.
 *
 * Accepted forms are `MM:SS`, `HH:MM:SS` and free text made of number/unit
 * pairs (`h`, `hr`, `hour(s)`, `m`, `min(s)`, `minute(s)`, `s`, `sec(s)`,
 * `second(s)`), optionally separated by spaces or punctuation. Units are
 * case-sensitive. Each unit counts once; a repeated unit is ignored once its
 * slot holds a non-zero value.
 *
 * @param str Duration string.
 * @return Total seconds, or 0 when any part of @p str cannot be parsed.
 */
std::int64_t to_seconds(const std::string &str);

} // namespace spf

#endif // SPF_UTIL_DURATION_HPP
