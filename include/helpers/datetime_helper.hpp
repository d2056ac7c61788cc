/**
 * @file datetime_helper.hpp
 * @brief Date and time helper provider registered with the facade.
 */

#ifndef SPF_HELPERS_DATETIME_HELPER_HPP
#define SPF_HELPERS_DATETIME_HELPER_HPP

#include "helper_registry.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>

namespace spf {
namespace helpers {

/// Provider identifier used for registration and collision messages.
inline constexpr const char *kDateTimeHelper = "spf::helpers::DateTimeHelper";

/**
 * Build the DateTimeHelper descriptor.
 *
 * Methods:
 * - `makeTimestamp(value)`: number, numeric text or date text to epoch
 *   seconds (see to_timestamp()).
 * - `seconds(text)`: duration text to total seconds (see to_seconds()).
 */
HelperProvider datetime_helper();

/// Convert a dynamic value to a timestamp.
std::int64_t make_timestamp(const nlohmann::json &value);

} // namespace helpers
} // namespace spf

#endif // SPF_HELPERS_DATETIME_HELPER_HPP
