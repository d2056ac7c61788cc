#include "helpers/datetime_helper.hpp"
#include "error_policy.hpp"
#include "errors.hpp"
#include "util/duration.hpp"
#include "util/timestamp.hpp"

#include <stdexcept>
#include <string>

namespace spf {
namespace helpers {

namespace {

/**
 * Validate the argument count of a single-argument helper. Surplus arguments
 * are reported as a notice and ignored.
 */
const nlohmann::json &single_argument(const char *method,
                                      const HelperArgs &args) {
  if (args.empty()) {
    throw std::invalid_argument(std::string(method) +
                                "() expects exactly 1 argument, 0 given");
  }
  if (args.size() > 1) {
    SPF_RAISE(Severity::Notice, std::string(method) + "() ignores " +
                                    std::to_string(args.size() - 1) +
                                    " surplus argument(s)");
  }
  return args.front();
}

} // namespace

std::int64_t make_timestamp(const nlohmann::json &value) {
  switch (value.type()) {
  case nlohmann::json::value_t::number_integer:
    return to_timestamp(value.get<std::int64_t>());
  case nlohmann::json::value_t::number_unsigned:
    return to_timestamp(value.get<std::uint64_t>());
  case nlohmann::json::value_t::number_float:
    return to_timestamp(value.get<double>());
  case nlohmann::json::value_t::string:
    return to_timestamp(value.get<std::string>());
  default:
    throw InvalidTimeRepresentation(value.dump());
  }
}

HelperProvider datetime_helper() {
  HelperProvider provider;
  provider.name = kDateTimeHelper;
  provider.methods.push_back(
      {"makeTimestamp", [](const HelperArgs &args) -> nlohmann::json {
         return make_timestamp(single_argument("makeTimestamp", args));
       }});
  provider.methods.push_back(
      {"seconds", [](const HelperArgs &args) -> nlohmann::json {
         const auto &value = single_argument("seconds", args);
         if (!value.is_string()) {
           throw std::invalid_argument("seconds() expects a string, " +
                                       std::string(value.type_name()) +
                                       " given");
         }
         return to_seconds(value.get<std::string>());
       }});
  return provider;
}

} // namespace helpers
} // namespace spf
