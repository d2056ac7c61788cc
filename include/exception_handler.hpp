/**
 * @file exception_handler.hpp
 * @brief Handler contract for failures escaping a guarded invocation.
 */

#ifndef SPF_EXCEPTION_HANDLER_HPP
#define SPF_EXCEPTION_HANDLER_HPP

#include <exception>
#include <functional>
#include <nlohmann/json.hpp>
#include <utility>

namespace spf {

/**
 * Single-argument handler receiving the failure of a guarded invocation. Its
 * return value becomes the result of the invocation.
 */
using ExceptionHandler = std::function<nlohmann::json(std::exception_ptr)>;

/**
 * Describe a failure as a JSON object with `type` and `message` keys, plus
 * `severity`, `file` and `line` for promoted errors.
 */
nlohmann::json describe_failure(std::exception_ptr failure);

/**
 * Fallback handler used when no handler has been registered.
 *
 * Logs the failure on the `errors` category and returns an error marker of
 * the form `{"error": <describe_failure()>}`.
 */
class DefaultExceptionHandler {
public:
  nlohmann::json handle(std::exception_ptr failure) const;

  nlohmann::json operator()(std::exception_ptr failure) const {
    return handle(std::move(failure));
  }
};

/// Check whether @p result is an error marker produced by the default handler.
bool is_error_marker(const nlohmann::json &result);

} // namespace spf

#endif // SPF_EXCEPTION_HANDLER_HPP
