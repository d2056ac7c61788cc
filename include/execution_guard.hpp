/**
 * @file execution_guard.hpp
 * @brief Guarded invocation promoting recoverable errors to exceptions.
 *
 * While a guarded callable runs, every report raised through SPF_RAISE whose
 * severity is enabled in the reporting mask is thrown as ErrorException.
 * Any failure leaving the callable is routed to exactly one handler call and
 * the handler's value becomes the result.
 */

#ifndef SPF_EXECUTION_GUARD_HPP
#define SPF_EXECUTION_GUARD_HPP

#include "exception_handler.hpp"

#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <type_traits>
#include <utility>

namespace spf {

class ExecutionGuard {
public:
  using Callable = std::function<nlohmann::json()>;

  /**
   * @param handler Handler for escaping failures. When empty the
   *        DefaultExceptionHandler is used.
   */
  explicit ExecutionGuard(ExceptionHandler handler = {});

  ExecutionGuard(const ExecutionGuard &) = delete;
  ExecutionGuard &operator=(const ExecutionGuard &) = delete;

  /// Replace the failure handler; an empty handler restores the default.
  void set_handler(ExceptionHandler handler);

  /// Currently configured handler (empty when the default is in use).
  ExceptionHandler handler() const;

  /**
   * Execute @p callable under the error-promotion policy.
   *
   * The previous policy is restored before the handler runs. Guarded
   * invocations are serialized process-wide; nesting on one thread is
   * allowed.
   *
   * @return The callable's result, or the handler's result on failure.
   */
  nlohmann::json execute(const Callable &callable) const;

  /**
   * Invoke @p callable with @p args under the guard. The result is converted
   * to JSON; callables returning `void` produce `null`.
   */
  template <typename F, typename... Args>
  nlohmann::json run(F &&callable, Args &&...args) const {
    return execute([&]() -> nlohmann::json {
      using Result = std::invoke_result_t<F, Args...>;
      if constexpr (std::is_void_v<Result>) {
        std::invoke(std::forward<F>(callable), std::forward<Args>(args)...);
        return nullptr;
      } else {
        return nlohmann::json(std::invoke(std::forward<F>(callable),
                                          std::forward<Args>(args)...));
      }
    });
  }

private:
  nlohmann::json dispatch_failure(std::exception_ptr failure) const;

  mutable std::mutex handler_mutex_;
  ExceptionHandler handler_;
  DefaultExceptionHandler default_handler_;
};

} // namespace spf

#endif // SPF_EXECUTION_GUARD_HPP
