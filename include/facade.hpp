/**
 * @file facade.hpp
 * @brief Process-wide entry point aggregating helper providers.
 *
 * The facade owns the debug flag, the exception handler used by run() and
 * the helper registry. Calls to names it does not implement natively are
 * resolved through the registry.
 */

#ifndef SPF_FACADE_HPP
#define SPF_FACADE_HPP

#include "exception_handler.hpp"
#include "execution_guard.hpp"
#include "helper_registry.hpp"

#include <atomic>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

namespace spf {

class Facade {
public:
  Facade();

  Facade(const Facade &) = delete;
  Facade &operator=(const Facade &) = delete;

  /**
   * Process-wide facade. Created on first use and never reset.
   */
  static Facade &instance();

  /// Names of the native facade methods; helpers cannot reuse them.
  static const std::vector<std::string> &native_methods();

  /// Determine whether the process has a usable standard input stream.
  static bool is_cli();

  /// Check whether debug mode is enabled.
  bool is_debug() const { return debug_.load(); }

  /// Enable or disable debug mode.
  void set_debug(bool debug = false) { debug_.store(debug); }

  /**
   * Pretty-print a value when debug mode is enabled.
   *
   * @param value Value to print.
   * @param out Destination stream.
   */
  void dump(const nlohmann::json &value, std::ostream &out = std::cout) const;

  /**
   * Set the handler invoked when a failure escapes run(). An empty handler
   * restores the default one.
   */
  void set_exception_handler(ExceptionHandler handler = {});

  /// Register the built-in helper providers. Safe to call more than once.
  void init();

  /**
   * Execute a callable wrapped in the facade's error and exception handling.
   *
   * @return The callable's result converted to JSON, or the exception
   *         handler's result when the callable fails.
   */
  template <typename F, typename... Args>
  nlohmann::json run(F &&callable, Args &&...args) const {
    return guard_.run(std::forward<F>(callable), std::forward<Args>(args)...);
  }

  /**
   * Register one or more providers; every listed method becomes callable
   * through call().
   */
  void register_helpers(const std::vector<HelperProvider> &providers);

  /// Register a single method as a helper.
  void add_helper_method(const std::string &provider,
                         const HelperMethod &method);

  /**
   * Invoke a native method or a registered helper by name
   * (case-insensitive).
   *
   * Only `is_cli`, `is_debug`, `set_debug` and `dump` are invocable natively
   * by name.
   *
   * @throws UnknownHelperMethod When @p method is not resolvable.
   */
  nlohmann::json call(const std::string &method, const HelperArgs &args = {});

  /// Registry backing helper dispatch.
  const HelperRegistry &registry() const { return registry_; }

private:
  std::atomic<bool> debug_{false};
  HelperRegistry registry_;
  ExecutionGuard guard_;
  std::mutex init_mutex_;
  bool initialized_{false};
};

} // namespace spf

#endif // SPF_FACADE_HPP
