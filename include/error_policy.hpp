/**
 * @file error_policy.hpp
 * @brief Process-wide channel for recoverable runtime errors.
 *
 * Code reports non-fatal problems through ::spf::raise_error (usually via the
 * SPF_RAISE macro). Outside a guarded invocation such reports are logged and
 * execution continues; ExecutionGuard installs a policy that promotes them to
 * ErrorException instead.
 */

#ifndef SPF_ERROR_POLICY_HPP
#define SPF_ERROR_POLICY_HPP

#include <functional>
#include <stdexcept>
#include <string>
#include <utility>

namespace spf {

/** \brief Severity flags for recoverable errors. */
enum class Severity : unsigned {
  Notice = 1u << 0,     ///< Informational, usually harmless
  Warning = 1u << 1,    ///< Something is off but work can continue
  Deprecated = 1u << 2, ///< Use of a deprecated feature
  UserError = 1u << 3   ///< Error raised explicitly by helper code
};

/// Reporting mask enabling every severity.
constexpr unsigned kReportAll = 0xFu;

/// Numeric flag value of @p severity.
constexpr unsigned severity_bit(Severity severity) {
  return static_cast<unsigned>(severity);
}

/// Lower-case name of @p severity ("notice", "warning", ...).
const char *severity_name(Severity severity);

/**
 * Parse a severity name (case-insensitive).
 *
 * @throws std::invalid_argument When the name is not recognised.
 */
Severity severity_from_string(const std::string &name);

/** \brief A single recoverable error report. */
struct ErrorReport {
  Severity severity{Severity::Warning};
  std::string message;
  std::string file; ///< Originating source file
  int line{0};      ///< Originating source line
};

/**
 * Recoverable error promoted to an exception while a guard is active.
 */
class ErrorException : public std::runtime_error {
public:
  explicit ErrorException(const ErrorReport &report)
      : std::runtime_error(report.message), severity_(report.severity),
        file_(report.file), line_(report.line) {}

  Severity severity() const noexcept { return severity_; }
  const std::string &file() const noexcept { return file_; }
  int line() const noexcept { return line_; }

private:
  Severity severity_;
  std::string file_;
  int line_;
};

/**
 * Policy invoked for every report. Return `true` when the report was
 * handled; `false` lets the default logging behaviour run. A policy may also
 * throw to abort the reporting code.
 */
using ErrorPolicy = std::function<bool(const ErrorReport &)>;

/**
 * Install @p policy as the active policy.
 *
 * @return The previously active policy (empty when none was installed).
 */
ErrorPolicy set_error_policy(ErrorPolicy policy);

/// Current reporting mask.
unsigned error_reporting();

/**
 * Replace the reporting mask.
 *
 * @return The previous mask.
 */
unsigned set_error_reporting(unsigned mask);

/**
 * Report a recoverable error through the active policy.
 */
void raise_error(Severity severity, const std::string &message,
                 const char *file, int line);

/**
 * Installs a policy for the lifetime of the object and restores the previous
 * one on every exit path.
 */
class ScopedErrorPolicy {
public:
  explicit ScopedErrorPolicy(ErrorPolicy policy)
      : previous_(set_error_policy(std::move(policy))) {}

  ~ScopedErrorPolicy() { set_error_policy(std::move(previous_)); }

  ScopedErrorPolicy(const ScopedErrorPolicy &) = delete;
  ScopedErrorPolicy &operator=(const ScopedErrorPolicy &) = delete;

private:
  ErrorPolicy previous_;
};

} // namespace spf

/// Report a recoverable error tagged with the current source location.
#define SPF_RAISE(severity, message)                                          \
  ::spf::raise_error((severity), (message), __FILE__, __LINE__)

#endif // SPF_ERROR_POLICY_HPP
