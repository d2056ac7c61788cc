/**
 * @file errors.hpp
 * @brief Exception types raised by the spf helper toolkit.
 */

#ifndef SPF_ERRORS_HPP
#define SPF_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace spf {

/**
 * Raised when free text cannot be resolved to a point in time.
 */
class InvalidTimeRepresentation : public std::invalid_argument {
public:
  /**
   * @param input Offending text exactly as supplied by the caller.
   */
  explicit InvalidTimeRepresentation(const std::string &input)
      : std::invalid_argument("Unable to convert '" + input +
                              "' to a valid timestamp"),
        input_(input) {}

  /// Text that failed to parse.
  const std::string &input() const noexcept { return input_; }

private:
  std::string input_;
};

/**
 * Raised when a helper method would shadow a native facade method.
 */
class ReservedNameCollision : public std::logic_error {
public:
  explicit ReservedNameCollision(const std::string &method)
      : std::logic_error("Helper methods cannot override pre-defined facade "
                         "methods - '" +
                         method + "' is reserved"),
        method_(method) {}

  const std::string &method() const noexcept { return method_; }

private:
  std::string method_;
};

/**
 * Raised when two different providers register the same helper name.
 */
class DuplicateHelperCollision : public std::logic_error {
public:
  /**
   * @param method Method name being registered.
   * @param existing Provider that already owns the name.
   * @param duplicate Provider attempting the registration.
   */
  DuplicateHelperCollision(const std::string &method,
                           const std::string &existing,
                           const std::string &duplicate)
      : std::logic_error("Helper method '" + method +
                         "' already defined in provider '" + existing +
                         "', duplicate in '" + duplicate + "'"),
        method_(method), existing_(existing), duplicate_(duplicate) {}

  const std::string &method() const noexcept { return method_; }
  const std::string &existing_provider() const noexcept { return existing_; }
  const std::string &duplicate_provider() const noexcept { return duplicate_; }

private:
  std::string method_;
  std::string existing_;
  std::string duplicate_;
};

/**
 * Raised by facade dispatch when a name is neither native nor registered.
 */
class UnknownHelperMethod : public std::logic_error {
public:
  explicit UnknownHelperMethod(const std::string &method)
      : std::logic_error("Unknown helper method '" + method + "'"),
        method_(method) {}

  const std::string &method() const noexcept { return method_; }

private:
  std::string method_;
};

} // namespace spf

#endif // SPF_ERRORS_HPP
