/**
 * @file cli.hpp
 * @brief Command line interface parsing and options for spf.
 *
 * Declares CLI parsing helpers, option structures, and related exceptions for
 * the tool.
 */

#ifndef SPF_CLI_HPP
#define SPF_CLI_HPP

#include <exception>
#include <string>
#include <unordered_map>
#include <vector>

namespace spf {

/**
 * Signals that CLI parsing requested an immediate exit (help, errors, etc.).
 * Used to bubble exit codes from parsing back to the main entry point without
 * treating them as fatal errors.
 */
class CliParseExit : public std::exception {
public:
  /**
   * Construct an exit signal with the desired exit code.
   *
   * @param exit_code Process exit code that should be returned to the caller.
   */
  explicit CliParseExit(int exit_code) noexcept : exit_code_(exit_code) {}

  /// Exit code that triggered the exception.
  int exit_code() const noexcept { return exit_code_; }

  const char *what() const noexcept override {
    return "CLI parsing requested exit";
  }

private:
  int exit_code_;
};

/**
 * Parsed command line options supplied via the CLI.
 */
struct CliOptions {
  bool verbose = false;           ///< Enables verbose output
  std::string config_file;        ///< Optional path to configuration file
  std::string log_level = "info"; ///< Logging verbosity level
  std::string log_file;           ///< Optional path to log file
  std::unordered_map<std::string, std::string>
      log_categories; ///< Category -> level overrides requested via CLI
  bool log_categories_explicit{false}; ///< True if CLI specified categories
  bool debug{false};                   ///< Enable facade debug mode
  bool list{false};                    ///< List registered helpers and exit
  std::string method;                  ///< Helper method to invoke
  std::vector<std::string> args;       ///< Raw helper arguments
};

/**
 * Parse command line arguments into a CliOptions structure.
 *
 * @param argc Argument count provided to @c main().
 * @param argv Argument vector provided to @c main().
 * @return Populated CLI options.
 * @throws CliParseExit When help or version output was requested or the
 *         arguments are invalid.
 */
CliOptions parse_cli(int argc, char **argv);

} // namespace spf

#endif // SPF_CLI_HPP
