/**
 * @file app.hpp
 * @brief Main application entry point and orchestrator for spf.
 *
 * Declares the App class, which manages configuration loading, CLI parsing
 * and dispatching a single helper call through the facade.
 */

#ifndef SPF_APP_HPP
#define SPF_APP_HPP

#include "cli.hpp"
#include "config.hpp"
#include "helper_registry.hpp"
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace spf {

/**
 * Decode raw command line arguments. Each argument that is a valid JSON
 * document is decoded; any other argument is kept as a JSON string.
 */
HelperArgs decode_cli_arguments(const std::vector<std::string> &raw);

/**
 * Main application entry point responsible for orchestrating high level
 * application flow, configuration loading, and CLI parsing.
 */
class App {
public:
  /**
   * @param out Stream receiving call results and helper listings.
   */
  explicit App(std::ostream &out = std::cout) : out_(out) {}

  /**
   * Run the application with the given command line arguments.
   *
   * @param argc Number of CLI arguments supplied to the executable.
   * @param argv Null-terminated array containing the raw CLI arguments.
   * @return Zero on success, non-zero when parsing, configuration or the
   *         helper call failed.
   */
  int run(int argc, char **argv);

  /// Parsed command line options.
  const CliOptions &options() const { return options_; }

  /// Loaded configuration.
  const Config &config() const { return config_; }

  /// Result of the last helper call (null when no call was made).
  const nlohmann::json &result() const { return result_; }

private:
  int list_helpers();
  int call_helper();

  std::ostream &out_;
  CliOptions options_;
  Config config_;
  nlohmann::json result_;
};

} // namespace spf

#endif // SPF_APP_HPP
