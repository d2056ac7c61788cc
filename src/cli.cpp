#include "cli.hpp"
#include "version.hpp"
#include <CLI/CLI.hpp>
#include <array>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace spf {

namespace {
std::string log_category_help_text() {
  static const std::array<std::string_view, 10> categories = {
      "app",    "cli",      "config",    "errors",  "facade",
      "guard",  "logging",  "main",      "registry", "timestamp"};
  std::ostringstream oss;
  oss << "Logging categories: ";
  for (std::size_t i = 0; i < categories.size(); ++i) {
    if (i != 0) {
      oss << ", ";
    }
    oss << categories[i];
  }
  oss << "\nUse --log-category NAME=LEVEL to override (e.g., "
         "timestamp=debug).";
  oss << " Configuration files accept the same mapping under 'log_categories'.";
  return oss.str();
}
} // namespace

/**
 * Parse command line arguments using CLI11.
 *
 * Helper arguments are collected verbatim; interpreting them as JSON is left
 * to the application.
 */
CliOptions parse_cli(int argc, char **argv) {
  CLI::App app{"spf helper toolkit command line"};
  app.footer(log_category_help_text());
  CliOptions options;

  app.add_flag("-v,--verbose", options.verbose, "Enable verbose output")
      ->group("General");
  app.add_option("-C,--config", options.config_file,
                 "Path to configuration file")
      ->type_name("FILE")
      ->group("General");
  app.add_flag_function(
         "--version",
         [](std::size_t) {
           std::cout << "spf " << kVersionString << std::endl;
           throw CliParseExit(0);
         },
         "Show version information and exit")
      ->group("General");
  app.add_flag("-d,--debug", options.debug,
               "Enable debug mode (dump call results)")
      ->group("General");
  app.add_flag("-l,--list", options.list,
               "List registered helper methods and exit")
      ->group("General");
  app.add_option(
         "-G,--log-level", options.log_level,
         "Set logging level (trace, debug, info, warn, error, critical, off)")
      ->type_name("LEVEL")
      ->default_val("info")
      ->group("Logging");
  app.add_option("-F,--log-file", options.log_file, "Write logs to FILE")
      ->type_name("FILE")
      ->group("Logging");
  app.add_option_function<std::vector<std::string>>(
         "--log-category",
         [&options](const std::vector<std::string> &values) {
           for (const auto &value : values) {
             auto pos = value.find('=');
             std::string name =
                 pos == std::string::npos ? value : value.substr(0, pos);
             std::string level = pos == std::string::npos
                                     ? std::string{"debug"}
                                     : value.substr(pos + 1);
             if (name.empty()) {
               throw CLI::ValidationError("--log-category",
                                          "category name must not be empty");
             }
             if (level.empty()) {
               level = "debug";
             }
             options.log_categories[name] = level;
           }
           options.log_categories_explicit = true;
         },
         "Enable a logging category (NAME or NAME=LEVEL). Repeat for several "
         "categories; see the help footer for the available ones.")
      ->allow_extra_args(false)
      ->type_name("NAME[=LEVEL]")
      ->group("Logging");
  app.add_option("method", options.method,
                 "Helper method to call (e.g. makeTimestamp, seconds)")
      ->type_name("METHOD");
  app.add_option("args", options.args,
                 "Helper arguments; valid JSON is decoded, anything else is "
                 "passed as a string")
      ->type_name("ARGS");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    int exit_code = app.exit(e);
    throw CliParseExit(exit_code);
  }
  return options;
}

} // namespace spf
