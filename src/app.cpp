#include "app.hpp"
#include "cli.hpp"
#include "config.hpp"
#include "error_policy.hpp"
#include "exception_handler.hpp"
#include "facade.hpp"
#include "log.hpp"
#include <cstddef>
#include <exception>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

namespace spf {

namespace {
std::shared_ptr<spdlog::logger> app_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("app");
  }();
  return logger;
}

/**
 * Convert a level name to a spdlog level. Unknown names yield @p fallback.
 */
spdlog::level::level_enum parse_level(const std::string &name,
                                      spdlog::level::level_enum fallback,
                                      bool *valid = nullptr) {
  spdlog::level::level_enum lvl = spdlog::level::from_str(name);
  bool ok = lvl != spdlog::level::off || name == "off";
  if (valid != nullptr) {
    *valid = ok;
  }
  return ok ? lvl : fallback;
}
} // namespace

HelperArgs decode_cli_arguments(const std::vector<std::string> &raw) {
  HelperArgs args;
  args.reserve(raw.size());
  for (const auto &arg : raw) {
    if (nlohmann::json::accept(arg)) {
      args.push_back(nlohmann::json::parse(arg));
    } else {
      args.emplace_back(arg);
    }
  }
  return args;
}

/**
 * Execute the main application flow.
 *
 * Parses the command line, loads the optional configuration file, sets up
 * logging and the recoverable-error mask, and then either lists the helpers
 * or performs one guarded helper call.
 */
int App::run(int argc, char **argv) {
  result_ = nullptr;
  try {
    options_ = parse_cli(argc, argv);
  } catch (const CliParseExit &exit) {
    return exit.exit_code();
  }

  if (!options_.config_file.empty()) {
    try {
      config_ = Config::from_file(options_.config_file);
    } catch (const std::exception &e) {
      app_log()->error("Unable to load configuration '{}': {}",
                       options_.config_file, e.what());
      return 1;
    }
  }

  if (!options_.log_categories_explicit) {
    options_.log_categories = config_.log_categories();
  } else {
    config_.set_log_categories(options_.log_categories);
  }
  std::string level_str = options_.verbose ? "debug" : "info";
  if (options_.log_level != "info") {
    level_str = options_.log_level;
  } else if (config_.log_level() != "info") {
    level_str = config_.log_level();
  }
  bool level_valid = true;
  spdlog::level::level_enum lvl =
      parse_level(level_str, spdlog::level::info, &level_valid);
  std::string log_file = config_.log_file();
  if (!options_.log_file.empty()) {
    log_file = options_.log_file;
  }
  init_logger(lvl, config_.log_pattern(), log_file,
              static_cast<std::size_t>(config_.log_rotate()));
  if (!level_valid) {
    app_log()->warn("Unknown log level '{}', using info", level_str);
  }
  std::unordered_map<std::string, spdlog::level::level_enum> category_levels;
  for (const auto &[category, name] : options_.log_categories) {
    bool valid = true;
    auto category_level = parse_level(name, lvl, &valid);
    if (!valid) {
      app_log()->warn("Ignoring invalid log level '{}' for category '{}'",
                      name, category);
      continue;
    }
    category_levels[category] = category_level;
  }
  configure_log_categories(category_levels);
  if (options_.verbose) {
    app_log()->debug("Verbose mode enabled");
  }

  set_error_reporting(config_.error_reporting());
  Facade &facade = Facade::instance();
  facade.set_debug(options_.debug || config_.debug());
  facade.init();

  if (options_.list) {
    return list_helpers();
  }
  if (options_.method.empty()) {
    app_log()->error("No helper method given; use --list to see the "
                     "available methods");
    return 1;
  }
  return call_helper();
}

int App::list_helpers() {
  for (const auto &entry : Facade::instance().registry().entries()) {
    out_ << entry.method << " " << entry.provider << "::" << entry.method
         << "\n";
  }
  return 0;
}

int App::call_helper() {
  Facade &facade = Facade::instance();
  const HelperArgs args = decode_cli_arguments(options_.args);
  app_log()->debug("Calling '{}' with {} argument(s)", options_.method,
                   args.size());
  const std::string &method = options_.method;
  result_ = facade.run([&facade, &method, &args] {
    return facade.call(method, args);
  });
  out_ << result_.dump(-1, ' ', false,
                       nlohmann::json::error_handler_t::replace)
       << "\n";
  facade.dump(result_, out_);
  return is_error_marker(result_) ? 1 : 0;
}

} // namespace spf
