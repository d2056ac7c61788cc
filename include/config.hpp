#ifndef SPF_CONFIG_HPP
#define SPF_CONFIG_HPP

#include "error_policy.hpp"
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <unordered_map>

namespace spf {

/// Toolkit configuration loaded from a YAML, TOML, or JSON file.
class Config {
public:
  /** Check whether debug mode is requested. */
  bool debug() const { return debug_; }

  /// Set debug mode.
  void set_debug(bool debug) { debug_ = debug; }

  /// Get logging verbosity level.
  const std::string &log_level() const { return log_level_; }

  /// Set logging verbosity level.
  void set_log_level(const std::string &level) { log_level_ = level; }

  /// Get logging pattern.
  const std::string &log_pattern() const { return log_pattern_; }

  /// Set logging pattern.
  void set_log_pattern(const std::string &pattern) { log_pattern_ = pattern; }

  /// Path to the log file.
  const std::string &log_file() const { return log_file_; }

  /// Set path for the log file.
  void set_log_file(const std::string &file) { log_file_ = file; }

  /// Number of rotated log files to keep (0 disables rotation).
  int log_rotate() const { return log_rotate_; }

  /// Set number of rotated log files to keep.
  void set_log_rotate(int count) { log_rotate_ = count < 0 ? 0 : count; }

  /// Category specific log level overrides.
  const std::unordered_map<std::string, std::string> &log_categories() const {
    return log_categories_;
  }

  /// Replace category log level overrides.
  void set_log_categories(
      const std::unordered_map<std::string, std::string> &categories) {
    log_categories_ = categories;
  }

  /// Severity mask of recoverable errors promoted inside guarded calls.
  unsigned error_reporting() const { return error_reporting_; }

  /// Set the severity mask.
  void set_error_reporting(unsigned mask) {
    error_reporting_ = mask & kReportAll;
  }

  /**
   * Populate settings from a JSON object. Keys may be grouped under the
   * `core`, `logging` and `errors` sections.
   *
   * @throws nlohmann::json::exception When a value has the wrong type.
   * @throws std::invalid_argument When `error_reporting` is malformed.
   */
  void load_json(const nlohmann::json &j);

  /// Build a configuration from a JSON object.
  static Config from_json(const nlohmann::json &j);

  /**
   * Load configuration from disk. The format is chosen by extension
   * (`.yaml`/`.yml`, `.json`, `.toml`/`.tml`).
   *
   * @throws std::runtime_error When the file cannot be read or the
   *         extension is unsupported.
   */
  static Config from_file(const std::string &path);

private:
  bool debug_{false};
  std::string log_level_{"info"};
  std::string log_pattern_;
  std::string log_file_;
  int log_rotate_{3};
  std::unordered_map<std::string, std::string> log_categories_;
  unsigned error_reporting_{kReportAll};
};

/**
 * Parse an error reporting mask: an integer, `"all"`, `"none"`, a severity
 * name, or a list of severity names.
 *
 * @throws std::invalid_argument When the value cannot be interpreted.
 */
unsigned parse_error_reporting(const nlohmann::json &value);

} // namespace spf

#endif // SPF_CONFIG_HPP
