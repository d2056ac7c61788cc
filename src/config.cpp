#include "config.hpp"
#include "log.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_set>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <toml++/toml.h>
#include <yaml-cpp/yaml.h>

namespace spf {

namespace {

std::shared_ptr<spdlog::logger> config_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("config");
  }();
  return logger;
}

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

/**
 * Interpret a YAML scalar as bool, integer, float, or string, in that order.
 */
nlohmann::json yaml_scalar_to_json(const std::string &s) {
  if (s == "true" || s == "True" || s == "TRUE")
    return true;
  if (s == "false" || s == "False" || s == "FALSE")
    return false;
  if (!s.empty()) {
    long long i = 0;
    const char *first = s.data() + (s.front() == '+' ? 1 : 0);
    auto res = std::from_chars(first, s.data() + s.size(), i);
    if (res.ec == std::errc{} && res.ptr == s.data() + s.size())
      return i;
    char *end = nullptr;
    double d = std::strtod(s.c_str(), &end);
    if (end == s.c_str() + s.size() &&
        std::isdigit(static_cast<unsigned char>(s.back())))
      return d;
  }
  return s;
}

/**
 * Convert a YAML node into a structurally equivalent JSON object.
 *
 * @param node YAML node to transform.
 * @return JSON value mirroring the YAML content.
 */
nlohmann::json yaml_to_json(const YAML::Node &node) {
  using nlohmann::json;
  switch (node.Type()) {
  case YAML::NodeType::Null:
    return nullptr;
  case YAML::NodeType::Scalar:
    return yaml_scalar_to_json(node.Scalar());
  case YAML::NodeType::Sequence: {
    json arr = json::array();
    auto &array = arr.get_ref<json::array_t &>();
    array.reserve(node.size());
    std::transform(node.begin(), node.end(), std::back_inserter(array),
                   [](const YAML::Node &item) { return yaml_to_json(item); });
    return arr;
  }
  case YAML::NodeType::Map: {
    json obj = json::object();
    for (const auto &kv : node) {
      obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
    }
    return obj;
  }
  default:
    return nullptr;
  }
}

/**
 * Translate a TOML node to a JSON representation.
 */
nlohmann::json toml_to_json(const toml::node &node) {
  using nlohmann::json;
  if (const auto *table = node.as_table()) {
    json obj = json::object();
    for (const auto &kv : *table) {
      obj[std::string(kv.first.str())] = toml_to_json(kv.second);
    }
    return obj;
  }

  if (const auto *array = node.as_array()) {
    json arr = json::array();
    for (const auto &item : *array) {
      arr.push_back(toml_to_json(item));
    }
    return arr;
  }

  if (const auto *value = node.as_boolean())
    return value->get();
  if (const auto *value = node.as_integer())
    return value->get();
  if (const auto *value = node.as_floating_point())
    return value->get();
  if (const auto *value = node.as_string())
    return value->get();

  std::ostringstream oss;
  if (const auto *value = node.as_date()) {
    oss << value->get();
    return oss.str();
  }
  if (const auto *value = node.as_time()) {
    oss << value->get();
    return oss.str();
  }
  if (const auto *value = node.as_date_time()) {
    oss << value->get();
    return oss.str();
  }
  return nullptr;
}

constexpr std::string_view kSections[] = {"core", "logging", "errors"};

/**
 * Merge the recognised sections into the root object so grouped and flat
 * configuration files expose the same keys.
 */
nlohmann::json normalize_config_sections(const nlohmann::json &source) {
  nlohmann::json normalized = source;
  for (std::string_view name : kSections) {
    auto it = normalized.find(std::string{name});
    if (it == normalized.end() || !it->is_object()) {
      continue;
    }
    const nlohmann::json section = *it;
    normalized.erase(std::string{name});
    for (const auto &[key, value] : section.items()) {
      normalized[key] = value;
    }
  }
  return normalized;
}

} // namespace

unsigned parse_error_reporting(const nlohmann::json &value) {
  if (value.is_number_integer()) {
    return static_cast<unsigned>(value.get<long long>()) & kReportAll;
  }
  if (value.is_string()) {
    const std::string name = to_lower_copy(value.get<std::string>());
    if (name == "all") {
      return kReportAll;
    }
    if (name == "none") {
      return 0;
    }
    return severity_bit(severity_from_string(name));
  }
  if (value.is_array()) {
    unsigned mask = 0;
    for (const auto &item : value) {
      mask |= parse_error_reporting(item);
    }
    return mask;
  }
  throw std::invalid_argument("error_reporting must be an integer, a "
                              "severity name or a list of severity names");
}

/**
 * Populate configuration settings from a JSON object.
 *
 * @param j JSON document holding configuration keys.
 */
void Config::load_json(const nlohmann::json &j) {
  nlohmann::json cfg = normalize_config_sections(j);
  static const std::unordered_set<std::string> known = {
      "debug",      "log_level",      "log_pattern",    "log_file",
      "log_rotate", "log_categories", "error_reporting"};
  for (const auto &item : cfg.items()) {
    if (known.count(item.key()) == 0) {
      SPF_RAISE(Severity::Warning,
                "Unknown configuration key '" + item.key() + "'");
    }
  }

  if (cfg.contains("debug")) {
    set_debug(cfg["debug"].get<bool>());
  }
  if (cfg.contains("log_level")) {
    set_log_level(cfg["log_level"].get<std::string>());
  }
  if (cfg.contains("log_pattern")) {
    set_log_pattern(cfg["log_pattern"].get<std::string>());
  }
  if (cfg.contains("log_file")) {
    set_log_file(cfg["log_file"].get<std::string>());
  }
  if (cfg.contains("log_rotate")) {
    set_log_rotate(cfg["log_rotate"].get<int>());
  }
  if (cfg.contains("log_categories")) {
    std::unordered_map<std::string, std::string> categories;
    for (const auto &[category, level] : cfg["log_categories"].items()) {
      categories[category] = level.get<std::string>();
    }
    set_log_categories(categories);
  }
  if (cfg.contains("error_reporting")) {
    set_error_reporting(parse_error_reporting(cfg["error_reporting"]));
  }
}

Config Config::from_json(const nlohmann::json &j) {
  Config cfg;
  cfg.load_json(j);
  return cfg;
}

/**
 * Load configuration from a file on disk.
 *
 * The file type is inferred from the extension and may be YAML, JSON, or
 * TOML. Errors during parsing are logged and rethrown.
 */
Config Config::from_file(const std::string &path) {
  config_log()->debug("Loading config from {}", path);
  auto pos = path.find_last_of('.');
  if (pos == std::string::npos) {
    config_log()->error("Unknown config file extension for {}", path);
    throw std::runtime_error("Unknown config file extension");
  }
  const std::string ext = to_lower_copy(path.substr(pos + 1));
  nlohmann::json j;
  try {
    if (ext == "yaml" || ext == "yml") {
      j = yaml_to_json(YAML::LoadFile(path));
    } else if (ext == "json") {
      std::ifstream f(path);
      if (!f) {
        config_log()->error("Failed to open config file {}", path);
        throw std::runtime_error("Failed to open config file");
      }
      f >> j;
    } else if (ext == "toml" || ext == "tml") {
      toml::table tbl = toml::parse_file(path);
      j = toml_to_json(tbl);
    } else {
      config_log()->error("Unsupported config format: {}", ext);
      throw std::runtime_error("Unsupported config format");
    }
  } catch (const std::exception &e) {
    config_log()->error("Failed to load config {}: {}", path, e.what());
    throw;
  }
  if (j.is_null()) {
    j = nlohmann::json::object();
  }
  Config cfg;
  cfg.load_json(j);
  config_log()->info("Config loaded from {}", path);
  return cfg;
}

} // namespace spf
