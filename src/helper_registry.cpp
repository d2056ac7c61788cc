#include "helper_registry.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <utility>

namespace spf {

namespace {
std::shared_ptr<spdlog::logger> registry_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("registry");
  }();
  return logger;
}
} // namespace

std::string helper_key(const std::string &value) {
  std::string key = value;
  std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return key;
}

HelperRegistry::HelperRegistry(const std::vector<std::string> &reserved_names) {
  for (const auto &name : reserved_names) {
    reserved_.insert(helper_key(name));
  }
}

void HelperRegistry::register_provider(const HelperProvider &provider) {
  registry_log()->debug("Registering {} helper(s) from '{}'",
                        provider.methods.size(), provider.name);
  for (const auto &method : provider.methods) {
    register_method(provider.name, method);
  }
}

void HelperRegistry::register_method(const std::string &provider,
                                     const HelperMethod &method) {
  const std::string key = helper_key(method.name);
  if (reserved_.count(key) != 0) {
    registry_log()->error("Helper '{}' from '{}' collides with a native method",
                          method.name, provider);
    throw ReservedNameCollision(method.name);
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = helpers_.find(key);
  if (it != helpers_.end() && it->second.provider != provider) {
    registry_log()->error("Helper '{}' already provided by '{}', rejected "
                          "duplicate from '{}'",
                          method.name, it->second.provider, provider);
    throw DuplicateHelperCollision(method.name, it->second.provider, provider);
  }
  helpers_[key] = HelperEntry{provider, method.name, method.function};
  registry_log()->trace("Registered helper {}::{}", provider, method.name);
}

std::optional<HelperEntry>
HelperRegistry::resolve(const std::string &method) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = helpers_.find(helper_key(method));
  if (it == helpers_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool HelperRegistry::is_reserved(const std::string &method) const {
  return reserved_.count(helper_key(method)) != 0;
}

std::vector<HelperEntry> HelperRegistry::entries() const {
  std::vector<std::pair<std::string, HelperEntry>> sorted;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sorted.assign(helpers_.begin(), helpers_.end());
  }
  std::sort(sorted.begin(), sorted.end(),
            [](const auto &a, const auto &b) { return a.first < b.first; });
  std::vector<HelperEntry> result;
  result.reserve(sorted.size());
  for (auto &item : sorted) {
    result.push_back(std::move(item.second));
  }
  return result;
}

std::size_t HelperRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return helpers_.size();
}

} // namespace spf
