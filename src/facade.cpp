#include "facade.hpp"
#include "errors.hpp"
#include "helpers/datetime_helper.hpp"
#include "log.hpp"

#include <cstdio>
#include <memory>
#include <stdexcept>

#if defined(_WIN32)
#include <io.h>
#else
#include <fcntl.h>
#include <unistd.h>
#endif

namespace spf {

namespace {
std::shared_ptr<spdlog::logger> facade_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("facade");
  }();
  return logger;
}

const nlohmann::json &require_argument(const std::string &method,
                                       const HelperArgs &args) {
  if (args.empty()) {
    throw std::invalid_argument(method +
                                "() expects exactly 1 argument, 0 given");
  }
  return args.front();
}
} // namespace

Facade::Facade() : registry_(native_methods()) {}

Facade &Facade::instance() {
  static Facade facade;
  return facade;
}

const std::vector<std::string> &Facade::native_methods() {
  static const std::vector<std::string> names = {
      "instance", "native_methods", "is_cli",
      "is_debug", "set_debug",      "dump",
      "set_exception_handler",      "init",
      "run",      "register_helpers",
      "add_helper_method",          "call",
      "registry"};
  return names;
}

bool Facade::is_cli() {
#if defined(_WIN32)
  return _get_osfhandle(_fileno(stdin)) != -1;
#else
  return fcntl(STDIN_FILENO, F_GETFD) != -1;
#endif
}

void Facade::dump(const nlohmann::json &value, std::ostream &out) const {
  if (!is_debug()) {
    return;
  }
  out << value.dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
      << "\n";
}

void Facade::set_exception_handler(ExceptionHandler handler) {
  guard_.set_handler(std::move(handler));
}

void Facade::init() {
  std::lock_guard<std::mutex> lock(init_mutex_);
  if (initialized_) {
    return;
  }
  register_helpers({helpers::datetime_helper()});
  initialized_ = true;
  facade_log()->debug("Facade initialised with {} helper(s)",
                      registry_.size());
}

void Facade::register_helpers(const std::vector<HelperProvider> &providers) {
  for (const auto &provider : providers) {
    registry_.register_provider(provider);
  }
}

void Facade::add_helper_method(const std::string &provider,
                               const HelperMethod &method) {
  registry_.register_method(provider, method);
}

nlohmann::json Facade::call(const std::string &method, const HelperArgs &args) {
  const std::string key = helper_key(method);
  if (key == "is_cli") {
    return is_cli();
  }
  if (key == "is_debug") {
    return is_debug();
  }
  if (key == "set_debug") {
    set_debug(!args.empty() && args.front().get<bool>());
    return nullptr;
  }
  if (key == "dump") {
    dump(require_argument(method, args));
    return nullptr;
  }

  auto entry = registry_.resolve(method);
  if (!entry) {
    facade_log()->debug("No helper registered for '{}'", method);
    throw UnknownHelperMethod(method);
  }
  facade_log()->debug("Dispatching '{}' to {}::{}", method, entry->provider,
                      entry->method);
  return entry->function(args);
}

} // namespace spf
