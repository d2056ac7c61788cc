#include "execution_guard.hpp"
#include "error_policy.hpp"
#include "log.hpp"

#include <memory>
#include <mutex>
#include <utility>

namespace spf {

namespace {
std::shared_ptr<spdlog::logger> guard_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("guard");
  }();
  return logger;
}

/// Serializes policy install/restore across threads; re-entrant per thread.
std::recursive_mutex &guard_mutex() {
  static std::recursive_mutex mutex;
  return mutex;
}

bool promote_report(const ErrorReport &report) {
  if ((error_reporting() & severity_bit(report.severity)) != 0) {
    throw ErrorException(report);
  }
  // masked by the reporting threshold
  return true;
}
} // namespace

ExecutionGuard::ExecutionGuard(ExceptionHandler handler)
    : handler_(std::move(handler)) {}

void ExecutionGuard::set_handler(ExceptionHandler handler) {
  std::lock_guard<std::mutex> lock(handler_mutex_);
  handler_ = std::move(handler);
}

ExceptionHandler ExecutionGuard::handler() const {
  std::lock_guard<std::mutex> lock(handler_mutex_);
  return handler_;
}

nlohmann::json ExecutionGuard::execute(const Callable &callable) const {
  std::lock_guard<std::recursive_mutex> serial(guard_mutex());
  std::exception_ptr failure;
  {
    ScopedErrorPolicy promote(promote_report);
    try {
      return callable();
    } catch (...) {
      failure = std::current_exception();
    }
  }
  return dispatch_failure(failure);
}

nlohmann::json
ExecutionGuard::dispatch_failure(std::exception_ptr failure) const {
  ExceptionHandler handler = this->handler();
  if (handler) {
    guard_log()->debug("Routing failure to registered exception handler");
    return handler(std::move(failure));
  }
  guard_log()->debug("Routing failure to default exception handler");
  return default_handler_.handle(std::move(failure));
}

} // namespace spf
