#include "error_policy.hpp"
#include "log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace spf {

namespace {

std::shared_ptr<spdlog::logger> errors_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("errors");
  }();
  return logger;
}

std::mutex g_policy_mutex;
ErrorPolicy g_policy;
std::atomic<unsigned> g_reporting{kReportAll};

void log_report(const ErrorReport &report) {
  auto log = errors_log();
  auto level = spdlog::level::warn;
  switch (report.severity) {
  case Severity::Notice:
    level = spdlog::level::info;
    break;
  case Severity::Warning:
  case Severity::Deprecated:
    level = spdlog::level::warn;
    break;
  case Severity::UserError:
    level = spdlog::level::err;
    break;
  }
  log->log(level, "{}: {} in {}:{}", severity_name(report.severity),
           report.message, report.file, report.line);
}

} // namespace

const char *severity_name(Severity severity) {
  switch (severity) {
  case Severity::Notice:
    return "notice";
  case Severity::Warning:
    return "warning";
  case Severity::Deprecated:
    return "deprecated";
  case Severity::UserError:
    return "user_error";
  }
  return "unknown";
}

Severity severity_from_string(const std::string &name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) {
                   return static_cast<char>(std::tolower(c));
                 });
  if (lower == "notice") {
    return Severity::Notice;
  }
  if (lower == "warning") {
    return Severity::Warning;
  }
  if (lower == "deprecated") {
    return Severity::Deprecated;
  }
  if (lower == "user_error" || lower == "error") {
    return Severity::UserError;
  }
  throw std::invalid_argument("Unknown error severity '" + name + "'");
}

ErrorPolicy set_error_policy(ErrorPolicy policy) {
  std::lock_guard<std::mutex> lock(g_policy_mutex);
  std::swap(g_policy, policy);
  return policy;
}

unsigned error_reporting() { return g_reporting.load(); }

unsigned set_error_reporting(unsigned mask) {
  return g_reporting.exchange(mask & kReportAll);
}

/**
 * Report a recoverable error.
 *
 * The active policy runs outside the policy lock so it may throw or install
 * a nested policy of its own.
 *
 * @param severity Severity flag of the report.
 * @param message Human-readable description.
 * @param file Source file that raised the report.
 * @param line Source line that raised the report.
 */
void raise_error(Severity severity, const std::string &message,
                 const char *file, int line) {
  ErrorReport report{severity, message, file != nullptr ? file : "", line};
  ErrorPolicy policy;
  {
    std::lock_guard<std::mutex> lock(g_policy_mutex);
    policy = g_policy;
  }
  if (policy && policy(report)) {
    return;
  }
  if ((error_reporting() & severity_bit(severity)) == 0) {
    return;
  }
  log_report(report);
}

} // namespace spf
