#include "exception_handler.hpp"
#include "error_policy.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <memory>
#include <string>

namespace spf {

namespace {
std::shared_ptr<spdlog::logger> errors_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("errors");
  }();
  return logger;
}

nlohmann::json failure(const std::string &type, const std::string &message) {
  return nlohmann::json{{"type", type}, {"message", message}};
}
} // namespace

nlohmann::json describe_failure(std::exception_ptr error) {
  if (!error) {
    return failure("none", "No failure recorded");
  }
  try {
    std::rethrow_exception(error);
  } catch (const ErrorException &e) {
    auto info = failure("ErrorException", e.what());
    info["severity"] = severity_name(e.severity());
    info["file"] = e.file();
    info["line"] = e.line();
    return info;
  } catch (const InvalidTimeRepresentation &e) {
    auto info = failure("InvalidTimeRepresentation", e.what());
    info["input"] = e.input();
    return info;
  } catch (const ReservedNameCollision &e) {
    return failure("ReservedNameCollision", e.what());
  } catch (const DuplicateHelperCollision &e) {
    return failure("DuplicateHelperCollision", e.what());
  } catch (const UnknownHelperMethod &e) {
    return failure("UnknownHelperMethod", e.what());
  } catch (const nlohmann::json::exception &e) {
    return failure("JsonError", e.what());
  } catch (const std::exception &e) {
    return failure("Exception", e.what());
  } catch (...) {
    return failure("Unknown", "Non-standard exception");
  }
}

nlohmann::json DefaultExceptionHandler::handle(std::exception_ptr error) const {
  nlohmann::json info = describe_failure(std::move(error));
  const std::string type = info.value("type", "Unknown");
  const std::string message = info.value("message", "");
  if (info.contains("file")) {
    errors_log()->error("Uncaught {}: {} in {}:{}", type, message,
                        info["file"].get<std::string>(),
                        info["line"].get<int>());
  } else {
    errors_log()->error("Uncaught {}: {}", type, message);
  }
  return nlohmann::json{{"error", info}};
}

bool is_error_marker(const nlohmann::json &result) {
  return result.is_object() && result.size() == 1 && result.contains("error") &&
         result["error"].is_object() && result["error"].contains("type");
}

} // namespace spf
