#include "app.hpp"
#include "log.hpp"

#include <exception>
#include <memory>
#include <spdlog/spdlog.h>

namespace {
std::shared_ptr<spdlog::logger> main_log() {
  static auto logger = [] {
    spf::ensure_default_logger();
    return spf::category_logger("main");
  }();
  return logger;
}
} // namespace

/**
 * Program entry point. Runs a single helper call and flushes the logs.
 *
 * @param argc Number of CLI arguments received from the OS.
 * @param argv Null-terminated array containing the raw CLI arguments.
 * @return Process exit code forwarded from the application logic.
 */
int main(int argc, char **argv) {
  int ret = 1;
  try {
    spf::App app;
    ret = app.run(argc, argv);
  } catch (const std::exception &e) {
    main_log()->critical("Unhandled exception: {}", e.what());
  }
  spdlog::shutdown();
  return ret;
}
