#include "log.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {
constexpr const char *kRootLogger = "spf";
constexpr std::size_t kRotateBytes = 1024 * 1024 * 5;

std::weak_ptr<spdlog::logger> g_logger;
std::mutex g_logger_mutex;
std::once_flag g_thread_pool_once;

void ensure_thread_pool() {
  std::call_once(g_thread_pool_once, [] {
    constexpr std::size_t queue_size = 8192;
    constexpr std::size_t num_threads = 1;
    spdlog::init_thread_pool(queue_size, num_threads);
  });
}

std::shared_ptr<spdlog::details::thread_pool> logger_pool() {
  auto pool = spdlog::thread_pool();
  if (!pool) {
    ensure_thread_pool();
    pool = spdlog::thread_pool();
  }
  return pool;
}

/**
 * Sink shared by the root logger and every category logger. Sinks attached
 * later (e.g. a log file configured after startup) reach all loggers.
 */
std::shared_ptr<spdlog::sinks::dist_sink_mt> shared_sink() {
  static auto sink = [] {
    auto dist = std::make_shared<spdlog::sinks::dist_sink_mt>();
    dist->add_sink(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    return dist;
  }();
  return sink;
}

spdlog::sink_ptr g_file_sink;
std::string g_file;

/**
 * Attach (or replace) the file sink.
 *
 * @param file Log file path; empty leaves the current file sink untouched.
 * @param rotate_files Rotation count; zero selects a basic file sink.
 */
void attach_file_sink(const std::string &file, std::size_t rotate_files) {
  if (file.empty() || file == g_file) {
    return;
  }
  if (g_file_sink) {
    shared_sink()->remove_sink(g_file_sink);
  }
  if (rotate_files > 0) {
    g_file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        file, kRotateBytes, rotate_files);
  } else {
    g_file_sink =
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(file, true);
  }
  shared_sink()->add_sink(g_file_sink);
  g_file = file;
}
} // namespace

namespace spf {

/**
 * Initialize the global spdlog logger.
 *
 * Repeated calls keep the existing sinks and only adjust level and pattern.
 */
void init_logger(spdlog::level::level_enum level, const std::string &pattern,
                 const std::string &file, std::size_t rotate_files) {
  ensure_thread_pool();
  std::unique_lock<std::mutex> lock(g_logger_mutex);
  auto logger = spdlog::get(kRootLogger);
  if (!logger) {
    logger = std::make_shared<spdlog::async_logger>(
        kRootLogger, shared_sink(), logger_pool(),
        spdlog::async_overflow_policy::block);
    spdlog::set_default_logger(logger);
    g_logger = logger;
  }
  attach_file_sink(file, rotate_files);
  lock.unlock();
  // Category loggers created before initialisation follow the new level too.
  spdlog::set_level(level);
  if (!pattern.empty()) {
    spdlog::set_pattern(pattern);
  }
  logger->debug("Logger initialised (level={}, file='{}', rotate={})",
                spdlog::level::to_string_view(level), file, rotate_files);
}

void ensure_default_logger() {
  auto logger = spdlog::default_logger();
  auto locked = g_logger.lock();
  if (!logger || !locked || logger.get() != locked.get()) {
    init_logger(spdlog::level::info);
  }
}

std::shared_ptr<spdlog::logger> category_logger(const std::string &category) {
  const std::string name = std::string(kRootLogger) + "." + category;
  std::unique_lock<std::mutex> lock(g_logger_mutex);
  auto logger = spdlog::get(name);
  if (logger) {
    return logger;
  }
  if (g_logger.expired()) {
    lock.unlock();
    init_logger(spdlog::level::info);
    lock.lock();
    logger = spdlog::get(name);
    if (logger) {
      return logger;
    }
  }
  auto root = g_logger.lock();
  auto new_logger = std::make_shared<spdlog::async_logger>(
      name, shared_sink(), logger_pool(),
      spdlog::async_overflow_policy::block);
  new_logger->set_level(root ? root->level() : spdlog::level::info);
  spdlog::register_logger(new_logger);
  return new_logger;
}

void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides) {
  if (overrides.empty()) {
    return;
  }
  for (const auto &[category, level] : overrides) {
    auto logger = category_logger(category);
    logger->set_level(level);
    logger->debug("Category '{}' set to level {}", category,
                  spdlog::level::to_string_view(level));
  }
  category_logger("logging")->debug("Applied {} log category override(s)",
                                    overrides.size());
}

} // namespace spf
