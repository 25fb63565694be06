#include "common/logging/log.hpp"

#include <algorithm>
#include <mutex>
#include <vector>

#include <gflags/gflags.h>
#include <spdlog/async.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

DECLARE_string(log_level);
DECLARE_string(log_file);
DECLARE_int32(log_max_size);
DECLARE_int32(log_max_files);
DECLARE_bool(log_to_stderr);

namespace {

auto parse_log_level(const std::string& level) -> spdlog::level::level_enum {
  auto parsed = spdlog::level::from_str(level);
  // from_str maps unknown names to off; fall back to info instead.
  if (parsed == spdlog::level::off && level != "off") {
    return spdlog::level::info;
  }
  return parsed;
}

auto make_sinks() -> std::vector<spdlog::sink_ptr> {
  std::vector<spdlog::sink_ptr> sinks;
  if (!FLAGS_log_file.empty()) {
    const auto max_size = static_cast<std::size_t>(std::max(FLAGS_log_max_size, 1024));
    const auto max_files = static_cast<std::size_t>(std::max(FLAGS_log_max_files, 1));
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        FLAGS_log_file, max_size, max_files));
  }
  if (FLAGS_log_to_stderr) {
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  }
  return sinks;
}

}  // namespace

namespace gp::log {

namespace {
  std::mutex g_mutex;
  std::shared_ptr<spdlog::async_logger> g_logger;
}

void init() {
  std::lock_guard lock(g_mutex);
  if (g_logger) {
    return;
  }

  auto sinks = make_sinks();
  const auto level = parse_log_level(FLAGS_log_level);
  for (auto& sink : sinks) {
    sink->set_level(level);
  }

  spdlog::init_thread_pool(8192, 1);
  g_logger = std::make_shared<spdlog::async_logger>(
      "graphpack", sinks.begin(), sinks.end(), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(g_logger);
  spdlog::set_level(level);
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
  spdlog::info("Logger initialized: file={}, level={}", FLAGS_log_file, FLAGS_log_level);
}

void shutdown() {
  std::lock_guard lock(g_mutex);
  if (!g_logger) {
    return;
  }
  g_logger->flush();
  spdlog::shutdown();
  g_logger.reset();
}

void info(std::string_view event, std::unordered_map<std::string, std::string> fields) {
  std::string msg{event};
  for (const auto& [key, value] : fields) {
    msg += " " + key + "=" + value;
  }
  spdlog::info(msg);
}

}  // namespace gp::log
