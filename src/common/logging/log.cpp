#include "common/logging/log.hpp"

#include <algorithm>
#include <iterator>
#include <mutex>
#include <utility>
#include <vector>

#include <gflags/gflags.h>
#include <spdlog/async.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

DECLARE_string(log_level);
DECLARE_string(log_file);
DECLARE_int32(log_max_size);
DECLARE_int32(log_max_files);
DECLARE_bool(log_to_stderr);

namespace im::log {
namespace {

constexpr std::size_t kQueueSize = 8192;
constexpr std::size_t kMinRotateBytes = 1024;
constexpr const char* kLoggerName = "im_orchestrator";
constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";

struct Settings {
  std::string file;
  std::size_t rotate_bytes = 0;
  std::size_t rotate_files = 1;
  spdlog::level::level_enum level = spdlog::level::info;
  bool to_stderr = false;
};

auto settings_from_flags() -> Settings {
  Settings settings;
  settings.file = FLAGS_log_file;
  settings.rotate_bytes = std::max(static_cast<std::size_t>(std::max(FLAGS_log_max_size, 0)), kMinRotateBytes);
  settings.rotate_files = static_cast<std::size_t>(std::max(FLAGS_log_max_files, 1));
  // from_str maps unknown names to off; keep info as the fallback instead.
  auto level = spdlog::level::from_str(FLAGS_log_level);
  if (level == spdlog::level::off && FLAGS_log_level != "off") {
    level = spdlog::level::info;
  }
  settings.level = level;
  settings.to_stderr = FLAGS_log_to_stderr;
  return settings;
}

auto make_sinks(const Settings& settings) -> std::vector<spdlog::sink_ptr> {
  std::vector<spdlog::sink_ptr> sinks;
  if (!settings.file.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        settings.file, settings.rotate_bytes, settings.rotate_files));
  }
  // Never leave the logger without an output.
  if (settings.to_stderr || sinks.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  }
  for (auto& sink : sinks) {
    sink->set_level(settings.level);
  }
  return sinks;
}

std::mutex g_mutex;
std::shared_ptr<spdlog::async_logger> g_logger;

}  // namespace

void init() {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (g_logger) {
    return;
  }

  const auto settings = settings_from_flags();
  auto sinks = make_sinks(settings);

  spdlog::init_thread_pool(kQueueSize, 1);
  g_logger = std::make_shared<spdlog::async_logger>(kLoggerName, sinks.begin(), sinks.end(),
                                                    spdlog::thread_pool(),
                                                    spdlog::async_overflow_policy::block);
  g_logger->set_level(settings.level);
  g_logger->set_pattern(kPattern);
  spdlog::set_default_logger(g_logger);

  spdlog::info("logging to {} at level {}", settings.file.empty() ? "stderr" : settings.file,
               spdlog::level::to_string_view(settings.level));
}

void shutdown() {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (!g_logger) {
    return;
  }
  g_logger->flush();
  spdlog::shutdown();
  g_logger.reset();
}

void info(std::string_view event, std::unordered_map<std::string, std::string> fields) {
  std::vector<std::pair<std::string, std::string>> sorted(std::make_move_iterator(fields.begin()),
                                                          std::make_move_iterator(fields.end()));
  std::sort(sorted.begin(), sorted.end());
  fmt::memory_buffer line;
  fmt::format_to(std::back_inserter(line), "{}", event);
  for (const auto& [key, value] : sorted) {
    fmt::format_to(std::back_inserter(line), " {}={}", key, value);
  }
  spdlog::info(std::string_view(line.data(), line.size()));
}

}  // namespace im::log
