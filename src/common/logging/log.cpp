#include "common/logging/log.hpp"

#include <gflags/gflags.h>
#include <spdlog/async.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <vector>

DECLARE_string(log_level);
DECLARE_string(log_file);
DECLARE_int32(log_max_size);
DECLARE_int32(log_max_files);
DECLARE_bool(log_to_stderr);

namespace dfr::log {
namespace {

constexpr std::size_t kMinRotateSize = 1024;

std::shared_ptr<spdlog::async_logger> g_logger;

}  // namespace

auto LogSettings::from_flags() -> LogSettings {
  LogSettings settings;
  settings.level = parse_level(FLAGS_log_level);
  settings.file = FLAGS_log_file;
  settings.max_size = static_cast<std::size_t>(std::max(FLAGS_log_max_size, 0));
  settings.max_files = FLAGS_log_max_files;
  settings.to_stderr = FLAGS_log_to_stderr;
  return settings;
}

auto parse_level(std::string_view name) -> spdlog::level::level_enum {
  if (name == "off") {
    return spdlog::level::off;
  }
  // from_str maps every unknown name to off.
  auto level = spdlog::level::from_str(std::string(name));
  return level == spdlog::level::off ? spdlog::level::info : level;
}

void init(const LogSettings& settings) {
  if (g_logger) {
    return;
  }

  std::vector<Sink> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
    settings.file, std::max(settings.max_size, kMinRotateSize), static_cast<std::size_t>(std::max(settings.max_files, 1))));
  if (settings.to_stderr) {
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  }
  for (auto& sink : sinks) {
    sink->set_level(settings.level);
  }

  spdlog::init_thread_pool(8192, 1);
  g_logger = std::make_shared<spdlog::async_logger>("dfr", sinks.begin(), sinks.end(), spdlog::thread_pool(),
                                                    spdlog::async_overflow_policy::block);
  g_logger->set_level(settings.level);
  g_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
  spdlog::set_default_logger(g_logger);

  auto level_name = spdlog::level::to_string_view(settings.level);
  event("logger_initialized",
        {{"file", settings.file}, {"level", std::string(level_name.data(), level_name.size())}});
}

void shutdown() {
  if (!g_logger) {
    return;
  }
  g_logger->flush();
  spdlog::shutdown();
  g_logger.reset();
}

auto format_event(std::string_view name, std::initializer_list<Field> fields) -> std::string {
  std::string line(name);
  for (const auto& [key, value] : fields) {
    line += ' ';
    line += key;
    line += '=';
    line += value.is_string() ? value.get<std::string>() : value.dump();
  }
  return line;
}

void event(std::string_view name, std::initializer_list<Field> fields) {
  spdlog::info(format_event(name, fields));
}

auto make_diagnostics_logger(Sink sink) -> Logger {
  if (!sink) {
    return spdlog::default_logger();
  }
  auto logger = std::make_shared<spdlog::logger>("dfr.diagnostics", std::move(sink));
  logger->set_level(spdlog::level::trace);
  logger->set_pattern("[%l] %v");
  return logger;
}

}  // namespace dfr::log
