#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>
#include <cstddef>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

namespace dfr::log {

using spdlog::trace;
using spdlog::debug;
using spdlog::info;
using spdlog::warn;
using spdlog::error;
using spdlog::critical;

using Logger = std::shared_ptr<spdlog::logger>;
using Sink = std::shared_ptr<spdlog::sinks::sink>;

/// Process logger configuration. `from_flags` reads the `--log_*` flags.
struct LogSettings {
  spdlog::level::level_enum level = spdlog::level::info;
  std::string file = "dfr.log";
  std::size_t max_size = 10 * 1024 * 1024;
  int max_files = 3;
  bool to_stderr = false;

  static auto from_flags() -> LogSettings;
};

/// Level by name; unknown names fall back to info.
auto parse_level(std::string_view name) -> spdlog::level::level_enum;

/// Install the async process logger. Later calls are ignored until `shutdown`.
void init(const LogSettings& settings);
inline void init() { init(LogSettings::from_flags()); }

void shutdown();

using Field = std::pair<std::string_view, nlohmann::json>;

/// `name key=value ...`; string values are written bare, others as JSON.
auto format_event(std::string_view name, std::initializer_list<Field> fields) -> std::string;

/// Structured info-level record on the default logger.
void event(std::string_view name, std::initializer_list<Field> fields);

/// Logger for advisory diagnostics raised while translating a pipeline.
/// Writes synchronously to `sink` and never flushes on its own; the owner
/// flushes once a run is over. Falls back to the default logger when no sink
/// is given.
auto make_diagnostics_logger(Sink sink) -> Logger;

}  // namespace dfr::log
