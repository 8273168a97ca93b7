#include "runner/engine_settings.hpp"

#include <format>
#include <thread>

namespace dfr::runner {
namespace {

auto default_parallelism(const MasterEndpoint& master) -> int {
  if (std::holds_alternative<CollectionLocal>(master) || std::holds_alternative<Remote>(master)) {
    return 1;
  }
  auto cores = static_cast<int>(std::thread::hardware_concurrency());
  return cores > 0 ? cores : 1;
}

}  // namespace

auto resolve_engine_settings(const PipelineOptions& options, const MasterEndpoint& master,
                             const log::Logger& logger) -> Expected<EngineSettings> {
  if (options.checkpoint.enabled && options.checkpoint.interval.count() <= 0) {
    return tl::unexpected(make_error(
      ErrorCode::InvalidOptions,
      std::format("checkpoint interval must be positive, got {} ms", options.checkpoint.interval.count())));
  }

  EngineSettings settings;
  settings.master = master;
  settings.parallelism = options.parallelism > 0 ? options.parallelism : default_parallelism(master);
  settings.max_parallelism = options.max_parallelism > 0 ? options.max_parallelism : -1;
  settings.checkpoint = options.checkpoint;
  settings.object_reuse = options.object_reuse;
  settings.temp_location = options.temp_location;

  if (const auto* remote = std::get_if<Remote>(&master)) {
    settings.remote = parse_host_port(remote->address);
    if (!settings.remote) {
      logger->warn("Unrecognized master endpoint '{}', expected host:port. Submitting as remote address.",
                   remote->address);
    }
  }

  log::debug("engine settings: master={} parallelism={} max_parallelism={}", to_string(master),
             settings.parallelism, settings.max_parallelism);
  return settings;
}

}  // namespace dfr::runner
