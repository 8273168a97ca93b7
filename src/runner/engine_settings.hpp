#pragma once

#include <optional>
#include <string>

#include "common/error.hpp"
#include "common/logging/log.hpp"
#include "runner/master_endpoint.hpp"
#include "runner/options.hpp"

namespace dfr::runner {

/// Engine-facing settings derived from the options and the master endpoint.
struct EngineSettings {
  MasterEndpoint master = AutoLocal{};
  /// Parsed cluster address; empty for local masters and unparsable addresses.
  std::optional<HostPort> remote;
  int parallelism = 1;
  int max_parallelism = -1;
  CheckpointConfig checkpoint;
  bool object_reuse = false;
  std::string temp_location;
};

/// Resolve effective parallelism and the remote address. Checkpointing
/// enabled with a non-positive interval is an InvalidOptions error.
auto resolve_engine_settings(const PipelineOptions& options, const MasterEndpoint& master,
                             const log::Logger& logger) -> Expected<EngineSettings>;

}  // namespace dfr::runner
