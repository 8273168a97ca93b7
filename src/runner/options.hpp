#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "common/error.hpp"

namespace dfr::runner {

enum class CheckpointingMode {
  ExactlyOnce,
  AtLeastOnce,
};

/// Engine checkpointing settings. Read-only for the runner.
struct CheckpointConfig {
  bool enabled = false;
  /// Time between checkpoints; must be positive when enabled.
  std::chrono::milliseconds interval{0};
  CheckpointingMode mode = CheckpointingMode::ExactlyOnce;
  /// Abort a checkpoint that takes longer than this (0 keeps the engine default).
  std::chrono::milliseconds timeout{0};
};

/// Options consumed by the execution environment. `files_to_stage` is
/// rewritten in place while translating.
struct PipelineOptions {
  std::string job_name = "dfr-job";
  /// Runner selector; informational for this runner.
  std::string runner = "ClusterRunner";
  /// `[auto]`, `[collection]`, `[local]` or a `host:port` cluster address.
  std::string master = "[auto]";
  std::vector<std::string> files_to_stage;
  std::string temp_location;
  /// Forces batch (false) or streaming (true); inferred from the graph when unset.
  std::optional<bool> streaming;
  CheckpointConfig checkpoint;
  /// Operator parallelism; non-positive lets the environment decide.
  int parallelism = -1;
  /// Upper bound for rescaling keyed state; non-positive means unset.
  int max_parallelism = -1;
  /// Paths searched for shippable archives when submitting to a remote master.
  /// Empty means the process default (see `default_classpath`).
  std::vector<std::string> classpath;
  bool object_reuse = false;
};

auto to_string(CheckpointingMode mode) -> std::string_view;

auto parse_options_json(const Json& json) -> Expected<PipelineOptions>;

}  // namespace dfr::runner
