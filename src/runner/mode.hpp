#pragma once

#include <optional>
#include <string_view>

#include "common/logging/log.hpp"
#include "model/graph.hpp"
#include "runner/options.hpp"

namespace dfr::runner {

enum class ExecutionMode {
  Batch,
  Streaming,
};

inline constexpr std::string_view kCheckpointingDisabledWarning =
  "UnboundedSources present which rely on checkpointing, but checkpointing is disabled.";

auto to_string(ExecutionMode mode) -> std::string_view;

/// True when any collection in the graph is unbounded.
auto has_unbounded_collections(const model::PipelineGraph& graph) -> bool;

/// True when any transform produces an unbounded collection, whether it is a
/// root read or a ParDo emitting an unbounded stream from bounded input.
auto has_unbounded_sources(const model::PipelineGraph& graph) -> bool;

/// An explicit mode always wins; otherwise any unbounded collection means streaming.
auto infer_mode(const model::PipelineGraph& graph, std::optional<bool> streaming) -> ExecutionMode;

/// Warn on `logger` when a streaming job reads unbounded sources without
/// checkpointing. Returns whether the warning was written. Never fails.
auto validate_checkpointing(const model::PipelineGraph& graph, ExecutionMode mode,
                            const CheckpointConfig& checkpoint, const log::Logger& logger) -> bool;

}  // namespace dfr::runner
