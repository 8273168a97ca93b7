#include "runner/mode.hpp"

#include <algorithm>

namespace dfr::runner {

auto to_string(ExecutionMode mode) -> std::string_view {
  return mode == ExecutionMode::Batch ? "batch" : "streaming";
}

auto has_unbounded_collections(const model::PipelineGraph& graph) -> bool {
  const auto& collections = graph.collections();
  return std::any_of(collections.begin(), collections.end(), [](const model::CollectionDef& collection) {
    return collection.boundedness == model::Boundedness::Unbounded;
  });
}

auto has_unbounded_sources(const model::PipelineGraph& graph) -> bool {
  for (const auto& node : graph.nodes()) {
    for (const auto& output : node.outputs) {
      const auto* collection = graph.find_collection(output);
      if (collection && collection->boundedness == model::Boundedness::Unbounded) {
        return true;
      }
    }
  }
  return false;
}

auto infer_mode(const model::PipelineGraph& graph, std::optional<bool> streaming) -> ExecutionMode {
  if (streaming) {
    return *streaming ? ExecutionMode::Streaming : ExecutionMode::Batch;
  }
  return has_unbounded_collections(graph) ? ExecutionMode::Streaming : ExecutionMode::Batch;
}

auto validate_checkpointing(const model::PipelineGraph& graph, ExecutionMode mode,
                            const CheckpointConfig& checkpoint, const log::Logger& logger) -> bool {
  if (mode != ExecutionMode::Streaming || checkpoint.enabled || !has_unbounded_sources(graph)) {
    return false;
  }
  logger->warn(kCheckpointingDisabledWarning);
  return true;
}

}  // namespace dfr::runner
