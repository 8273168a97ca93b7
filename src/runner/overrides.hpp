#pragma once

#include <functional>
#include <string>
#include <vector>

#include "common/error.hpp"
#include "model/graph.hpp"
#include "runner/mode.hpp"

namespace dfr::runner {

/// Inputs available to replacement factories.
struct OverrideContext {
  const model::PipelineGraph& graph;
  int parallelism = 1;
  int max_parallelism = -1;
};

/// Subgraph substituted for one matched node. It must produce every output
/// collection of the matched node and may only consume the matched node's
/// inputs or collections it declares itself.
struct Replacement {
  std::vector<model::CollectionDef> collections;
  std::vector<model::TransformNode> nodes;
};

struct TransformOverride {
  using MatchFn = std::function<bool(const model::TransformNode&, const model::PipelineGraph&)>;
  using ReplaceFn = std::function<Expected<Replacement>(const model::TransformNode&, const OverrideContext&)>;

  std::string name;
  MatchFn matches;
  ReplaceFn replace;
};

/// Fixed, ordered override lists for batch and streaming execution.
/// Immutable after construction and safe to share across threads.
class OverrideRegistry {
 public:
  OverrideRegistry(std::vector<TransformOverride> batch, std::vector<TransformOverride> streaming);

  /// Process-wide default rules.
  static auto defaults() -> const OverrideRegistry&;

  auto select_for(ExecutionMode mode) const -> const std::vector<TransformOverride>&;

 private:
  std::vector<TransformOverride> batch_;
  std::vector<TransformOverride> streaming_;
};

struct AppliedOverride {
  std::string node_id;
  std::string override_name;
  std::vector<std::string> replacement_ids;
};

struct RewriteResult {
  model::PipelineGraph graph;
  std::vector<AppliedOverride> applied;
};

/// Single pass over `graph` in topological order. The first matching
/// override replaces a node; replacement nodes are never matched again.
auto rewrite(const model::PipelineGraph& graph, const std::vector<TransformOverride>& overrides,
             const OverrideContext& ctx) -> Expected<RewriteResult>;

auto override_names(const std::vector<TransformOverride>& overrides) -> std::vector<std::string>;

}  // namespace dfr::runner
