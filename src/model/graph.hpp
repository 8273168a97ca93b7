#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "common/error.hpp"
#include "model/types.hpp"

namespace dfr::model {

struct CollectionDef {
  std::string id;
  std::string element_type;
  Boundedness boundedness = Boundedness::Bounded;
  WindowingStrategy windowing;
};

struct TransformNode {
  std::string id;
  TransformKind kind = TransformKind::ParDo;
  /// Opaque tag naming the user logic; never interpreted by the runner.
  std::string user_fn;
  std::vector<std::string> inputs;
  std::vector<std::string> outputs;
  Json params = Json::object();
};

/// Immutable pipeline DAG. Instances only come out of `create`, so every
/// graph observed by the runner satisfies the invariants checked there.
class PipelineGraph {
 public:
  PipelineGraph() = default;

  /// Validate and index a pipeline. Fails with InvalidPipeline when an id is
  /// duplicated, a node references an unknown collection, a collection does
  /// not have exactly one producer, or the graph has a cycle.
  static auto create(std::string name, std::vector<CollectionDef> collections,
                     std::vector<TransformNode> nodes) -> Expected<PipelineGraph>;

  auto name() const -> const std::string& { return name_; }
  auto nodes() const -> const std::vector<TransformNode>& { return nodes_; }
  auto collections() const -> const std::vector<CollectionDef>& { return collections_; }
  auto empty() const -> bool { return nodes_.empty(); }

  /// Node indices in topological order (producers before consumers).
  auto topo_order() const -> const std::vector<int>& { return topo_order_; }

  auto find_node(std::string_view id) const -> const TransformNode*;
  auto find_collection(std::string_view id) const -> const CollectionDef*;
  auto producer_of(std::string_view collection_id) const -> const TransformNode*;
  auto consumers_of(std::string_view collection_id) const -> std::vector<const TransformNode*>;

 private:
  std::string name_;
  std::vector<CollectionDef> collections_;
  std::vector<TransformNode> nodes_;
  std::unordered_map<std::string, int> node_index_;
  std::unordered_map<std::string, int> collection_index_;
  std::unordered_map<std::string, int> producer_index_;
  std::vector<int> topo_order_;
};

auto get_int_param(const Json& params, const char* key, int64_t fallback) -> int64_t;
auto get_bool_param(const Json& params, const char* key, bool fallback) -> bool;
auto get_string_param(const Json& params, const char* key, std::string fallback) -> std::string;

}  // namespace dfr::model
