#include "model/graph.hpp"

#include <format>
#include <queue>
#include <utility>

namespace dfr::model {
namespace {

auto invalid(std::string message) -> RunnerError {
  return make_error(ErrorCode::InvalidPipeline, std::move(message));
}

}  // namespace

auto PipelineGraph::create(std::string name, std::vector<CollectionDef> collections,
                           std::vector<TransformNode> nodes) -> Expected<PipelineGraph> {
  PipelineGraph graph;
  graph.name_ = std::move(name);
  graph.collections_ = std::move(collections);
  graph.nodes_ = std::move(nodes);

  graph.collection_index_.reserve(graph.collections_.size());
  for (std::size_t i = 0; i < graph.collections_.size(); ++i) {
    const auto& collection = graph.collections_[i];
    if (collection.id.empty()) {
      return tl::unexpected(invalid("collection id is empty"));
    }
    if (!graph.collection_index_.emplace(collection.id, static_cast<int>(i)).second) {
      return tl::unexpected(invalid(std::format("duplicate collection id: {}", collection.id)));
    }
  }

  graph.node_index_.reserve(graph.nodes_.size());
  for (std::size_t i = 0; i < graph.nodes_.size(); ++i) {
    const auto& node = graph.nodes_[i];
    if (node.id.empty()) {
      return tl::unexpected(invalid("transform id is empty"));
    }
    if (!graph.node_index_.emplace(node.id, static_cast<int>(i)).second) {
      return tl::unexpected(invalid(std::format("duplicate transform id: {}", node.id)));
    }
    for (const auto& output : node.outputs) {
      if (!graph.collection_index_.contains(output)) {
        return tl::unexpected(invalid(std::format("transform {} produces unknown collection: {}", node.id, output)));
      }
      if (!graph.producer_index_.emplace(output, static_cast<int>(i)).second) {
        return tl::unexpected(invalid(std::format("collection produced twice: {}", output)));
      }
    }
  }

  for (const auto& collection : graph.collections_) {
    if (!graph.producer_index_.contains(collection.id)) {
      return tl::unexpected(invalid(std::format("collection has no producer: {}", collection.id)));
    }
  }

  std::vector<std::vector<int>> edges(graph.nodes_.size());
  std::vector<int> indegree(graph.nodes_.size(), 0);
  for (std::size_t i = 0; i < graph.nodes_.size(); ++i) {
    const auto& node = graph.nodes_[i];
    for (const auto& input : node.inputs) {
      auto producer_it = graph.producer_index_.find(input);
      if (producer_it == graph.producer_index_.end()) {
        return tl::unexpected(invalid(std::format("transform {} consumes unknown collection: {}", node.id, input)));
      }
      edges[static_cast<std::size_t>(producer_it->second)].push_back(static_cast<int>(i));
      indegree[i] += 1;
    }
  }

  // Kahn's algorithm. A node whose inputs all resolve is reachable from some
  // root once the sort covers every node, so no separate reachability pass.
  std::queue<int> ready;
  for (std::size_t i = 0; i < indegree.size(); ++i) {
    if (indegree[i] == 0) {
      ready.push(static_cast<int>(i));
    }
  }
  graph.topo_order_.reserve(graph.nodes_.size());
  while (!ready.empty()) {
    int node = ready.front();
    ready.pop();
    graph.topo_order_.push_back(node);
    for (int next : edges[static_cast<std::size_t>(node)]) {
      indegree[static_cast<std::size_t>(next)] -= 1;
      if (indegree[static_cast<std::size_t>(next)] == 0) {
        ready.push(next);
      }
    }
  }
  if (graph.topo_order_.size() != graph.nodes_.size()) {
    return tl::unexpected(invalid(std::format("pipeline has cycles: {}", graph.name_)));
  }

  return graph;
}

auto PipelineGraph::find_node(std::string_view id) const -> const TransformNode* {
  auto it = node_index_.find(std::string(id));
  if (it == node_index_.end()) {
    return nullptr;
  }
  return &nodes_[static_cast<std::size_t>(it->second)];
}

auto PipelineGraph::find_collection(std::string_view id) const -> const CollectionDef* {
  auto it = collection_index_.find(std::string(id));
  if (it == collection_index_.end()) {
    return nullptr;
  }
  return &collections_[static_cast<std::size_t>(it->second)];
}

auto PipelineGraph::producer_of(std::string_view collection_id) const -> const TransformNode* {
  auto it = producer_index_.find(std::string(collection_id));
  if (it == producer_index_.end()) {
    return nullptr;
  }
  return &nodes_[static_cast<std::size_t>(it->second)];
}

auto PipelineGraph::consumers_of(std::string_view collection_id) const -> std::vector<const TransformNode*> {
  std::vector<const TransformNode*> consumers;
  for (int index : topo_order_) {
    const auto& node = nodes_[static_cast<std::size_t>(index)];
    for (const auto& input : node.inputs) {
      if (input == collection_id) {
        consumers.push_back(&node);
        break;
      }
    }
  }
  return consumers;
}

auto get_int_param(const Json& params, const char* key, int64_t fallback) -> int64_t {
  if (!params.is_object()) {
    return fallback;
  }
  auto it = params.find(key);
  if (it != params.end() && it->is_number_integer()) {
    return it->get<int64_t>();
  }
  return fallback;
}

auto get_bool_param(const Json& params, const char* key, bool fallback) -> bool {
  if (!params.is_object()) {
    return fallback;
  }
  auto it = params.find(key);
  if (it != params.end() && it->is_boolean()) {
    return it->get<bool>();
  }
  return fallback;
}

auto get_string_param(const Json& params, const char* key, std::string fallback) -> std::string {
  if (!params.is_object()) {
    return fallback;
  }
  auto it = params.find(key);
  if (it != params.end() && it->is_string()) {
    return it->get<std::string>();
  }
  return fallback;
}

}  // namespace dfr::model
