#include "runner/overrides.hpp"

#include <format>
#include <unordered_set>
#include <utility>

namespace dfr::runner {
namespace {

auto is_kind(model::TransformKind kind) -> TransformOverride::MatchFn {
  return [kind](const model::TransformNode& node, const model::PipelineGraph&) { return node.kind == kind; };
}

auto needs_runner_sharding(const model::TransformNode& node, const model::PipelineGraph&) -> bool {
  return node.kind == model::TransformKind::WriteFiles && model::get_int_param(node.params, "num_shards", 0) <= 0;
}

auto is_splittable_par_do(const model::TransformNode& node, const model::PipelineGraph&) -> bool {
  return node.kind == model::TransformKind::ParDo && model::get_bool_param(node.params, "splittable", false);
}

/// Collection derived from `upstream` for a step inside a replacement.
auto derived_collection(const model::PipelineGraph& graph, const std::string& upstream, std::string id,
                        std::string element_type) -> model::CollectionDef {
  model::CollectionDef collection;
  collection.id = std::move(id);
  collection.element_type = std::move(element_type);
  if (const auto* source = graph.find_collection(upstream)) {
    collection.boundedness = source->boundedness;
    collection.windowing = source->windowing;
  }
  return collection;
}

auto make_step(const model::TransformNode& node, std::string_view step, model::TransformKind kind,
               std::vector<std::string> inputs, std::vector<std::string> outputs) -> model::TransformNode {
  model::TransformNode result;
  result.id = std::format("{}/{}", node.id, step);
  result.kind = kind;
  result.user_fn = node.user_fn;
  result.inputs = std::move(inputs);
  result.outputs = std::move(outputs);
  return result;
}

/// WriteFiles with runner-determined sharding gets a fixed shard count.
auto make_sharded_write_override(std::string name, bool streaming) -> TransformOverride {
  return TransformOverride{
    std::move(name),
    needs_runner_sharding,
    [streaming](const model::TransformNode& node, const OverrideContext& ctx) -> Expected<Replacement> {
      int64_t shards = ctx.parallelism;
      if (streaming) {
        shards = ctx.max_parallelism > 0 ? ctx.max_parallelism : 2 * static_cast<int64_t>(ctx.parallelism);
      }
      if (shards < 1) {
        shards = 1;
      }
      auto write = node;
      write.params["num_shards"] = shards;
      write.params["runner_determined_sharding"] = true;
      Replacement replacement;
      replacement.nodes.push_back(std::move(write));
      return replacement;
    }};
}

/// Splittable ParDo expands into restriction pairing and splitting followed by
/// a processing step. Streaming processes keyed work items; batch processes
/// each restriction in place.
auto make_splittable_override(std::string name, bool streaming) -> TransformOverride {
  return TransformOverride{
    std::move(name),
    is_splittable_par_do,
    [streaming](const model::TransformNode& node, const OverrideContext& ctx) -> Expected<Replacement> {
      if (node.inputs.empty()) {
        return tl::unexpected(make_error(ErrorCode::InvalidPipeline,
                                         std::format("splittable ParDo without main input: {}", node.id)));
      }
      const auto& main_input = node.inputs.front();
      std::vector<std::string> side_inputs(node.inputs.begin() + 1, node.inputs.end());

      Replacement replacement;
      auto paired = derived_collection(ctx.graph, main_input, node.id + "/PairWithRestriction.out",
                                       "KV<element,restriction>");
      auto split = derived_collection(ctx.graph, main_input, node.id + "/SplitRestriction.out",
                                      "KV<element,restriction>");

      auto pair_step =
        make_step(node, "PairWithRestriction", model::TransformKind::ParDo, {main_input}, {paired.id});
      auto split_step = make_step(node, "SplitRestriction", model::TransformKind::ParDo, {paired.id}, {split.id});

      std::vector<std::string> process_inputs{split.id};
      process_inputs.insert(process_inputs.end(), side_inputs.begin(), side_inputs.end());
      auto process_step =
        streaming
          ? make_step(node, "ProcessKeyedElements", model::TransformKind::ProcessKeyedElements,
                      std::move(process_inputs), node.outputs)
          : make_step(node, "ProcessElements", model::TransformKind::ParDo, std::move(process_inputs), node.outputs);
      process_step.params = node.params;
      process_step.params["splittable"] = false;

      replacement.collections.push_back(std::move(paired));
      replacement.collections.push_back(std::move(split));
      replacement.nodes.push_back(std::move(pair_step));
      replacement.nodes.push_back(std::move(split_step));
      replacement.nodes.push_back(std::move(process_step));
      return replacement;
    }};
}

/// Side-input views in streaming are materialized by concatenating the
/// window contents before broadcasting.
auto make_streaming_view_override(std::string name) -> TransformOverride {
  return TransformOverride{
    std::move(name),
    is_kind(model::TransformKind::CreateView),
    [](const model::TransformNode& node, const OverrideContext& ctx) -> Expected<Replacement> {
      if (node.inputs.size() != 1) {
        return tl::unexpected(make_error(ErrorCode::InvalidPipeline,
                                         std::format("CreateView expects exactly one input: {}", node.id)));
      }
      Replacement replacement;
      auto concatenated =
        derived_collection(ctx.graph, node.inputs.front(), node.id + "/Concatenate.out", "List<element>");
      auto combine =
        make_step(node, "Concatenate", model::TransformKind::CombinePerKey, node.inputs, {concatenated.id});
      combine.user_fn = "concatenate";
      auto view = make_step(node, "CreateStreamingView", model::TransformKind::CreateStreamingView,
                            {concatenated.id}, node.outputs);
      view.params = node.params;

      replacement.collections.push_back(std::move(concatenated));
      replacement.nodes.push_back(std::move(combine));
      replacement.nodes.push_back(std::move(view));
      return replacement;
    }};
}

auto check_replacement(const model::TransformNode& node, const TransformOverride& rule,
                       const Replacement& replacement) -> Expected<void> {
  auto fail = [&](std::string detail) {
    return tl::unexpected(
      make_error(ErrorCode::InvalidPipeline, std::format("override {} on {}: {}", rule.name, node.id, detail)));
  };

  if (replacement.nodes.empty()) {
    return fail("replacement is empty");
  }

  std::unordered_set<std::string> visible(node.inputs.begin(), node.inputs.end());
  for (const auto& collection : replacement.collections) {
    visible.insert(collection.id);
  }

  std::unordered_set<std::string> produced;
  for (const auto& step : replacement.nodes) {
    for (const auto& input : step.inputs) {
      if (!visible.contains(input)) {
        return fail(std::format("step {} consumes collection outside the replacement: {}", step.id, input));
      }
    }
    produced.insert(step.outputs.begin(), step.outputs.end());
  }
  for (const auto& output : node.outputs) {
    if (!produced.contains(output)) {
      return fail(std::format("replacement does not produce {}", output));
    }
  }
  return {};
}

}  // namespace

OverrideRegistry::OverrideRegistry(std::vector<TransformOverride> batch, std::vector<TransformOverride> streaming)
    : batch_(std::move(batch)), streaming_(std::move(streaming)) {}

auto OverrideRegistry::defaults() -> const OverrideRegistry& {
  static const OverrideRegistry registry(
    {
      make_sharded_write_override("batch-sharded-write", false),
      make_splittable_override("splittable-pardo-naive-bounded", false),
    },
    {
      make_sharded_write_override("streaming-sharded-write", true),
      make_splittable_override("splittable-pardo-keyed-work-items", true),
      make_streaming_view_override("create-streaming-view"),
    });
  return registry;
}

auto OverrideRegistry::select_for(ExecutionMode mode) const -> const std::vector<TransformOverride>& {
  return mode == ExecutionMode::Streaming ? streaming_ : batch_;
}

auto rewrite(const model::PipelineGraph& graph, const std::vector<TransformOverride>& overrides,
             const OverrideContext& ctx) -> Expected<RewriteResult> {
  std::vector<model::CollectionDef> collections = graph.collections();
  std::vector<model::TransformNode> nodes;
  nodes.reserve(graph.nodes().size());
  std::vector<AppliedOverride> applied;

  for (int index : graph.topo_order()) {
    const auto& node = graph.nodes()[static_cast<std::size_t>(index)];

    const TransformOverride* match = nullptr;
    for (const auto& rule : overrides) {
      if (rule.matches && rule.matches(node, graph)) {
        match = &rule;
        break;
      }
    }
    if (!match) {
      nodes.push_back(node);
      continue;
    }

    if (!match->replace) {
      return tl::unexpected(make_error(ErrorCode::InvalidPipeline,
                                       std::format("override {} matched {} but has no replacement factory",
                                                   match->name, node.id)));
    }
    auto replacement = match->replace(node, ctx);
    if (!replacement) {
      return tl::unexpected(replacement.error());
    }
    if (auto checked = check_replacement(node, *match, *replacement); !checked) {
      return tl::unexpected(checked.error());
    }

    AppliedOverride record{node.id, match->name, {}};
    for (auto& collection : replacement->collections) {
      collections.push_back(std::move(collection));
    }
    for (auto& step : replacement->nodes) {
      record.replacement_ids.push_back(step.id);
      nodes.push_back(std::move(step));
    }
    applied.push_back(std::move(record));
  }

  auto rewritten = model::PipelineGraph::create(graph.name(), std::move(collections), std::move(nodes));
  if (!rewritten) {
    return tl::unexpected(rewritten.error());
  }
  return RewriteResult{std::move(*rewritten), std::move(applied)};
}

auto override_names(const std::vector<TransformOverride>& overrides) -> std::vector<std::string> {
  std::vector<std::string> names;
  names.reserve(overrides.size());
  for (const auto& rule : overrides) {
    names.push_back(rule.name);
  }
  return names;
}

}  // namespace dfr::runner
