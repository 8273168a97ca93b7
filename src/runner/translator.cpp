#include "runner/translator.hpp"

#include <format>
#include <utility>

namespace dfr::runner {
namespace {

using model::TransformKind;
using model::TransformNode;

auto unsupported(const TransformNode& node, const TranslationContext& ctx, std::string_view reason)
  -> RunnerError {
  return make_error(ErrorCode::UnsupportedTransform,
                    std::format("cannot translate transform {} ({}) in {} mode: {}", node.id,
                                model::to_string(node.kind), to_string(ctx.mode), reason));
}

auto single(OperatorKind kind, Partitioning input = Partitioning::Forward, Json config = Json::object())
  -> OperatorChain {
  return OperatorChain{OperatorSpec{std::string(to_string(kind)), kind, input, std::move(config)}};
}

auto output_boundedness(const TransformNode& node, const TranslationContext& ctx) -> model::Boundedness {
  for (const auto& output : node.outputs) {
    const auto* collection = ctx.graph.find_collection(output);
    if (collection && collection->boundedness == model::Boundedness::Unbounded) {
      return model::Boundedness::Unbounded;
    }
  }
  return model::Boundedness::Bounded;
}

auto input_windowing(const TransformNode& node, const TranslationContext& ctx) -> model::WindowingStrategy {
  if (!node.inputs.empty()) {
    if (const auto* collection = ctx.graph.find_collection(node.inputs.front())) {
      return collection->windowing;
    }
  }
  return model::WindowingStrategy::global();
}

auto translate_impulse(const TransformNode&, const TranslationContext&) -> Expected<OperatorChain> {
  return single(OperatorKind::ImpulseSource);
}

auto translate_batch_read(const TransformNode& node, const TranslationContext& ctx) -> Expected<OperatorChain> {
  if (output_boundedness(node, ctx) == model::Boundedness::Unbounded) {
    return tl::unexpected(unsupported(node, ctx, "unbounded sources require streaming execution"));
  }
  return single(OperatorKind::DataSource, Partitioning::Forward, Json{{"source", node.user_fn}});
}

auto translate_streaming_read(const TransformNode& node, const TranslationContext& ctx)
  -> Expected<OperatorChain> {
  if (output_boundedness(node, ctx) == model::Boundedness::Unbounded) {
    return single(OperatorKind::UnboundedSource, Partitioning::Forward,
                  Json{{"source", node.user_fn}, {"checkpointing", ctx.settings.checkpoint.enabled}});
  }
  return single(OperatorKind::BoundedSourceWrapper, Partitioning::Forward, Json{{"source", node.user_fn}});
}

auto par_do_config(const TransformNode& node) -> Json {
  auto side_inputs = node.inputs.empty() ? 0 : node.inputs.size() - 1;
  return Json{{"side_inputs", side_inputs}, {"outputs", node.outputs.size()}};
}

auto make_par_do_translator(OperatorKind kind) -> TranslatorRegistry::TranslateFn {
  return [kind](const TransformNode& node, const TranslationContext& ctx) -> Expected<OperatorChain> {
    if (model::get_bool_param(node.params, "splittable", false)) {
      return tl::unexpected(unsupported(node, ctx, "splittable ParDo must be expanded by an override"));
    }
    return single(kind, Partitioning::Forward, par_do_config(node));
  };
}

auto translate_batch_group_by_key(const TransformNode&, const TranslationContext&) -> Expected<OperatorChain> {
  return single(OperatorKind::GroupReduce, Partitioning::Hash);
}

auto translate_streaming_group_by_key(const TransformNode& node, const TranslationContext& ctx)
  -> Expected<OperatorChain> {
  return OperatorChain{
    OperatorSpec{"KeyBy", OperatorKind::KeyBy},
    OperatorSpec{"GroupAlsoByWindow", OperatorKind::WindowDoFnOperator, Partitioning::Hash,
                 Json{{"windowing", model::windowing_to_json(input_windowing(node, ctx))}}},
  };
}

auto translate_batch_combine(const TransformNode& node, const TranslationContext&) -> Expected<OperatorChain> {
  return OperatorChain{
    OperatorSpec{"PartialReduce", OperatorKind::PartialReduce, Partitioning::Forward,
                 Json{{"combine_fn", node.user_fn}}},
    OperatorSpec{"Reduce", OperatorKind::GroupReduce, Partitioning::Hash, Json{{"combine_fn", node.user_fn}}},
  };
}

auto translate_streaming_combine(const TransformNode& node, const TranslationContext& ctx)
  -> Expected<OperatorChain> {
  return OperatorChain{
    OperatorSpec{"KeyBy", OperatorKind::KeyBy},
    OperatorSpec{"CombinePerWindow", OperatorKind::WindowCombineOperator, Partitioning::Hash,
                 Json{{"combine_fn", node.user_fn},
                      {"windowing", model::windowing_to_json(input_windowing(node, ctx))}}},
  };
}

auto translate_flatten(const TransformNode& node, const TranslationContext&) -> Expected<OperatorChain> {
  return single(OperatorKind::Union, Partitioning::Forward, Json{{"inputs", node.inputs.size()}});
}

auto translate_assign_windows(const TransformNode& node, const TranslationContext& ctx)
  -> Expected<OperatorChain> {
  model::WindowingStrategy windowing;
  if (!node.outputs.empty()) {
    if (const auto* collection = ctx.graph.find_collection(node.outputs.front())) {
      windowing = collection->windowing;
    }
  }
  return single(OperatorKind::WindowAssign, Partitioning::Forward,
                Json{{"windowing", model::windowing_to_json(windowing)}});
}

auto translate_reshuffle(const TransformNode&, const TranslationContext&) -> Expected<OperatorChain> {
  return single(OperatorKind::Rebalance, Partitioning::Rebalance);
}

auto translate_view(const TransformNode&, const TranslationContext&) -> Expected<OperatorChain> {
  return single(OperatorKind::BroadcastView);
}

auto translate_process_keyed(const TransformNode& node, const TranslationContext&) -> Expected<OperatorChain> {
  return OperatorChain{
    OperatorSpec{"KeyBy", OperatorKind::KeyBy},
    OperatorSpec{"ProcessElements", OperatorKind::SplittableDoFnOperator, Partitioning::Hash, par_do_config(node)},
  };
}

auto translate_write_files(const TransformNode& node, const TranslationContext& ctx) -> Expected<OperatorChain> {
  Json write_config{{"path", model::get_string_param(node.params, "path", "")},
                    {"num_shards", model::get_int_param(node.params, "num_shards", 0)}};
  if (!model::get_bool_param(node.params, "windowed_writes", false)) {
    return single(OperatorKind::FileSink, Partitioning::Forward, std::move(write_config));
  }
  return OperatorChain{
    OperatorSpec{"Window", OperatorKind::WindowAssign, Partitioning::Forward,
                 Json{{"windowing", model::windowing_to_json(input_windowing(node, ctx))}}},
    OperatorSpec{"WriteShards", OperatorKind::ShardedWrite, Partitioning::Forward, std::move(write_config)},
  };
}

auto translate_test_stream(const TransformNode&, const TranslationContext&) -> Expected<OperatorChain> {
  return single(OperatorKind::TestStreamSource);
}

auto register_common(TranslatorRegistry& registry) -> void {
  registry.register_translator(TransformKind::Impulse, translate_impulse);
  registry.register_translator(TransformKind::Flatten, translate_flatten);
  registry.register_translator(TransformKind::AssignWindows, translate_assign_windows);
  registry.register_translator(TransformKind::Reshuffle, translate_reshuffle);
  registry.register_translator(TransformKind::WriteFiles, translate_write_files);
}

auto make_batch_registry() -> TranslatorRegistry {
  TranslatorRegistry registry;
  register_common(registry);
  registry.register_translator(TransformKind::Read, translate_batch_read);
  registry.register_translator(TransformKind::ParDo, make_par_do_translator(OperatorKind::FlatMap));
  registry.register_translator(TransformKind::GroupByKey, translate_batch_group_by_key);
  registry.register_translator(TransformKind::CombinePerKey, translate_batch_combine);
  registry.register_translator(TransformKind::CreateView, translate_view);
  return registry;
}

auto make_streaming_registry() -> TranslatorRegistry {
  TranslatorRegistry registry;
  register_common(registry);
  registry.register_translator(TransformKind::Read, translate_streaming_read);
  registry.register_translator(TransformKind::ParDo, make_par_do_translator(OperatorKind::DoFnOperator));
  registry.register_translator(TransformKind::GroupByKey, translate_streaming_group_by_key);
  registry.register_translator(TransformKind::CombinePerKey, translate_streaming_combine);
  registry.register_translator(TransformKind::CreateStreamingView, translate_view);
  registry.register_translator(TransformKind::ProcessKeyedElements, translate_process_keyed);
  registry.register_translator(TransformKind::TestStream, translate_test_stream);
  return registry;
}

auto operator_parallelism(OperatorKind kind, const EngineSettings& settings) -> int {
  if (kind == OperatorKind::ImpulseSource || kind == OperatorKind::TestStreamSource) {
    return 1;
  }
  return settings.parallelism;
}

struct PlanAssembler {
  const model::PipelineGraph& graph;
  const TranslatorRegistry& registry;
  const TranslationContext& ctx;

  ExecutionPlan plan;
  std::unordered_map<std::string, int> collection_producer;

  auto add_edge(int from, int to, const std::string& collection_id, Partitioning partitioning) -> void {
    PlanEdge edge;
    edge.from = from;
    edge.to = to;
    edge.collection = collection_id;
    if (const auto* collection = graph.find_collection(collection_id)) {
      edge.boundedness = collection->boundedness;
      edge.windowing = collection->windowing;
    }
    if (plan.operators[static_cast<std::size_t>(from)].kind == OperatorKind::BroadcastView) {
      partitioning = Partitioning::Broadcast;
    }
    edge.partitioning = partitioning;
    plan.edges.push_back(std::move(edge));
  }

  auto translate_node(const TransformNode& node) -> Expected<void> {
    const auto* translator = registry.find(node.kind);
    if (!translator) {
      return tl::unexpected(unsupported(node, ctx, "no translation registered"));
    }
    auto chain = (*translator)(node, ctx);
    if (!chain) {
      return tl::unexpected(chain.error());
    }
    if (chain->empty()) {
      return tl::unexpected(unsupported(node, ctx, "translation produced no operators"));
    }

    const int first = static_cast<int>(plan.operators.size());
    for (std::size_t i = 0; i < chain->size(); ++i) {
      auto& spec = (*chain)[i];
      PlanOperator op;
      op.id = chain->size() == 1 ? node.id : std::format("{}/{}", node.id, spec.name);
      op.kind = spec.kind;
      op.transform_id = node.id;
      op.user_fn = node.user_fn;
      op.parallelism = operator_parallelism(spec.kind, ctx.settings);
      op.config = std::move(spec.config);
      plan.operators.push_back(std::move(op));

      if (i > 0) {
        // Records inside a chain still belong to the transform's main input.
        const auto& carried = !node.inputs.empty()    ? node.inputs.front()
                              : !node.outputs.empty() ? node.outputs.front()
                                                      : node.id;
        int current = static_cast<int>(plan.operators.size()) - 1;
        add_edge(current - 1, current, carried, spec.input);
      }
    }
    const int last = static_cast<int>(plan.operators.size()) - 1;

    for (const auto& input : node.inputs) {
      auto producer_it = collection_producer.find(input);
      if (producer_it == collection_producer.end()) {
        return tl::unexpected(make_error(ErrorCode::InvalidPipeline,
                                         std::format("collection {} consumed before it is produced", input)));
      }
      add_edge(producer_it->second, first, input, chain->front().input);
    }
    for (const auto& output : node.outputs) {
      collection_producer[output] = last;
    }
    return {};
  }
};

}  // namespace

auto TranslatorRegistry::register_translator(model::TransformKind kind, TranslateFn fn) -> void {
  translators_[kind] = std::move(fn);
}

auto TranslatorRegistry::find(model::TransformKind kind) const -> const TranslateFn* {
  auto it = translators_.find(kind);
  if (it == translators_.end()) {
    return nullptr;
  }
  return &it->second;
}

auto TranslatorRegistry::batch_defaults() -> const TranslatorRegistry& {
  static const TranslatorRegistry registry = make_batch_registry();
  return registry;
}

auto TranslatorRegistry::streaming_defaults() -> const TranslatorRegistry& {
  static const TranslatorRegistry registry = make_streaming_registry();
  return registry;
}

auto TranslatorRegistry::defaults_for(ExecutionMode mode) -> const TranslatorRegistry& {
  return mode == ExecutionMode::Streaming ? streaming_defaults() : batch_defaults();
}

auto translate_pipeline(const model::PipelineGraph& graph, const TranslatorRegistry& registry,
                        ExecutionMode mode, const EngineSettings& settings) -> Expected<ExecutionPlan> {
  TranslationContext ctx{graph, mode, settings};
  PlanAssembler assembler{graph, registry, ctx};
  assembler.plan.job_name = graph.name();
  assembler.plan.mode = mode;
  assembler.plan.engine = settings;
  assembler.plan.operators.reserve(graph.nodes().size());

  for (int index : graph.topo_order()) {
    if (auto result = assembler.translate_node(graph.nodes()[static_cast<std::size_t>(index)]); !result) {
      return tl::unexpected(result.error());
    }
  }
  return std::move(assembler.plan);
}

}  // namespace dfr::runner
