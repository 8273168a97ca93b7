#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/error.hpp"
#include "model/graph.hpp"
#include "runner/engine_settings.hpp"
#include "runner/mode.hpp"
#include "runner/plan.hpp"

namespace dfr::runner {

struct TranslationContext {
  const model::PipelineGraph& graph;
  ExecutionMode mode = ExecutionMode::Batch;
  const EngineSettings& settings;
};

struct OperatorSpec {
  /// Operator id suffix when a transform expands to more than one operator.
  std::string name;
  OperatorKind kind = OperatorKind::FlatMap;
  /// How records reach this operator from its upstream.
  Partitioning input = Partitioning::Forward;
  Json config = Json::object();
};

/// Linear chain of operators implementing one transform; the first operator
/// consumes the transform inputs and the last produces its outputs.
using OperatorChain = std::vector<OperatorSpec>;

class TranslatorRegistry {
 public:
  using TranslateFn = std::function<Expected<OperatorChain>(const model::TransformNode&, const TranslationContext&)>;

  auto register_translator(model::TransformKind kind, TranslateFn fn) -> void;
  auto find(model::TransformKind kind) const -> const TranslateFn*;

  static auto batch_defaults() -> const TranslatorRegistry&;
  static auto streaming_defaults() -> const TranslatorRegistry&;
  static auto defaults_for(ExecutionMode mode) -> const TranslatorRegistry&;

 private:
  std::unordered_map<model::TransformKind, TranslateFn> translators_;
};

/// Map every transform of `graph` to engine operators. A transform without a
/// translation fails the whole call with UnsupportedTransform.
auto translate_pipeline(const model::PipelineGraph& graph, const TranslatorRegistry& registry,
                        ExecutionMode mode, const EngineSettings& settings) -> Expected<ExecutionPlan>;

}  // namespace dfr::runner
