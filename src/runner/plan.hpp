#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "common/error.hpp"
#include "model/types.hpp"
#include "runner/engine_settings.hpp"
#include "runner/mode.hpp"
#include "runner/overrides.hpp"

namespace dfr::runner {

enum class OperatorKind {
  ImpulseSource,
  DataSource,
  BoundedSourceWrapper,
  UnboundedSource,
  TestStreamSource,
  FlatMap,
  DoFnOperator,
  SplittableDoFnOperator,
  KeyBy,
  PartialReduce,
  GroupReduce,
  WindowDoFnOperator,
  WindowCombineOperator,
  Union,
  WindowAssign,
  Rebalance,
  BroadcastView,
  FileSink,
  ShardedWrite,
};

enum class Partitioning {
  Forward,
  Hash,
  Rebalance,
  Broadcast,
};

struct PlanOperator {
  std::string id;
  OperatorKind kind = OperatorKind::FlatMap;
  /// Id of the (rewritten) transform this operator implements.
  std::string transform_id;
  std::string user_fn;
  int parallelism = 1;
  Json config = Json::object();
};

struct PlanEdge {
  int from = -1;
  int to = -1;
  std::string collection;
  model::Boundedness boundedness = model::Boundedness::Bounded;
  model::WindowingStrategy windowing;
  Partitioning partitioning = Partitioning::Forward;
};

/// Engine-native operator graph. Operators are stored in topological order.
struct ExecutionPlan {
  std::string job_name;
  ExecutionMode mode = ExecutionMode::Batch;
  std::vector<PlanOperator> operators;
  std::vector<PlanEdge> edges;
  /// Names of the override list selected for `mode`, in match order.
  std::vector<std::string> override_list;
  std::vector<AppliedOverride> applied_overrides;
  std::vector<std::string> files_to_stage;
  EngineSettings engine;

  auto find_operator(std::string_view id) const -> const PlanOperator*;
};

auto to_string(OperatorKind kind) -> std::string_view;
auto to_string(Partitioning partitioning) -> std::string_view;

auto to_json(const ExecutionPlan& plan) -> Json;

}  // namespace dfr::runner
