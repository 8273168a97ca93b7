#include "runner/plan.hpp"

namespace dfr::runner {

auto ExecutionPlan::find_operator(std::string_view id) const -> const PlanOperator* {
  for (const auto& op : operators) {
    if (op.id == id) {
      return &op;
    }
  }
  return nullptr;
}

auto to_string(OperatorKind kind) -> std::string_view {
  switch (kind) {
    case OperatorKind::ImpulseSource:
      return "ImpulseSource";
    case OperatorKind::DataSource:
      return "DataSource";
    case OperatorKind::BoundedSourceWrapper:
      return "BoundedSourceWrapper";
    case OperatorKind::UnboundedSource:
      return "UnboundedSource";
    case OperatorKind::TestStreamSource:
      return "TestStreamSource";
    case OperatorKind::FlatMap:
      return "FlatMap";
    case OperatorKind::DoFnOperator:
      return "DoFnOperator";
    case OperatorKind::SplittableDoFnOperator:
      return "SplittableDoFnOperator";
    case OperatorKind::KeyBy:
      return "KeyBy";
    case OperatorKind::PartialReduce:
      return "PartialReduce";
    case OperatorKind::GroupReduce:
      return "GroupReduce";
    case OperatorKind::WindowDoFnOperator:
      return "WindowDoFnOperator";
    case OperatorKind::WindowCombineOperator:
      return "WindowCombineOperator";
    case OperatorKind::Union:
      return "Union";
    case OperatorKind::WindowAssign:
      return "WindowAssign";
    case OperatorKind::Rebalance:
      return "Rebalance";
    case OperatorKind::BroadcastView:
      return "BroadcastView";
    case OperatorKind::FileSink:
      return "FileSink";
    case OperatorKind::ShardedWrite:
      return "ShardedWrite";
  }
  return "Unknown";
}

auto to_string(Partitioning partitioning) -> std::string_view {
  switch (partitioning) {
    case Partitioning::Forward:
      return "forward";
    case Partitioning::Hash:
      return "hash";
    case Partitioning::Rebalance:
      return "rebalance";
    case Partitioning::Broadcast:
      return "broadcast";
  }
  return "forward";
}

auto to_json(const ExecutionPlan& plan) -> Json {
  Json json = Json::object();
  json["job_name"] = plan.job_name;
  json["mode"] = std::string(to_string(plan.mode));

  Json engine = Json::object();
  engine["master"] = to_string(plan.engine.master);
  if (plan.engine.remote) {
    engine["host"] = plan.engine.remote->host;
    engine["port"] = plan.engine.remote->port;
  }
  engine["parallelism"] = plan.engine.parallelism;
  engine["max_parallelism"] = plan.engine.max_parallelism;
  engine["object_reuse"] = plan.engine.object_reuse;
  engine["temp_location"] = plan.engine.temp_location;
  engine["checkpoint"] = {
    {"enabled", plan.engine.checkpoint.enabled},
    {"interval_ms", plan.engine.checkpoint.interval.count()},
    {"mode", std::string(to_string(plan.engine.checkpoint.mode))},
    {"timeout_ms", plan.engine.checkpoint.timeout.count()},
  };
  json["engine"] = std::move(engine);
  json["files_to_stage"] = plan.files_to_stage;
  json["override_list"] = plan.override_list;

  json["applied_overrides"] = Json::array();
  for (const auto& applied : plan.applied_overrides) {
    json["applied_overrides"].push_back({{"transform", applied.node_id},
                                         {"override", applied.override_name},
                                         {"replacement", applied.replacement_ids}});
  }

  json["operators"] = Json::array();
  for (const auto& op : plan.operators) {
    json["operators"].push_back({{"id", op.id},
                                 {"kind", std::string(to_string(op.kind))},
                                 {"transform", op.transform_id},
                                 {"fn", op.user_fn},
                                 {"parallelism", op.parallelism},
                                 {"config", op.config}});
  }

  json["edges"] = Json::array();
  for (const auto& edge : plan.edges) {
    json["edges"].push_back({{"from", plan.operators[static_cast<std::size_t>(edge.from)].id},
                             {"to", plan.operators[static_cast<std::size_t>(edge.to)].id},
                             {"collection", edge.collection},
                             {"boundedness", std::string(model::to_string(edge.boundedness))},
                             {"windowing", model::windowing_to_json(edge.windowing)},
                             {"partitioning", std::string(to_string(edge.partitioning))}});
  }
  return json;
}

}  // namespace dfr::runner
