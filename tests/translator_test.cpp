#include "runner/translator.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>

using dfr::ErrorCode;
using dfr::model::Boundedness;
using dfr::model::PipelineBuilder;
using dfr::model::TransformKind;
using dfr::model::TransformNode;
using dfr::model::WindowingStrategy;
using dfr::runner::EngineSettings;
using dfr::runner::ExecutionMode;
using dfr::runner::OperatorKind;
using dfr::runner::Partitioning;
using dfr::runner::TranslatorRegistry;

namespace {

auto settings(int parallelism = 4) -> EngineSettings {
  EngineSettings result;
  result.parallelism = parallelism;
  return result;
}

auto translate(const dfr::model::PipelineGraph& graph, ExecutionMode mode, int parallelism = 4)
  -> dfr::Expected<dfr::runner::ExecutionPlan> {
  return dfr::runner::translate_pipeline(graph, TranslatorRegistry::defaults_for(mode), mode,
                                         settings(parallelism));
}

auto edge_between(const dfr::runner::ExecutionPlan& plan, std::string_view from, std::string_view to)
  -> const dfr::runner::PlanEdge* {
  for (const auto& edge : plan.edges) {
    if (plan.operators[static_cast<std::size_t>(edge.from)].id == from &&
        plan.operators[static_cast<std::size_t>(edge.to)].id == to) {
      return &edge;
    }
  }
  return nullptr;
}

}  // namespace

TEST(Translator, BatchPipelineMapsToBatchOperators) {
  auto graph = make_bounded_pipeline();
  ASSERT_TRUE(graph.has_value());
  auto plan = translate(*graph, ExecutionMode::Batch);
  ASSERT_TRUE(plan.has_value()) << plan.error().message;

  ASSERT_EQ(plan->operators.size(), 5u);
  EXPECT_EQ(plan->find_operator("ReadLines")->kind, OperatorKind::DataSource);
  EXPECT_EQ(plan->find_operator("ExtractWords")->kind, OperatorKind::FlatMap);
  EXPECT_EQ(plan->find_operator("GroupWords")->kind, OperatorKind::GroupReduce);
  EXPECT_EQ(plan->find_operator("WriteCounts")->kind, OperatorKind::FileSink);
  EXPECT_EQ(plan->find_operator("WriteCounts")->config.at("num_shards").get<int>(), 3);
  EXPECT_EQ(plan->find_operator("ExtractWords")->parallelism, 4);

  const auto* shuffle = edge_between(*plan, "ExtractWords", "GroupWords");
  ASSERT_NE(shuffle, nullptr);
  EXPECT_EQ(shuffle->partitioning, Partitioning::Hash);
  EXPECT_EQ(shuffle->collection, "ExtractWords.out");
  EXPECT_EQ(plan->edges.size(), 4u);
}

TEST(Translator, StreamingPipelineCarriesWindowing) {
  using namespace std::chrono_literals;
  auto graph = make_windowed_write_pipeline();
  ASSERT_TRUE(graph.has_value());
  auto plan = translate(*graph, ExecutionMode::Streaming);
  ASSERT_TRUE(plan.has_value()) << plan.error().message;

  EXPECT_EQ(plan->find_operator("GenerateSequence")->kind, OperatorKind::UnboundedSource);
  EXPECT_EQ(plan->find_operator("ToString")->kind, OperatorKind::DoFnOperator);
  EXPECT_EQ(plan->find_operator("Window")->kind, OperatorKind::WindowAssign);
  EXPECT_EQ(plan->find_operator("TextIO.Write/Window")->kind, OperatorKind::WindowAssign);
  EXPECT_EQ(plan->find_operator("TextIO.Write/WriteShards")->kind, OperatorKind::ShardedWrite);

  const auto* into_write = edge_between(*plan, "Window", "TextIO.Write/Window");
  ASSERT_NE(into_write, nullptr);
  EXPECT_EQ(into_write->boundedness, Boundedness::Unbounded);
  EXPECT_EQ(into_write->windowing, WindowingStrategy::fixed(1h));

  const auto* source_edge = edge_between(*plan, "GenerateSequence", "ToString");
  ASSERT_NE(source_edge, nullptr);
  EXPECT_EQ(source_edge->windowing, WindowingStrategy::global());
}

TEST(Translator, StreamingGroupByKeyIsKeyedWindowOperator) {
  using namespace std::chrono_literals;
  PipelineBuilder p("sessions");
  auto clicks = p.read("Clicks", "kafka", Boundedness::Unbounded, "KV<user,click>");
  auto sessions = p.window_into("Sessions", clicks, WindowingStrategy::sessions(30min));
  auto grouped = p.group_by_key("GroupByUser", sessions);
  p.combine_per_key("CountClicks", "count", grouped);
  auto graph = p.build();
  ASSERT_TRUE(graph.has_value()) << graph.error().message;

  auto plan = translate(*graph, ExecutionMode::Streaming);
  ASSERT_TRUE(plan.has_value()) << plan.error().message;
  EXPECT_EQ(plan->find_operator("GroupByUser/KeyBy")->kind, OperatorKind::KeyBy);
  const auto* gbk = plan->find_operator("GroupByUser/GroupAlsoByWindow");
  ASSERT_NE(gbk, nullptr);
  EXPECT_EQ(gbk->kind, OperatorKind::WindowDoFnOperator);
  EXPECT_EQ(gbk->config.at("windowing").at("fn").get<std::string>(), "sessions");

  const auto* keyed = edge_between(*plan, "GroupByUser/KeyBy", "GroupByUser/GroupAlsoByWindow");
  ASSERT_NE(keyed, nullptr);
  EXPECT_EQ(keyed->partitioning, Partitioning::Hash);
  EXPECT_EQ(plan->find_operator("CountClicks/CombinePerWindow")->kind, OperatorKind::WindowCombineOperator);
}

TEST(Translator, BatchCombineIsPartialThenFinalReduce) {
  PipelineBuilder p("sum");
  auto values = p.read("Values", "read_values", Boundedness::Bounded, "KV<string,i64>");
  p.combine_per_key("Sum", "sum", values);
  auto graph = p.build();
  ASSERT_TRUE(graph.has_value());

  auto plan = translate(*graph, ExecutionMode::Batch);
  ASSERT_TRUE(plan.has_value()) << plan.error().message;
  EXPECT_EQ(plan->find_operator("Sum/PartialReduce")->kind, OperatorKind::PartialReduce);
  EXPECT_EQ(plan->find_operator("Sum/Reduce")->kind, OperatorKind::GroupReduce);
  EXPECT_EQ(edge_between(*plan, "Sum/PartialReduce", "Sum/Reduce")->partitioning, Partitioning::Hash);
  EXPECT_EQ(edge_between(*plan, "Values", "Sum/PartialReduce")->partitioning, Partitioning::Forward);
}

TEST(Translator, OperatorsFollowTopologicalOrder) {
  auto graph = make_bounded_pipeline();
  ASSERT_TRUE(graph.has_value());
  auto plan = translate(*graph, ExecutionMode::Batch);
  ASSERT_TRUE(plan.has_value()) << plan.error().message;
  for (const auto& edge : plan->edges) {
    EXPECT_LT(edge.from, edge.to);
  }
}

TEST(Translator, ImpulseRunsWithParallelismOne) {
  PipelineBuilder p("impulse");
  auto start = p.impulse("Start");
  p.par_do("Expand", "expand", start);
  auto graph = p.build();
  ASSERT_TRUE(graph.has_value());

  auto plan = translate(*graph, ExecutionMode::Batch, 8);
  ASSERT_TRUE(plan.has_value()) << plan.error().message;
  EXPECT_EQ(plan->find_operator("Start")->kind, OperatorKind::ImpulseSource);
  EXPECT_EQ(plan->find_operator("Start")->parallelism, 1);
  EXPECT_EQ(plan->find_operator("Expand")->parallelism, 8);
}

TEST(Translator, ExternalTransformIsUnsupported) {
  PipelineBuilder p("external");
  auto lines = p.read("Read", "read_text", Boundedness::Bounded, "string");
  TransformNode foreign;
  foreign.id = "ForeignTransform";
  foreign.kind = TransformKind::External;
  foreign.user_fn = "urn:beam:transform:foo";
  foreign.inputs = {lines};
  foreign.outputs = {"ForeignTransform.out"};
  p.apply(foreign, {{"ForeignTransform.out", "string"}});
  auto graph = p.build();
  ASSERT_TRUE(graph.has_value()) << graph.error().message;

  for (auto mode : {ExecutionMode::Batch, ExecutionMode::Streaming}) {
    auto plan = translate(*graph, mode);
    ASSERT_FALSE(plan.has_value());
    EXPECT_EQ(plan.error().code, ErrorCode::UnsupportedTransform);
    EXPECT_NE(plan.error().message.find("ForeignTransform"), std::string::npos);
  }
}

TEST(Translator, UnboundedReadInBatchIsUnsupported) {
  auto graph = make_windowed_write_pipeline();
  ASSERT_TRUE(graph.has_value());
  auto plan = translate(*graph, ExecutionMode::Batch);
  ASSERT_FALSE(plan.has_value());
  EXPECT_EQ(plan.error().code, ErrorCode::UnsupportedTransform);
  EXPECT_NE(plan.error().message.find("GenerateSequence"), std::string::npos);
}

TEST(Translator, BoundedReadInStreamingIsWrapped) {
  auto graph = make_bounded_pipeline();
  ASSERT_TRUE(graph.has_value());
  auto plan = translate(*graph, ExecutionMode::Streaming);
  ASSERT_TRUE(plan.has_value()) << plan.error().message;
  EXPECT_EQ(plan->find_operator("ReadLines")->kind, OperatorKind::BoundedSourceWrapper);
}

TEST(Translator, UnexpandedSplittableParDoIsUnsupported) {
  PipelineBuilder p("sdf");
  auto patterns = p.read("Patterns", "patterns", Boundedness::Bounded, "string");
  p.par_do("Match", "match_files", patterns, "string", dfr::Json{{"splittable", true}});
  auto graph = p.build();
  ASSERT_TRUE(graph.has_value());

  auto plan = translate(*graph, ExecutionMode::Batch);
  ASSERT_FALSE(plan.has_value());
  EXPECT_EQ(plan.error().code, ErrorCode::UnsupportedTransform);
}

TEST(Translator, StreamingViewOperatorsBroadcast) {
  PipelineBuilder p("view");
  auto events = p.read("Events", "pubsub", Boundedness::Unbounded, "Event");
  auto config = p.read("Config", "read_config", Boundedness::Bounded, "Config");
  auto concat = p.combine_per_key("Concat", "concatenate", config);
  TransformNode view;
  view.id = "View";
  view.kind = TransformKind::CreateStreamingView;
  view.inputs = {concat};
  view.outputs = {"View.out"};
  p.apply(view, {{"View.out", "View<Config>"}});
  TransformNode enrich;
  enrich.id = "Enrich";
  enrich.user_fn = "enrich";
  enrich.inputs = {events, "View.out"};
  enrich.outputs = {"Enrich.out"};
  p.apply(enrich, {{"Enrich.out", "Event", Boundedness::Unbounded}});
  auto graph = p.build();
  ASSERT_TRUE(graph.has_value()) << graph.error().message;

  auto plan = translate(*graph, ExecutionMode::Streaming);
  ASSERT_TRUE(plan.has_value()) << plan.error().message;
  EXPECT_EQ(plan->find_operator("View")->kind, OperatorKind::BroadcastView);
  const auto* side = edge_between(*plan, "View", "Enrich");
  ASSERT_NE(side, nullptr);
  EXPECT_EQ(side->partitioning, Partitioning::Broadcast);
  EXPECT_EQ(plan->find_operator("Enrich")->config.at("side_inputs").get<int>(), 1);
}

TEST(Translator, CustomRegistryOverridesDefaults) {
  auto registry = TranslatorRegistry::batch_defaults();
  registry.register_translator(
    TransformKind::External,
    [](const TransformNode&, const dfr::runner::TranslationContext&) -> dfr::Expected<dfr::runner::OperatorChain> {
      return dfr::runner::OperatorChain{dfr::runner::OperatorSpec{"Bridge", OperatorKind::FlatMap}};
    });

  PipelineBuilder p("bridged");
  auto start = p.impulse("Start");
  TransformNode foreign;
  foreign.id = "Foreign";
  foreign.kind = TransformKind::External;
  foreign.inputs = {start};
  foreign.outputs = {"Foreign.out"};
  p.apply(foreign, {{"Foreign.out", "bytes"}});
  auto graph = p.build();
  ASSERT_TRUE(graph.has_value()) << graph.error().message;

  auto plan = dfr::runner::translate_pipeline(*graph, registry, ExecutionMode::Batch, settings());
  ASSERT_TRUE(plan.has_value()) << plan.error().message;
  EXPECT_EQ(plan->find_operator("Foreign")->kind, OperatorKind::FlatMap);
  EXPECT_EQ(TranslatorRegistry::batch_defaults().find(TransformKind::External), nullptr);
}

TEST(Translator, PlanSerializesToJson) {
  auto graph = make_bounded_pipeline();
  ASSERT_TRUE(graph.has_value());
  auto plan = translate(*graph, ExecutionMode::Batch);
  ASSERT_TRUE(plan.has_value()) << plan.error().message;

  auto json = dfr::runner::to_json(*plan);
  EXPECT_EQ(json.at("mode").get<std::string>(), "batch");
  EXPECT_EQ(json.at("operators").size(), plan->operators.size());
  EXPECT_EQ(json.at("edges").size(), plan->edges.size());
}
