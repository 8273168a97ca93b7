#include "model/dsl.hpp"
#include <gtest/gtest.h>

#include <chrono>

using dfr::ErrorCode;
using dfr::Json;
using dfr::model::Boundedness;
using dfr::model::TransformKind;
using dfr::model::WindowFn;
using dfr::model::WindowingStrategy;

TEST(PipelineDsl, ParsesCollectionsAndTransforms) {
  const char* dsl = R"JSON({
    "name": "wordcount",
    "collections": [
      {"id": "lines", "type": "string", "boundedness": "unbounded"},
      {"id": "windowed", "type": "string", "boundedness": "unbounded",
       "windowing": {"fn": "fixed", "size_ms": 60000}},
      {"id": "counts", "type": "KV<string,i64>", "boundedness": "unbounded",
       "windowing": {"fn": "fixed", "size_ms": 60000}}
    ],
    "transforms": [
      {"id": "Read", "kind": "Read", "fn": "pubsub", "outputs": ["lines"]},
      {"id": "Window", "kind": "AssignWindows", "inputs": ["lines"], "outputs": ["windowed"]},
      {"id": "Count", "kind": "CombinePerKey", "fn": "sum", "inputs": ["windowed"], "outputs": ["counts"]},
      {"id": "Write", "kind": "WriteFiles", "inputs": ["counts"],
       "params": {"path": "/out", "num_shards": 2, "windowed_writes": true}}
    ]
  })JSON";

  auto graph = dfr::model::parse_pipeline_dsl(dsl);
  ASSERT_TRUE(graph.has_value()) << graph.error().message;
  EXPECT_EQ(graph->name(), "wordcount");
  ASSERT_EQ(graph->nodes().size(), 4u);

  const auto* windowed = graph->find_collection("windowed");
  ASSERT_NE(windowed, nullptr);
  EXPECT_EQ(windowed->boundedness, Boundedness::Unbounded);
  EXPECT_EQ(windowed->windowing, WindowingStrategy::fixed(std::chrono::minutes(1)));

  const auto* count = graph->find_node("Count");
  ASSERT_NE(count, nullptr);
  EXPECT_EQ(count->kind, TransformKind::CombinePerKey);
  EXPECT_EQ(count->user_fn, "sum");

  const auto* write = graph->find_node("Write");
  ASSERT_NE(write, nullptr);
  EXPECT_EQ(write->params.at("num_shards").get<int>(), 2);
}

TEST(PipelineDsl, DefaultsToBoundedGlobalWindows) {
  auto graph = dfr::model::parse_pipeline_json(Json::parse(R"({
    "collections": [{"id": "a"}],
    "transforms": [{"id": "Impulse", "kind": "Impulse", "outputs": ["a"]}]
  })"));
  ASSERT_TRUE(graph.has_value()) << graph.error().message;
  const auto* a = graph->find_collection("a");
  EXPECT_EQ(a->boundedness, Boundedness::Bounded);
  EXPECT_EQ(a->windowing.fn, WindowFn::Global);
}

TEST(PipelineDsl, RejectsMalformedJson) {
  auto graph = dfr::model::parse_pipeline_dsl("{\"transforms\": [");
  ASSERT_FALSE(graph.has_value());
  EXPECT_EQ(graph.error().code, ErrorCode::InvalidPipeline);
}

TEST(PipelineDsl, RejectsUnknownKind) {
  auto graph = dfr::model::parse_pipeline_json(Json::parse(R"({
    "transforms": [{"id": "X", "kind": "Teleport"}]
  })"));
  ASSERT_FALSE(graph.has_value());
  EXPECT_EQ(graph.error().code, ErrorCode::InvalidPipeline);
  EXPECT_NE(graph.error().message.find("Teleport"), std::string::npos);
}

TEST(PipelineDsl, RejectsBadWindowing) {
  auto graph = dfr::model::parse_pipeline_json(Json::parse(R"({
    "collections": [{"id": "a", "windowing": {"fn": "fixed", "size_ms": 0}}],
    "transforms": [{"id": "Impulse", "kind": "Impulse", "outputs": ["a"]}]
  })"));
  ASSERT_FALSE(graph.has_value());
  EXPECT_EQ(graph.error().code, ErrorCode::InvalidPipeline);
}

TEST(PipelineDsl, RequiresTransformsArray) {
  auto graph = dfr::model::parse_pipeline_json(Json::parse(R"({"name": "nothing"})"));
  ASSERT_FALSE(graph.has_value());
  EXPECT_EQ(graph.error().code, ErrorCode::InvalidPipeline);
}

TEST(PipelineDsl, ExternalKindParses) {
  auto graph = dfr::model::parse_pipeline_json(Json::parse(R"({
    "collections": [{"id": "a"}],
    "transforms": [{"id": "Foreign", "kind": "External", "fn": "urn:beam:transform:foo", "outputs": ["a"]}]
  })"));
  ASSERT_TRUE(graph.has_value()) << graph.error().message;
  EXPECT_EQ(graph->find_node("Foreign")->kind, TransformKind::External);
}
