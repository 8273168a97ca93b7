#include "runner/options.hpp"
#include <gtest/gtest.h>

#include <limits>

using dfr::ErrorCode;
using dfr::Json;
using dfr::runner::CheckpointingMode;

TEST(PipelineOptions, DefaultsUseAutoMaster) {
  dfr::runner::PipelineOptions options;
  EXPECT_EQ(options.master, "[auto]");
  EXPECT_FALSE(options.streaming.has_value());
  EXPECT_FALSE(options.checkpoint.enabled);
  EXPECT_TRUE(options.files_to_stage.empty());
}

TEST(PipelineOptions, ParsesAllFields) {
  auto options = dfr::runner::parse_options_json(Json::parse(R"({
    "job_name": "sessions",
    "master": "jobmanager:6123",
    "files_to_stage": ["/opt/job.jar"],
    "temp_location": "/tmp/dfr",
    "streaming": true,
    "checkpoint": {"enabled": true, "interval_ms": 5000, "timeout_ms": 60000, "mode": "at_least_once"},
    "parallelism": 12,
    "max_parallelism": 256,
    "classpath": ["/opt/lib"],
    "object_reuse": true
  })"));
  ASSERT_TRUE(options.has_value()) << options.error().message;
  EXPECT_EQ(options->job_name, "sessions");
  EXPECT_EQ(options->master, "jobmanager:6123");
  EXPECT_EQ(options->files_to_stage, std::vector<std::string>{"/opt/job.jar"});
  ASSERT_TRUE(options->streaming.has_value());
  EXPECT_TRUE(*options->streaming);
  EXPECT_TRUE(options->checkpoint.enabled);
  EXPECT_EQ(options->checkpoint.interval.count(), 5000);
  EXPECT_EQ(options->checkpoint.timeout.count(), 60000);
  EXPECT_EQ(options->checkpoint.mode, CheckpointingMode::AtLeastOnce);
  EXPECT_EQ(options->parallelism, 12);
  EXPECT_EQ(options->max_parallelism, 256);
  EXPECT_EQ(options->classpath, std::vector<std::string>{"/opt/lib"});
  EXPECT_TRUE(options->object_reuse);
}

TEST(PipelineOptions, MissingKeysKeepDefaults) {
  auto options = dfr::runner::parse_options_json(Json::object());
  ASSERT_TRUE(options.has_value()) << options.error().message;
  EXPECT_EQ(options->master, "[auto]");
  EXPECT_EQ(options->parallelism, -1);
}

TEST(PipelineOptions, RejectsWrongTypes) {
  auto options = dfr::runner::parse_options_json(Json::parse(R"({"parallelism": "many"})"));
  ASSERT_FALSE(options.has_value());
  EXPECT_EQ(options.error().code, ErrorCode::InvalidOptions);
  EXPECT_NE(options.error().message.find("parallelism"), std::string::npos);
}

TEST(PipelineOptions, RejectsUnknownCheckpointMode) {
  auto options = dfr::runner::parse_options_json(Json::parse(R"({"checkpoint": {"mode": "sometimes"}})"));
  ASSERT_FALSE(options.has_value());
  EXPECT_EQ(options.error().code, ErrorCode::InvalidOptions);
}

TEST(PipelineOptions, RejectsIntegersOutsideIntRange) {
  for (const char* text : {R"({"parallelism": 4294967297})", R"({"max_parallelism": -4294967297})",
                           R"({"parallelism": 18446744073709551615})"}) {
    auto options = dfr::runner::parse_options_json(Json::parse(text));
    ASSERT_FALSE(options.has_value()) << text;
    EXPECT_EQ(options.error().code, ErrorCode::InvalidOptions) << text;
    EXPECT_NE(options.error().message.find("out of range"), std::string::npos) << text;
  }
}

TEST(PipelineOptions, AcceptsIntBoundaries) {
  auto options = dfr::runner::parse_options_json(Json::parse(R"({"parallelism": 2147483647, "max_parallelism": -2147483648})"));
  ASSERT_TRUE(options.has_value()) << options.error().message;
  EXPECT_EQ(options->parallelism, 2147483647);
  EXPECT_EQ(options->max_parallelism, std::numeric_limits<int>::min());
}
