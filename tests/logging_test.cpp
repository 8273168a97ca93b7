#include "common/logging/log.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

#include <fstream>
#include <sstream>

#include <gflags/gflags.h>
#include <spdlog/sinks/null_sink.h>

TEST(Logging, ParsesLevelNames) {
  EXPECT_EQ(dfr::log::parse_level("debug"), spdlog::level::debug);
  EXPECT_EQ(dfr::log::parse_level("warn"), spdlog::level::warn);
  EXPECT_EQ(dfr::log::parse_level("off"), spdlog::level::off);
  EXPECT_EQ(dfr::log::parse_level("loud"), spdlog::level::info);
}

TEST(Logging, SettingsComeFromFlags) {
  gflags::FlagSaver saver;
  gflags::SetCommandLineOption("log_level", "error");
  gflags::SetCommandLineOption("log_file", "/tmp/dfr-flags.log");
  gflags::SetCommandLineOption("log_to_stderr", "true");

  auto settings = dfr::log::LogSettings::from_flags();
  EXPECT_EQ(settings.level, spdlog::level::err);
  EXPECT_EQ(settings.file, "/tmp/dfr-flags.log");
  EXPECT_TRUE(settings.to_stderr);
}

TEST(Logging, FormatsTypedEventFields) {
  auto line = dfr::log::format_event("pipeline_translated",
                                     {{"pipeline", "wordcount"}, {"operators", 5}, {"streaming", true}});
  EXPECT_EQ(line, "pipeline_translated pipeline=wordcount operators=5 streaming=true");
  EXPECT_EQ(dfr::log::format_event("empty", {}), "empty");
}

TEST(Logging, DiagnosticsLoggerWithoutSinkIsDefault) {
  EXPECT_EQ(dfr::log::make_diagnostics_logger(nullptr), spdlog::default_logger());
}

TEST(Logging, DiagnosticsLoggerLeavesFlushingToOwner) {
  auto sink = std::make_shared<BufferedSink>();
  auto logger = dfr::log::make_diagnostics_logger(sink);
  logger->warn("careful");
  logger->error("broken");
  EXPECT_NE(sink->pending().find("[warning] careful"), std::string::npos);
  EXPECT_TRUE(sink->flushed().empty());

  logger->flush();
  EXPECT_NE(sink->flushed().find("[error] broken"), std::string::npos);
  EXPECT_TRUE(sink->pending().empty());
}

TEST(Logging, InitWritesEventsToLogFile) {
  TempDir dir;
  dfr::log::LogSettings settings;
  settings.file = (dir.path() / "dfr.log").string();
  settings.level = spdlog::level::debug;
  dfr::log::init(settings);
  dfr::log::event("job_submitted", {{"job", "sessions"}, {"parallelism", 4}});
  dfr::log::shutdown();
  // shutdown drops every registered logger, the default one included.
  spdlog::set_default_logger(std::make_shared<spdlog::logger>("dfr.test", std::make_shared<spdlog::sinks::null_sink_mt>()));

  std::ifstream in(settings.file);
  std::stringstream content;
  content << in.rdbuf();
  EXPECT_NE(content.str().find("logger_initialized"), std::string::npos);
  EXPECT_NE(content.str().find("job_submitted job=sessions parallelism=4"), std::string::npos);
}
