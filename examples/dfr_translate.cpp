#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>

#include <gflags/gflags.h>

#include "common/logging/log.hpp"
#include "model/dsl.hpp"
#include "runner/environment.hpp"
#include "runner/options.hpp"

DEFINE_string(pipeline, "", "Path to the pipeline DSL (JSON)");
DEFINE_string(options, "", "Path to a pipeline options JSON file");
DEFINE_string(master, "", "Overrides the master endpoint from --options");
DEFINE_string(streaming, "", "Force execution mode: 'true' or 'false' (inferred when empty)");

namespace {

auto read_file(const std::string& path, std::string& out) -> bool {
  std::ifstream file(path);
  if (!file) {
    return false;
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  out = buffer.str();
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage("Translate a pipeline into an engine execution plan");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  dfr::log::init();

  if (FLAGS_pipeline.empty()) {
    std::cerr << "--pipeline is required\n";
    return 2;
  }

  std::string dsl;
  if (!read_file(FLAGS_pipeline, dsl)) {
    std::cerr << "Failed to read pipeline: " << FLAGS_pipeline << "\n";
    return 1;
  }
  auto pipeline = dfr::model::parse_pipeline_dsl(dsl);
  if (!pipeline) {
    std::cerr << "Pipeline error: " << pipeline.error().message << "\n";
    return 1;
  }

  dfr::runner::PipelineOptions options;
  if (!FLAGS_options.empty()) {
    std::string text;
    if (!read_file(FLAGS_options, text)) {
      std::cerr << "Failed to read options: " << FLAGS_options << "\n";
      return 1;
    }
    dfr::Json json;
    try {
      json = dfr::Json::parse(text);
    } catch (const std::exception& ex) {
      std::cerr << "Failed to parse options: " << ex.what() << "\n";
      return 1;
    }
    auto parsed = dfr::runner::parse_options_json(json);
    if (!parsed) {
      std::cerr << "Options error: " << parsed.error().message << "\n";
      return 1;
    }
    options = std::move(*parsed);
  }
  if (!FLAGS_master.empty()) {
    options.master = FLAGS_master;
  }
  if (FLAGS_streaming == "true") {
    options.streaming = true;
  } else if (FLAGS_streaming == "false") {
    options.streaming = false;
  } else if (!FLAGS_streaming.empty()) {
    std::cerr << "--streaming must be 'true' or 'false'\n";
    return 2;
  }

  dfr::runner::ExecutionEnvironment env(options);
  auto plan = env.translate(*pipeline);
  if (!plan) {
    std::cerr << "Translation failed [" << dfr::to_string(plan.error().code) << "]: " << plan.error().message
              << "\n";
    dfr::log::shutdown();
    return 1;
  }

  std::cout << dfr::runner::to_json(*plan).dump(2) << "\n";
  dfr::log::shutdown();
  return 0;
}
