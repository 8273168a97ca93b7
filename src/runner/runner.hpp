#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "common/error.hpp"
#include "common/logging/log.hpp"
#include "model/graph.hpp"
#include "runner/options.hpp"
#include "runner/overrides.hpp"
#include "runner/plan.hpp"

namespace dfr::runner {

enum class JobState {
  Done,
  Running,
  Cancelled,
};

struct JobResult {
  std::string job_id;
  JobState state = JobState::Done;
};

auto to_string(JobState state) -> std::string_view;

/// Submission API of the dataflow engine. Failures raised while the job runs
/// come back as EngineExecution errors.
class Engine {
 public:
  virtual ~Engine() = default;

  virtual auto execute(const ExecutionPlan& plan) -> Expected<JobResult> = 0;
};

/// Translates a pipeline and hands the plan to an engine.
class PipelineRunner {
 public:
  PipelineRunner(PipelineOptions options, std::shared_ptr<Engine> engine, log::Sink diagnostics = nullptr,
                 const OverrideRegistry& overrides = OverrideRegistry::defaults());

  /// Engine errors are returned unchanged, after pending diagnostics have
  /// been flushed to the sink.
  auto run(const model::PipelineGraph& pipeline) -> Expected<JobResult>;

  auto options() const -> const PipelineOptions& { return options_; }

 private:
  PipelineOptions options_;
  std::shared_ptr<Engine> engine_;
  log::Sink diagnostics_;
  const OverrideRegistry& overrides_;
};

}  // namespace dfr::runner
