#include "runner/runner.hpp"

#include <utility>

#include "runner/environment.hpp"

namespace dfr::runner {

auto to_string(JobState state) -> std::string_view {
  switch (state) {
    case JobState::Done:
      return "done";
    case JobState::Running:
      return "running";
    case JobState::Cancelled:
      return "cancelled";
  }
  return "unknown";
}

PipelineRunner::PipelineRunner(PipelineOptions options, std::shared_ptr<Engine> engine, log::Sink diagnostics,
                               const OverrideRegistry& overrides)
    : options_(std::move(options)),
      engine_(std::move(engine)),
      diagnostics_(std::move(diagnostics)),
      overrides_(overrides) {}

auto PipelineRunner::run(const model::PipelineGraph& pipeline) -> Expected<JobResult> {
  if (!engine_) {
    return tl::unexpected(make_error(ErrorCode::EngineExecution, "no engine configured"));
  }

  ExecutionEnvironment env(options_, overrides_, diagnostics_);
  auto plan = env.translate(pipeline);
  if (!plan) {
    env.diagnostics()->flush();
    return tl::unexpected(plan.error());
  }

  log::info("submitting job '{}' ({} mode, {} operators)", plan->job_name, to_string(plan->mode),
            plan->operators.size());
  auto result = engine_->execute(*plan);
  env.diagnostics()->flush();
  if (!result) {
    log::error("job '{}' failed: {}", plan->job_name, result.error().message);
    return result;
  }
  log::info("job '{}' finished with state {}", plan->job_name, to_string(result->state));
  return result;
}

}  // namespace dfr::runner
