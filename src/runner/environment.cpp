#include "runner/environment.hpp"

#include <string>
#include <utility>

#include "runner/engine_settings.hpp"
#include "runner/master_endpoint.hpp"
#include "runner/mode.hpp"
#include "runner/resources.hpp"
#include "runner/translator.hpp"

namespace dfr::runner {

ExecutionEnvironment::ExecutionEnvironment(PipelineOptions &options,
                                           const OverrideRegistry &overrides,
                                           log::Sink diagnostics)
    : options_(options), overrides_(overrides),
      diagnostics_(log::make_diagnostics_logger(std::move(diagnostics))) {}

auto ExecutionEnvironment::translate(const model::PipelineGraph &pipeline)
    -> Expected<ExecutionPlan> {
  const auto mode = infer_mode(pipeline, options_.streaming);
  log::info("translating pipeline '{}' in {} mode", pipeline.name(), to_string(mode));

  const auto master = classify_master(options_.master);
  auto settings = resolve_engine_settings(options_, master, diagnostics_);
  if (!settings) {
    return tl::unexpected(settings.error());
  }

  const auto &overrides = overrides_.select_for(mode);
  OverrideContext override_ctx{pipeline, settings->parallelism, settings->max_parallelism};
  auto rewritten = rewrite(pipeline, overrides, override_ctx);
  if (!rewritten) {
    return tl::unexpected(rewritten.error());
  }
  for (const auto &applied : rewritten->applied) {
    log::debug("override {} replaced {}", applied.override_name, applied.node_id);
  }

  validate_checkpointing(rewritten->graph, mode, options_.checkpoint, diagnostics_);

  ResourceStager stager(options_.classpath);
  if (auto staged = stager.stage(options_); !staged) {
    return tl::unexpected(staged.error());
  }

  auto plan = translate_pipeline(rewritten->graph, TranslatorRegistry::defaults_for(mode), mode,
                                 *settings);
  if (!plan) {
    return tl::unexpected(plan.error());
  }
  plan->job_name = options_.job_name;
  plan->override_list = override_names(overrides);
  plan->applied_overrides = std::move(rewritten->applied);
  plan->files_to_stage = options_.files_to_stage;

  log::event("pipeline_translated", {{"pipeline", pipeline.name()},
                                     {"mode", std::string(to_string(mode))},
                                     {"operators", plan->operators.size()},
                                     {"edges", plan->edges.size()},
                                     {"files_to_stage", plan->files_to_stage.size()},
                                     {"overrides_applied", plan->applied_overrides.size()}});
  return plan;
}

} // namespace dfr::runner
