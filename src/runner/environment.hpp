#pragma once

#include "common/error.hpp"
#include "common/logging/log.hpp"
#include "model/graph.hpp"
#include "runner/options.hpp"
#include "runner/overrides.hpp"
#include "runner/plan.hpp"

namespace dfr::runner {

/// Turns a pipeline into an engine plan for one set of options.
///
/// The environment keeps a reference to `options`; `translate` rewrites
/// `options.files_to_stage` in place. The registry must outlive the
/// environment. Diagnostics go to `diagnostics` when given, otherwise to the
/// default logger.
class ExecutionEnvironment {
public:
  explicit ExecutionEnvironment(PipelineOptions &options,
                                const OverrideRegistry &overrides = OverrideRegistry::defaults(),
                                log::Sink diagnostics = nullptr);

  /// Detect the mode, apply overrides, check checkpointing, stage resources
  /// and translate. Errors are returned as raised; no partial plan.
  auto translate(const model::PipelineGraph &pipeline) -> Expected<ExecutionPlan>;

  auto options() -> PipelineOptions & { return options_; }
  auto diagnostics() const -> const log::Logger & { return diagnostics_; }

private:
  PipelineOptions &options_;
  const OverrideRegistry &overrides_;
  log::Logger diagnostics_;
};

} // namespace dfr::runner
