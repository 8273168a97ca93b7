#pragma once

#include <string_view>

#include "common/error.hpp"
#include "model/graph.hpp"

namespace dfr::model {

auto parse_pipeline_json(const Json& json) -> Expected<PipelineGraph>;

/// Parse pipeline DSL text. JSON syntax errors are reported as InvalidPipeline.
auto parse_pipeline_dsl(std::string_view dsl) -> Expected<PipelineGraph>;

}  // namespace dfr::model
