#pragma once

#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

namespace dfr {

using Json = nlohmann::json;

enum class ErrorCode {
  InvalidPipeline,
  InvalidOptions,
  UnsupportedTransform,
  StagingResolution,
  EngineExecution,
};

struct RunnerError {
  ErrorCode code = ErrorCode::InvalidPipeline;
  std::string message;
};

template <typename T>
using Expected = tl::expected<T, RunnerError>;

inline auto make_error(ErrorCode code, std::string message) -> RunnerError {
  return RunnerError{code, std::move(message)};
}

inline auto to_string(ErrorCode code) -> std::string_view {
  switch (code) {
    case ErrorCode::InvalidPipeline:
      return "invalid_pipeline";
    case ErrorCode::InvalidOptions:
      return "invalid_options";
    case ErrorCode::UnsupportedTransform:
      return "unsupported_transform";
    case ErrorCode::StagingResolution:
      return "staging_resolution";
    case ErrorCode::EngineExecution:
      return "engine_execution";
  }
  return "unknown";
}

}  // namespace dfr
