#include "runner/options.hpp"

#include <cstdint>
#include <format>
#include <limits>
#include <utility>

namespace dfr::runner {
namespace {

auto invalid(std::string message) -> RunnerError {
  return make_error(ErrorCode::InvalidOptions, std::move(message));
}

auto read_string(const Json& json, const char* key, std::string& out) -> Expected<void> {
  auto it = json.find(key);
  if (it == json.end()) {
    return {};
  }
  if (!it->is_string()) {
    return tl::unexpected(invalid(std::format("option '{}' must be a string", key)));
  }
  out = it->get<std::string>();
  return {};
}

auto read_int(const Json& json, const char* key, int& out) -> Expected<void> {
  auto it = json.find(key);
  if (it == json.end()) {
    return {};
  }
  if (!it->is_number_integer()) {
    return tl::unexpected(invalid(std::format("option '{}' must be an integer", key)));
  }
  constexpr auto kMin = static_cast<int64_t>(std::numeric_limits<int>::min());
  constexpr auto kMax = static_cast<int64_t>(std::numeric_limits<int>::max());
  if (it->is_number_unsigned() ? it->get<uint64_t>() > static_cast<uint64_t>(kMax)
                               : (it->get<int64_t>() < kMin || it->get<int64_t>() > kMax)) {
    return tl::unexpected(invalid(std::format("option '{}' is out of range: {}", key, it->dump())));
  }
  out = static_cast<int>(it->get<int64_t>());
  return {};
}

auto read_bool(const Json& json, const char* key, bool& out) -> Expected<void> {
  auto it = json.find(key);
  if (it == json.end()) {
    return {};
  }
  if (!it->is_boolean()) {
    return tl::unexpected(invalid(std::format("option '{}' must be a boolean", key)));
  }
  out = it->get<bool>();
  return {};
}

auto read_millis(const Json& json, const char* key, std::chrono::milliseconds& out) -> Expected<void> {
  auto it = json.find(key);
  if (it == json.end()) {
    return {};
  }
  if (!it->is_number_integer()) {
    return tl::unexpected(invalid(std::format("option '{}' must be an integer", key)));
  }
  out = std::chrono::milliseconds(it->get<int64_t>());
  return {};
}

auto read_string_list(const Json& json, const char* key, std::vector<std::string>& out) -> Expected<void> {
  auto it = json.find(key);
  if (it == json.end()) {
    return {};
  }
  if (!it->is_array()) {
    return tl::unexpected(invalid(std::format("option '{}' must be an array", key)));
  }
  std::vector<std::string> values;
  for (const auto& entry : *it) {
    if (!entry.is_string()) {
      return tl::unexpected(invalid(std::format("option '{}' entries must be strings", key)));
    }
    values.push_back(entry.get<std::string>());
  }
  out = std::move(values);
  return {};
}

auto parse_checkpoint(const Json& json, CheckpointConfig& checkpoint) -> Expected<void> {
  if (!json.is_object()) {
    return tl::unexpected(invalid("option 'checkpoint' must be an object"));
  }
  if (auto result = read_bool(json, "enabled", checkpoint.enabled); !result) {
    return result;
  }
  if (auto result = read_millis(json, "interval_ms", checkpoint.interval); !result) {
    return result;
  }
  if (auto result = read_millis(json, "timeout_ms", checkpoint.timeout); !result) {
    return result;
  }
  std::string mode;
  if (auto result = read_string(json, "mode", mode); !result) {
    return result;
  }
  if (mode == "exactly_once") {
    checkpoint.mode = CheckpointingMode::ExactlyOnce;
  } else if (mode == "at_least_once") {
    checkpoint.mode = CheckpointingMode::AtLeastOnce;
  } else if (!mode.empty()) {
    return tl::unexpected(invalid(std::format("unknown checkpointing mode: {}", mode)));
  }
  return {};
}

}  // namespace

auto to_string(CheckpointingMode mode) -> std::string_view {
  return mode == CheckpointingMode::ExactlyOnce ? "exactly_once" : "at_least_once";
}

auto parse_options_json(const Json& json) -> Expected<PipelineOptions> {
  if (!json.is_object()) {
    return tl::unexpected(invalid("options json must be an object"));
  }

  PipelineOptions options;
  if (auto result = read_string(json, "job_name", options.job_name); !result) {
    return tl::unexpected(result.error());
  }
  if (auto result = read_string(json, "runner", options.runner); !result) {
    return tl::unexpected(result.error());
  }
  if (auto result = read_string(json, "master", options.master); !result) {
    return tl::unexpected(result.error());
  }
  if (auto result = read_string_list(json, "files_to_stage", options.files_to_stage); !result) {
    return tl::unexpected(result.error());
  }
  if (auto result = read_string(json, "temp_location", options.temp_location); !result) {
    return tl::unexpected(result.error());
  }
  if (auto it = json.find("streaming"); it != json.end() && !it->is_null()) {
    if (!it->is_boolean()) {
      return tl::unexpected(invalid("option 'streaming' must be a boolean"));
    }
    options.streaming = it->get<bool>();
  }
  if (auto it = json.find("checkpoint"); it != json.end()) {
    if (auto result = parse_checkpoint(*it, options.checkpoint); !result) {
      return tl::unexpected(result.error());
    }
  }
  if (auto result = read_int(json, "parallelism", options.parallelism); !result) {
    return tl::unexpected(result.error());
  }
  if (auto result = read_int(json, "max_parallelism", options.max_parallelism); !result) {
    return tl::unexpected(result.error());
  }
  if (auto result = read_string_list(json, "classpath", options.classpath); !result) {
    return tl::unexpected(result.error());
  }
  if (auto result = read_bool(json, "object_reuse", options.object_reuse); !result) {
    return tl::unexpected(result.error());
  }
  return options;
}

}  // namespace dfr::runner
