#include "model/types.hpp"

#include <array>
#include <format>
#include <utility>

namespace dfr::model {
namespace {

constexpr std::array<std::pair<TransformKind, std::string_view>, 14> kTransformKindNames = {{
  {TransformKind::Impulse, "Impulse"},
  {TransformKind::Read, "Read"},
  {TransformKind::ParDo, "ParDo"},
  {TransformKind::GroupByKey, "GroupByKey"},
  {TransformKind::CombinePerKey, "CombinePerKey"},
  {TransformKind::Flatten, "Flatten"},
  {TransformKind::AssignWindows, "AssignWindows"},
  {TransformKind::Reshuffle, "Reshuffle"},
  {TransformKind::CreateView, "CreateView"},
  {TransformKind::WriteFiles, "WriteFiles"},
  {TransformKind::TestStream, "TestStream"},
  {TransformKind::ProcessKeyedElements, "ProcessKeyedElements"},
  {TransformKind::CreateStreamingView, "CreateStreamingView"},
  {TransformKind::External, "External"},
}};

auto get_duration_ms(const Json& json, const char* key) -> Expected<std::chrono::milliseconds> {
  auto it = json.find(key);
  if (it == json.end() || !it->is_number_integer()) {
    return tl::unexpected(
      make_error(ErrorCode::InvalidPipeline, std::format("windowing: missing or invalid field '{}'", key)));
  }
  auto value = it->get<int64_t>();
  if (value <= 0) {
    return tl::unexpected(
      make_error(ErrorCode::InvalidPipeline, std::format("windowing: '{}' must be positive", key)));
  }
  return std::chrono::milliseconds(value);
}

}  // namespace

auto WindowingStrategy::fixed(std::chrono::milliseconds size) -> WindowingStrategy {
  WindowingStrategy windowing;
  windowing.fn = WindowFn::Fixed;
  windowing.size = size;
  return windowing;
}

auto WindowingStrategy::sliding(std::chrono::milliseconds size, std::chrono::milliseconds period)
  -> WindowingStrategy {
  WindowingStrategy windowing;
  windowing.fn = WindowFn::Sliding;
  windowing.size = size;
  windowing.period = period;
  return windowing;
}

auto WindowingStrategy::sessions(std::chrono::milliseconds gap) -> WindowingStrategy {
  WindowingStrategy windowing;
  windowing.fn = WindowFn::Sessions;
  windowing.gap = gap;
  return windowing;
}

auto to_string(Boundedness boundedness) -> std::string_view {
  return boundedness == Boundedness::Bounded ? "bounded" : "unbounded";
}

auto to_string(WindowFn fn) -> std::string_view {
  switch (fn) {
    case WindowFn::Global:
      return "global";
    case WindowFn::Fixed:
      return "fixed";
    case WindowFn::Sliding:
      return "sliding";
    case WindowFn::Sessions:
      return "sessions";
  }
  return "global";
}

auto to_string(TransformKind kind) -> std::string_view {
  for (const auto& [value, name] : kTransformKindNames) {
    if (value == kind) {
      return name;
    }
  }
  return "External";
}

auto parse_boundedness(std::string_view value) -> std::optional<Boundedness> {
  if (value == "bounded") return Boundedness::Bounded;
  if (value == "unbounded") return Boundedness::Unbounded;
  return std::nullopt;
}

auto parse_window_fn(std::string_view value) -> std::optional<WindowFn> {
  if (value == "global") return WindowFn::Global;
  if (value == "fixed") return WindowFn::Fixed;
  if (value == "sliding") return WindowFn::Sliding;
  if (value == "sessions") return WindowFn::Sessions;
  return std::nullopt;
}

auto parse_transform_kind(std::string_view value) -> std::optional<TransformKind> {
  for (const auto& [kind, name] : kTransformKindNames) {
    if (name == value) {
      return kind;
    }
  }
  return std::nullopt;
}

auto windowing_to_json(const WindowingStrategy& windowing) -> Json {
  Json json = Json::object();
  json["fn"] = std::string(to_string(windowing.fn));
  switch (windowing.fn) {
    case WindowFn::Global:
      break;
    case WindowFn::Fixed:
      json["size_ms"] = windowing.size.count();
      break;
    case WindowFn::Sliding:
      json["size_ms"] = windowing.size.count();
      json["period_ms"] = windowing.period.count();
      break;
    case WindowFn::Sessions:
      json["gap_ms"] = windowing.gap.count();
      break;
  }
  return json;
}

auto windowing_from_json(const Json& json) -> Expected<WindowingStrategy> {
  if (!json.is_object()) {
    return tl::unexpected(make_error(ErrorCode::InvalidPipeline, "windowing must be an object"));
  }
  auto fn_it = json.find("fn");
  if (fn_it == json.end() || !fn_it->is_string()) {
    return tl::unexpected(make_error(ErrorCode::InvalidPipeline, "windowing: missing or invalid field 'fn'"));
  }
  auto fn = parse_window_fn(fn_it->get<std::string>());
  if (!fn) {
    return tl::unexpected(make_error(ErrorCode::InvalidPipeline,
                                     std::format("windowing: unknown window fn: {}", fn_it->get<std::string>())));
  }

  switch (*fn) {
    case WindowFn::Global:
      return WindowingStrategy::global();
    case WindowFn::Fixed: {
      auto size = get_duration_ms(json, "size_ms");
      if (!size) {
        return tl::unexpected(size.error());
      }
      return WindowingStrategy::fixed(*size);
    }
    case WindowFn::Sliding: {
      auto size = get_duration_ms(json, "size_ms");
      if (!size) {
        return tl::unexpected(size.error());
      }
      auto period = get_duration_ms(json, "period_ms");
      if (!period) {
        return tl::unexpected(period.error());
      }
      return WindowingStrategy::sliding(*size, *period);
    }
    case WindowFn::Sessions: {
      auto gap = get_duration_ms(json, "gap_ms");
      if (!gap) {
        return tl::unexpected(gap.error());
      }
      return WindowingStrategy::sessions(*gap);
    }
  }
  return WindowingStrategy::global();
}

}  // namespace dfr::model
