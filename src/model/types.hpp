#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include "common/error.hpp"

namespace dfr::model {

enum class Boundedness {
  Bounded,
  Unbounded,
};

enum class WindowFn {
  Global,
  Fixed,
  Sliding,
  Sessions,
};

/// How a collection is partitioned into finite windows.
struct WindowingStrategy {
  WindowFn fn = WindowFn::Global;
  /// Window length for fixed and sliding windows.
  std::chrono::milliseconds size{0};
  /// Slide period for sliding windows.
  std::chrono::milliseconds period{0};
  /// Inactivity gap for session windows.
  std::chrono::milliseconds gap{0};

  static auto global() -> WindowingStrategy { return {}; }
  static auto fixed(std::chrono::milliseconds size) -> WindowingStrategy;
  static auto sliding(std::chrono::milliseconds size, std::chrono::milliseconds period)
    -> WindowingStrategy;
  static auto sessions(std::chrono::milliseconds gap) -> WindowingStrategy;

  auto operator==(const WindowingStrategy&) const -> bool = default;
};

/// Closed set of transform kinds understood by the runner. Overrides and
/// translators dispatch on this tag only.
enum class TransformKind {
  Impulse,
  Read,
  ParDo,
  GroupByKey,
  CombinePerKey,
  Flatten,
  AssignWindows,
  Reshuffle,
  CreateView,
  WriteFiles,
  TestStream,
  // Produced by runner overrides.
  ProcessKeyedElements,
  CreateStreamingView,
  // Anything the runner has no translation for.
  External,
};

auto to_string(Boundedness boundedness) -> std::string_view;
auto to_string(WindowFn fn) -> std::string_view;
auto to_string(TransformKind kind) -> std::string_view;

auto parse_boundedness(std::string_view value) -> std::optional<Boundedness>;
auto parse_window_fn(std::string_view value) -> std::optional<WindowFn>;
auto parse_transform_kind(std::string_view value) -> std::optional<TransformKind>;

auto windowing_to_json(const WindowingStrategy& windowing) -> Json;
auto windowing_from_json(const Json& json) -> Expected<WindowingStrategy>;

}  // namespace dfr::model
