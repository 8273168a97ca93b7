#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "common/error.hpp"
#include "model/graph.hpp"
#include "model/types.hpp"

namespace dfr::model {

struct WriteFilesSpec {
  std::string path;
  /// 0 lets the runner pick the shard count.
  int64_t num_shards = 0;
  bool windowed_writes = false;
};

/// Apply-style authoring helper. Each method adds one transform and returns
/// the id of its main output collection. Output collections inherit the
/// element type, boundedness and windowing of their first input unless the
/// transform defines them. Problems surface from `build`.
class PipelineBuilder {
 public:
  explicit PipelineBuilder(std::string name);

  auto impulse(std::string id) -> std::string;
  auto read(std::string id, std::string user_fn, Boundedness boundedness, std::string element_type)
    -> std::string;
  auto par_do(std::string id, std::string user_fn, const std::string& input, std::string element_type = {},
              Json params = Json::object()) -> std::string;
  auto group_by_key(std::string id, const std::string& input) -> std::string;
  auto combine_per_key(std::string id, std::string user_fn, const std::string& input) -> std::string;
  auto flatten(std::string id, const std::vector<std::string>& inputs) -> std::string;
  auto window_into(std::string id, const std::string& input, WindowingStrategy windowing) -> std::string;
  auto reshuffle(std::string id, const std::string& input) -> std::string;
  auto create_view(std::string id, const std::string& input) -> std::string;
  auto test_stream(std::string id, std::string element_type) -> std::string;
  auto write_files(std::string id, const std::string& input, const WriteFilesSpec& spec) -> void;

  /// Add an arbitrary node together with the collections it produces.
  auto apply(TransformNode node, std::vector<CollectionDef> outputs) -> void;

  auto build() const -> Expected<PipelineGraph>;

 private:
  auto add(TransformKind kind, std::string id, std::string user_fn, std::vector<std::string> inputs,
           Json params, std::string element_type) -> std::string;
  auto find(const std::string& collection_id) const -> const CollectionDef*;

  std::string name_;
  std::vector<CollectionDef> collections_;
  std::vector<TransformNode> nodes_;
};

}  // namespace dfr::model
