#include "model/builder.hpp"

#include <utility>

namespace dfr::model {

PipelineBuilder::PipelineBuilder(std::string name) : name_(std::move(name)) {}

auto PipelineBuilder::find(const std::string& collection_id) const -> const CollectionDef* {
  for (const auto& collection : collections_) {
    if (collection.id == collection_id) {
      return &collection;
    }
  }
  return nullptr;
}

auto PipelineBuilder::add(TransformKind kind, std::string id, std::string user_fn,
                          std::vector<std::string> inputs, Json params, std::string element_type)
  -> std::string {
  CollectionDef output;
  output.id = id + ".out";
  output.element_type = std::move(element_type);

  bool first = true;
  for (const auto& input : inputs) {
    const auto* upstream = find(input);
    if (!upstream) {
      continue;
    }
    if (upstream->boundedness == Boundedness::Unbounded) {
      output.boundedness = Boundedness::Unbounded;
    }
    if (first) {
      output.windowing = upstream->windowing;
      if (output.element_type.empty()) {
        output.element_type = upstream->element_type;
      }
      first = false;
    }
  }

  TransformNode node;
  node.id = std::move(id);
  node.kind = kind;
  node.user_fn = std::move(user_fn);
  node.inputs = std::move(inputs);
  node.outputs = {output.id};
  node.params = std::move(params);

  auto output_id = output.id;
  collections_.push_back(std::move(output));
  nodes_.push_back(std::move(node));
  return output_id;
}

auto PipelineBuilder::impulse(std::string id) -> std::string {
  return add(TransformKind::Impulse, std::move(id), {}, {}, Json::object(), "bytes");
}

auto PipelineBuilder::read(std::string id, std::string user_fn, Boundedness boundedness,
                           std::string element_type) -> std::string {
  auto output = add(TransformKind::Read, std::move(id), std::move(user_fn), {}, Json::object(),
                    std::move(element_type));
  collections_.back().boundedness = boundedness;
  return output;
}

auto PipelineBuilder::par_do(std::string id, std::string user_fn, const std::string& input,
                             std::string element_type, Json params) -> std::string {
  return add(TransformKind::ParDo, std::move(id), std::move(user_fn), {input}, std::move(params),
             std::move(element_type));
}

auto PipelineBuilder::group_by_key(std::string id, const std::string& input) -> std::string {
  return add(TransformKind::GroupByKey, std::move(id), {}, {input}, Json::object(), {});
}

auto PipelineBuilder::combine_per_key(std::string id, std::string user_fn, const std::string& input)
  -> std::string {
  return add(TransformKind::CombinePerKey, std::move(id), std::move(user_fn), {input}, Json::object(), {});
}

auto PipelineBuilder::flatten(std::string id, const std::vector<std::string>& inputs) -> std::string {
  return add(TransformKind::Flatten, std::move(id), {}, inputs, Json::object(), {});
}

auto PipelineBuilder::window_into(std::string id, const std::string& input, WindowingStrategy windowing)
  -> std::string {
  auto output = add(TransformKind::AssignWindows, std::move(id), {}, {input},
                    Json{{"windowing", windowing_to_json(windowing)}}, {});
  collections_.back().windowing = windowing;
  return output;
}

auto PipelineBuilder::reshuffle(std::string id, const std::string& input) -> std::string {
  return add(TransformKind::Reshuffle, std::move(id), {}, {input}, Json::object(), {});
}

auto PipelineBuilder::create_view(std::string id, const std::string& input) -> std::string {
  return add(TransformKind::CreateView, std::move(id), {}, {input}, Json::object(), {});
}

auto PipelineBuilder::test_stream(std::string id, std::string element_type) -> std::string {
  auto output = add(TransformKind::TestStream, std::move(id), {}, {}, Json::object(), std::move(element_type));
  collections_.back().boundedness = Boundedness::Unbounded;
  return output;
}

auto PipelineBuilder::write_files(std::string id, const std::string& input, const WriteFilesSpec& spec)
  -> void {
  TransformNode node;
  node.id = std::move(id);
  node.kind = TransformKind::WriteFiles;
  node.inputs = {input};
  node.params = Json{{"path", spec.path},
                     {"num_shards", spec.num_shards},
                     {"windowed_writes", spec.windowed_writes}};
  nodes_.push_back(std::move(node));
}

auto PipelineBuilder::apply(TransformNode node, std::vector<CollectionDef> outputs) -> void {
  for (auto& output : outputs) {
    collections_.push_back(std::move(output));
  }
  nodes_.push_back(std::move(node));
}

auto PipelineBuilder::build() const -> Expected<PipelineGraph> {
  return PipelineGraph::create(name_, collections_, nodes_);
}

}  // namespace dfr::model
