#include "model/dsl.hpp"

#include <format>
#include <string>
#include <vector>

namespace dfr::model {
namespace {

auto invalid(std::string message) -> RunnerError {
  return make_error(ErrorCode::InvalidPipeline, std::move(message));
}

auto get_string_field(const Json& obj, std::string_view field, std::string_view context)
  -> Expected<std::string> {
  auto it = obj.find(std::string(field));
  if (it == obj.end() || !it->is_string()) {
    return tl::unexpected(invalid(std::format("{}: missing or invalid field '{}'", context, field)));
  }
  return it->get<std::string>();
}

auto get_string_list(const Json& obj, std::string_view field, std::string_view context)
  -> Expected<std::vector<std::string>> {
  std::vector<std::string> values;
  auto it = obj.find(std::string(field));
  if (it == obj.end()) {
    return values;
  }
  if (!it->is_array()) {
    return tl::unexpected(invalid(std::format("{}: '{}' must be an array", context, field)));
  }
  for (const auto& entry : *it) {
    if (!entry.is_string()) {
      return tl::unexpected(invalid(std::format("{}: '{}' entries must be strings", context, field)));
    }
    values.push_back(entry.get<std::string>());
  }
  return values;
}

auto parse_collection(const Json& json) -> Expected<CollectionDef> {
  if (!json.is_object()) {
    return tl::unexpected(invalid("collection entry must be an object"));
  }
  auto id = get_string_field(json, "id", "collection");
  if (!id) {
    return tl::unexpected(id.error());
  }

  CollectionDef collection;
  collection.id = std::move(*id);
  if (auto it = json.find("type"); it != json.end()) {
    if (!it->is_string()) {
      return tl::unexpected(invalid(std::format("collection {}: type must be a string", collection.id)));
    }
    collection.element_type = it->get<std::string>();
  }
  if (auto it = json.find("boundedness"); it != json.end()) {
    auto boundedness = it->is_string() ? parse_boundedness(it->get<std::string>()) : std::nullopt;
    if (!boundedness) {
      return tl::unexpected(
        invalid(std::format("collection {}: boundedness must be 'bounded' or 'unbounded'", collection.id)));
    }
    collection.boundedness = *boundedness;
  }
  if (auto it = json.find("windowing"); it != json.end()) {
    auto windowing = windowing_from_json(*it);
    if (!windowing) {
      return tl::unexpected(
        invalid(std::format("collection {}: {}", collection.id, windowing.error().message)));
    }
    collection.windowing = *windowing;
  }
  return collection;
}

auto parse_transform(const Json& json) -> Expected<TransformNode> {
  if (!json.is_object()) {
    return tl::unexpected(invalid("transform entry must be an object"));
  }
  auto id = get_string_field(json, "id", "transform");
  if (!id) {
    return tl::unexpected(id.error());
  }
  auto kind_name = get_string_field(json, "kind", "transform");
  if (!kind_name) {
    return tl::unexpected(kind_name.error());
  }
  auto kind = parse_transform_kind(*kind_name);
  if (!kind) {
    return tl::unexpected(invalid(std::format("transform {}: unknown kind: {}", *id, *kind_name)));
  }

  TransformNode node;
  node.id = std::move(*id);
  node.kind = *kind;
  if (auto it = json.find("fn"); it != json.end()) {
    if (!it->is_string()) {
      return tl::unexpected(invalid(std::format("transform {}: fn must be a string", node.id)));
    }
    node.user_fn = it->get<std::string>();
  }

  auto inputs = get_string_list(json, "inputs", "transform");
  if (!inputs) {
    return tl::unexpected(inputs.error());
  }
  node.inputs = std::move(*inputs);

  auto outputs = get_string_list(json, "outputs", "transform");
  if (!outputs) {
    return tl::unexpected(outputs.error());
  }
  node.outputs = std::move(*outputs);

  if (auto it = json.find("params"); it != json.end()) {
    if (!it->is_object()) {
      return tl::unexpected(invalid(std::format("transform {}: params must be an object", node.id)));
    }
    node.params = *it;
  } else {
    node.params = Json::object();
  }
  return node;
}

}  // namespace

auto parse_pipeline_json(const Json& json) -> Expected<PipelineGraph> {
  if (!json.is_object()) {
    return tl::unexpected(invalid("pipeline json must be an object"));
  }

  std::string name;
  if (auto it = json.find("name"); it != json.end()) {
    if (!it->is_string()) {
      return tl::unexpected(invalid("name must be a string"));
    }
    name = it->get<std::string>();
  }

  std::vector<CollectionDef> collections;
  if (auto it = json.find("collections"); it != json.end()) {
    if (!it->is_array()) {
      return tl::unexpected(invalid("collections must be an array"));
    }
    for (const auto& collection_json : *it) {
      auto collection = parse_collection(collection_json);
      if (!collection) {
        return tl::unexpected(collection.error());
      }
      collections.push_back(std::move(*collection));
    }
  }

  auto transforms_it = json.find("transforms");
  if (transforms_it == json.end() || !transforms_it->is_array()) {
    return tl::unexpected(invalid("transforms must be an array"));
  }
  std::vector<TransformNode> nodes;
  for (const auto& transform_json : *transforms_it) {
    auto node = parse_transform(transform_json);
    if (!node) {
      return tl::unexpected(node.error());
    }
    nodes.push_back(std::move(*node));
  }

  return PipelineGraph::create(std::move(name), std::move(collections), std::move(nodes));
}

auto parse_pipeline_dsl(std::string_view dsl) -> Expected<PipelineGraph> {
  Json json;
  try {
    json = Json::parse(dsl);
  } catch (const Json::parse_error& ex) {
    return tl::unexpected(invalid(std::format("pipeline dsl parse error: {}", ex.what())));
  }
  return parse_pipeline_json(json);
}

}  // namespace dfr::model
