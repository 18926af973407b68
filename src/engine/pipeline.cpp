#include "engine/pipeline.hpp"

#include <string_view>

namespace im::engine {
namespace {

auto invalid(std::string message) -> EngineError {
  return make_validation_error("MALFORMED_PIPELINE", std::move(message));
}

auto get_string_field(const Json& obj, std::string_view field, std::string_view context)
  -> Expected<std::string> {
  auto it = obj.find(std::string(field));
  if (it == obj.end() || !it->is_string()) {
    return tl::unexpected(invalid(std::string(context) + ": missing or invalid field '" + std::string(field) + "'"));
  }
  return it->get<std::string>();
}

auto get_optional_string(const Json& obj, std::string_view field, std::string_view context)
  -> Expected<std::string> {
  auto it = obj.find(std::string(field));
  if (it == obj.end() || it->is_null()) {
    return std::string{};
  }
  if (!it->is_string()) {
    return tl::unexpected(invalid(std::string(context) + ": field '" + std::string(field) + "' must be a string"));
  }
  return it->get<std::string>();
}

}  // namespace

auto parse_pipeline_json(const Json& json) -> Expected<PipelineDefinition> {
  if (!json.is_object()) {
    return tl::unexpected(invalid("pipeline json must be an object"));
  }

  PipelineDefinition pipeline;
  if (auto id = get_optional_string(json, "id", "pipeline"); !id) {
    return tl::unexpected(id.error());
  } else {
    pipeline.id = std::move(*id);
  }
  if (auto name = get_optional_string(json, "name", "pipeline"); !name) {
    return tl::unexpected(name.error());
  } else {
    pipeline.name = std::move(*name);
  }

  auto nodes_it = json.find("nodes");
  if (nodes_it == json.end() || !nodes_it->is_array()) {
    return tl::unexpected(invalid("nodes must be an array"));
  }
  for (const auto& node_json : *nodes_it) {
    if (!node_json.is_object()) {
      return tl::unexpected(invalid("node entry must be an object"));
    }
    auto id = get_string_field(node_json, "id", "node");
    if (!id) {
      return tl::unexpected(id.error());
    }
    auto type = get_string_field(node_json, "type", "node");
    if (!type) {
      return tl::unexpected(type.error());
    }
    NodeDef node;
    node.id = std::move(*id);
    node.type = std::move(*type);
    if (auto config_it = node_json.find("config"); config_it != node_json.end() && !config_it->is_null()) {
      if (!config_it->is_object()) {
        return tl::unexpected(invalid("node config must be an object: " + node.id));
      }
      node.config = *config_it;
    }
    if (auto label = node.config.find("label"); label != node.config.end() && label->is_string()) {
      node.name = label->get<std::string>();
    } else {
      node.name = node.type;
    }
    pipeline.nodes.push_back(std::move(node));
  }

  auto connections_it = json.find("connections");
  if (connections_it != json.end() && !connections_it->is_null()) {
    if (!connections_it->is_array()) {
      return tl::unexpected(invalid("connections must be an array"));
    }
    for (const auto& conn_json : *connections_it) {
      if (!conn_json.is_object()) {
        return tl::unexpected(invalid("connection entry must be an object"));
      }
      auto source = get_string_field(conn_json, "source", "connection");
      if (!source) {
        return tl::unexpected(source.error());
      }
      auto target = get_string_field(conn_json, "target", "connection");
      if (!target) {
        return tl::unexpected(target.error());
      }
      auto source_handle = get_optional_string(conn_json, "sourceHandle", "connection");
      if (!source_handle) {
        return tl::unexpected(source_handle.error());
      }
      auto target_handle = get_optional_string(conn_json, "targetHandle", "connection");
      if (!target_handle) {
        return tl::unexpected(target_handle.error());
      }
      auto id = get_optional_string(conn_json, "id", "connection");
      if (!id) {
        return tl::unexpected(id.error());
      }

      ConnectionDef connection;
      connection.id = std::move(*id);
      connection.source_node = std::move(*source);
      connection.target_node = std::move(*target);
      connection.source_handle = std::move(*source_handle);
      connection.target_handle = std::move(*target_handle);
      pipeline.connections.push_back(std::move(connection));
    }
  }

  return pipeline;
}

auto parse_pipeline_text(std::string_view text) -> Expected<PipelineDefinition> {
  auto json = Json::parse(text.begin(), text.end(), nullptr, false);
  if (json.is_discarded()) {
    return tl::unexpected(invalid("pipeline text is not valid JSON"));
  }
  return parse_pipeline_json(json);
}

}  // namespace im::engine
