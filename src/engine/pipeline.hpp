#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "engine/error.hpp"
#include "engine/types.hpp"

namespace im::engine {

struct NodeDef {
  std::string id;
  std::string type;
  std::string name;
  Json config = Json::object();
};

struct ConnectionDef {
  std::string id;
  std::string source_node;
  std::string source_handle;
  std::string target_node;
  std::string target_handle;
};

struct PipelineDefinition {
  std::string id;
  std::string name;
  std::vector<NodeDef> nodes;
  std::vector<ConnectionDef> connections;
};

/// Parse the platform's pipeline configuration JSON:
/// `{ "nodes": [{ "id", "type", "config"? }], "connections": [{ "source", "target",
/// "sourceHandle"?, "targetHandle"? }] }`. Structural checks only; graph validation
/// happens in compile_plan.
auto parse_pipeline_json(const Json& json) -> Expected<PipelineDefinition>;

auto parse_pipeline_text(std::string_view text) -> Expected<PipelineDefinition>;

}  // namespace im::engine
