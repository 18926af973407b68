#include "engine/plan.hpp"

#include <algorithm>
#include <limits>
#include <set>
#include <string_view>
#include <unordered_set>

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

namespace im::engine {
namespace {

struct NodeBuild {
  const NodeDef* def = nullptr;
  const NodeTypeInfo* info = nullptr;
  std::vector<PlanInput> inputs;
  std::unordered_set<std::string> bound_inputs;
  std::set<int> predecessors;
};

auto int_override(const Json& config, const char* key, int fallback) -> Expected<int> {
  auto it = config.find(key);
  if (it == config.end() || it->is_null()) {
    return fallback;
  }
  if (!it->is_number_integer() || it->get<std::int64_t>() < 0 ||
      it->get<std::int64_t>() > std::numeric_limits<int>::max()) {
    return tl::unexpected(make_validation_error(
      "INVALID_CONFIG", fmt::format("{} must be an integer between 0 and {}", key, std::numeric_limits<int>::max())));
  }
  return it->get<int>();
}

struct PlanBuilder {
  const PipelineDefinition& pipeline;
  const NodeRegistry& registry;
  const CompileOptions& options;

  std::unordered_map<std::string, int> node_index;
  std::vector<NodeBuild> builds;
  std::vector<std::vector<int>> edges;
  std::vector<int> indegree;

  auto build_nodes() -> Expected<void> {
    node_index.reserve(pipeline.nodes.size());
    builds.reserve(pipeline.nodes.size());

    for (const auto& node : pipeline.nodes) {
      if (node.id.empty()) {
        return tl::unexpected(make_validation_error("INVALID_NODE", "node id must not be empty"));
      }
      if (node_index.contains(node.id)) {
        return tl::unexpected(
          make_validation_error("DUPLICATE_NODE", fmt::format("duplicate node id: {}", node.id), {node.id}));
      }
      const auto* entry = registry.find(node.type);
      if (!entry) {
        return tl::unexpected(make_validation_error(
          "UNKNOWN_NODE_TYPE", fmt::format("node type not registered: {} ({})", node.type, node.id), {node.id}));
      }
      NodeBuild build;
      build.def = &node;
      build.info = &entry->info;
      node_index.emplace(node.id, static_cast<int>(builds.size()));
      builds.push_back(std::move(build));
    }

    edges.assign(builds.size(), {});
    indegree.assign(builds.size(), 0);
    return {};
  }

  auto bind_connections() -> Expected<void> {
    for (const auto& connection : pipeline.connections) {
      auto from_it = node_index.find(connection.source_node);
      if (from_it == node_index.end()) {
        return tl::unexpected(make_validation_error(
          "UNKNOWN_NODE", fmt::format("connection source node '{}' not found", connection.source_node),
          {connection.source_node}));
      }
      auto to_it = node_index.find(connection.target_node);
      if (to_it == node_index.end()) {
        return tl::unexpected(make_validation_error(
          "UNKNOWN_NODE", fmt::format("connection target node '{}' not found", connection.target_node),
          {connection.target_node}));
      }
      if (from_it->second == to_it->second) {
        return tl::unexpected(make_validation_error(
          "CYCLIC_GRAPH", fmt::format("node connects to itself: {}", connection.source_node),
          {connection.source_node}));
      }

      auto& source = builds[static_cast<std::size_t>(from_it->second)];
      auto& target = builds[static_cast<std::size_t>(to_it->second)];
      if (!source.info->provides_output(connection.source_handle)) {
        return tl::unexpected(make_validation_error(
          "INVALID_HANDLE",
          fmt::format("unknown output handle: {}.{}", connection.source_node, connection.source_handle),
          {connection.source_node}));
      }
      if (!target.info->accepts_input(connection.target_handle)) {
        return tl::unexpected(make_validation_error(
          "INVALID_HANDLE",
          fmt::format("unknown input handle: {}.{}", connection.target_node, connection.target_handle),
          {connection.target_node}));
      }

      // An unnamed target handle receives the value keyed by the source node id.
      std::string input_key =
        connection.target_handle.empty() ? connection.source_node : connection.target_handle;
      if (!target.bound_inputs.insert(input_key).second) {
        return tl::unexpected(make_validation_error(
          "DUPLICATE_BINDING", fmt::format("input handle bound twice: {}.{}", connection.target_node, input_key),
          {connection.target_node}));
      }

      target.inputs.push_back(PlanInput{std::move(input_key), from_it->second, connection.source_handle});
      if (target.predecessors.insert(from_it->second).second) {
        edges[static_cast<std::size_t>(from_it->second)].push_back(to_it->second);
        indegree[static_cast<std::size_t>(to_it->second)] += 1;
      }
    }
    return {};
  }

  /// Kahn's algorithm released in waves; each wave is sorted by declaration index.
  auto topo_sort(std::vector<int>& ranks) -> Expected<std::vector<int>> {
    std::vector<int> wave;
    for (std::size_t i = 0; i < indegree.size(); ++i) {
      if (indegree[i] == 0) {
        wave.push_back(static_cast<int>(i));
      }
    }

    std::vector<int> topo;
    topo.reserve(builds.size());
    ranks.assign(builds.size(), 0);
    int rank = 0;
    while (!wave.empty()) {
      std::vector<int> next;
      for (int node : wave) {
        ranks[static_cast<std::size_t>(node)] = rank;
        topo.push_back(node);
        for (int succ : edges[static_cast<std::size_t>(node)]) {
          indegree[static_cast<std::size_t>(succ)] -= 1;
          if (indegree[static_cast<std::size_t>(succ)] == 0) {
            next.push_back(succ);
          }
        }
      }
      std::sort(next.begin(), next.end());
      wave = std::move(next);
      rank += 1;
    }

    if (topo.size() != builds.size()) {
      std::vector<std::string> offending;
      for (std::size_t i = 0; i < indegree.size(); ++i) {
        if (indegree[i] > 0) {
          offending.push_back(builds[i].def->id);
        }
      }
      return tl::unexpected(make_validation_error(
        "CYCLIC_GRAPH", fmt::format("pipeline contains cycles: {}", fmt::join(offending, ", ")),
        std::move(offending)));
    }
    return topo;
  }

  auto build_plan(const std::vector<int>& topo, const std::vector<int>& ranks) -> Expected<ExecutionPlan> {
    ExecutionPlan plan;
    plan.pipeline_id = pipeline.id;
    plan.tasks.reserve(topo.size());

    std::vector<int> position(builds.size(), -1);
    for (std::size_t i = 0; i < topo.size(); ++i) {
      position[static_cast<std::size_t>(topo[i])] = static_cast<int>(i);
    }

    for (std::size_t i = 0; i < topo.size(); ++i) {
      const auto& build = builds[static_cast<std::size_t>(topo[i])];
      const auto& info = *build.info;

      TaskSpec task;
      task.index = static_cast<int>(i);
      task.node_id = build.def->id;
      task.node_type = build.def->type;
      task.config = build.def->config;
      task.rank = ranks[static_cast<std::size_t>(topo[i])];
      task.critical = !info.optional;
      task.retryable = info.retryable;

      auto max_retries = int_override(task.config, "max_retries", info.max_retries.value_or(options.default_max_retries));
      if (!max_retries) {
        auto error = max_retries.error();
        error.subjects.push_back(task.node_id);
        return tl::unexpected(std::move(error));
      }
      task.max_retries = *max_retries;
      task.max_retries_configured = task.config.contains("max_retries") && !task.config.at("max_retries").is_null();

      auto default_timeout = info.timeout.count() > 0 ? info.timeout : options.default_timeout;
      auto timeout_ms = int_override(task.config, "timeout_ms", static_cast<int>(default_timeout.count()));
      if (!timeout_ms) {
        auto error = timeout_ms.error();
        error.subjects.push_back(task.node_id);
        return tl::unexpected(std::move(error));
      }
      task.timeout = std::chrono::milliseconds(*timeout_ms);

      for (int predecessor : build.predecessors) {
        task.depends_on.push_back(position[static_cast<std::size_t>(predecessor)]);
      }
      std::sort(task.depends_on.begin(), task.depends_on.end());

      for (const auto& input : build.inputs) {
        task.inputs.push_back(
          PlanInput{input.target_handle, position[static_cast<std::size_t>(input.source_task)], input.source_handle});
      }

      plan.task_index.emplace(task.node_id, task.index);
      plan.tasks.push_back(std::move(task));
    }
    return plan;
  }
};

}  // namespace

auto compile_plan(const PipelineDefinition& pipeline, const NodeRegistry& registry, const CompileOptions& options)
  -> Expected<ExecutionPlan> {
  if (pipeline.nodes.empty()) {
    return tl::unexpected(make_validation_error("EMPTY_PIPELINE", "pipeline has no nodes"));
  }

  PlanBuilder builder{pipeline, registry, options};
  if (auto result = builder.build_nodes(); !result) {
    return tl::unexpected(result.error());
  }
  if (auto result = builder.bind_connections(); !result) {
    return tl::unexpected(result.error());
  }
  std::vector<int> ranks;
  auto topo = builder.topo_sort(ranks);
  if (!topo) {
    return tl::unexpected(topo.error());
  }
  return builder.build_plan(*topo, ranks);
}

}  // namespace im::engine
