#pragma once

#include <chrono>
#include <string>
#include <unordered_map>
#include <vector>

#include "engine/error.hpp"
#include "engine/pipeline.hpp"
#include "engine/registry.hpp"
#include "engine/types.hpp"

namespace im::engine {

struct PlanInput {
  std::string target_handle;
  int source_task = -1;
  std::string source_handle;
};

struct TaskSpec {
  int index = -1;
  std::string node_id;
  std::string node_type;
  Json config = Json::object();
  /// Indices of tasks earlier in the plan, sorted ascending.
  std::vector<int> depends_on;
  std::vector<PlanInput> inputs;
  /// Kahn wave the task was released in.
  int rank = 0;
  bool critical = true;
  bool retryable = true;
  int max_retries = 3;
  /// True when the node's own config set max_retries.
  bool max_retries_configured = false;
  std::chrono::milliseconds timeout{0};
};

struct ExecutionPlan {
  std::string pipeline_id;
  std::vector<TaskSpec> tasks;
  std::unordered_map<std::string, int> task_index;
};

struct CompileOptions {
  int default_max_retries = 3;
  std::chrono::milliseconds default_timeout{std::chrono::minutes(5)};
};

/// Validate a pipeline definition and order it topologically. Ties within a rank keep
/// declaration order, so the same definition always compiles to the same plan.
auto compile_plan(const PipelineDefinition& pipeline, const NodeRegistry& registry,
                  const CompileOptions& options = {}) -> Expected<ExecutionPlan>;

}  // namespace im::engine
