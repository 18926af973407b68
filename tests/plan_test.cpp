#include "engine/plan.hpp"

#include <algorithm>

#include <gtest/gtest.h>

#include "engine/state_machine.hpp"
#include "test_support.hpp"

namespace {

using im::engine::ErrorKind;

class PlanTest : public ::testing::Test {
 protected:
  void SetUp() override { im::test::register_test_nodes(registry_, std::make_shared<im::test::CallLog>()); }

  auto compile(const char* text, const im::engine::CompileOptions& options = {})
    -> im::engine::Expected<im::engine::ExecutionPlan> {
    return im::engine::compile_plan(im::test::pipeline_from(text), registry_, options);
  }

  auto order_of(const im::engine::ExecutionPlan& plan) -> std::vector<std::string> {
    std::vector<std::string> ids;
    for (const auto& task : plan.tasks) {
      ids.push_back(task.node_id);
    }
    return ids;
  }

  im::engine::NodeRegistry registry_;
};

TEST_F(PlanTest, OrdersTopologicallyWithDeclarationTieBreak) {
  auto plan = compile(R"JSON({
    "nodes": [
      { "id": "sink", "type": "sink" },
      { "id": "right", "type": "const" },
      { "id": "left", "type": "const" },
      { "id": "root", "type": "const" }
    ],
    "connections": [
      { "source": "root", "sourceHandle": "value", "target": "right", "targetHandle": "in" },
      { "source": "root", "sourceHandle": "value", "target": "left", "targetHandle": "in" },
      { "source": "right", "sourceHandle": "value", "target": "sink", "targetHandle": "r" },
      { "source": "left", "sourceHandle": "value", "target": "sink", "targetHandle": "l" }
    ]
  })JSON");
  ASSERT_TRUE(plan.has_value()) << plan.error().message;
  EXPECT_EQ(order_of(*plan), (std::vector<std::string>{"root", "right", "left", "sink"}));

  const auto& sink = plan->tasks[3];
  EXPECT_EQ(sink.depends_on, (std::vector<int>{1, 2}));
  EXPECT_EQ(sink.rank, 2);
  ASSERT_EQ(sink.inputs.size(), 2u);
  EXPECT_EQ(plan->task_index.at("sink"), 3);
  for (const auto& task : plan->tasks) {
    for (int dependency : task.depends_on) {
      EXPECT_LT(dependency, task.index);
    }
  }
}

TEST_F(PlanTest, SameDefinitionCompilesToSamePlan) {
  const char* text = R"JSON({
    "nodes": [
      { "id": "c", "type": "const" }, { "id": "b", "type": "const" }, { "id": "a", "type": "const" }
    ],
    "connections": [ { "source": "a", "sourceHandle": "value", "target": "c", "targetHandle": "in" } ]
  })JSON";
  auto first = compile(text);
  auto second = compile(text);
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(order_of(*first), order_of(*second));
  EXPECT_EQ(order_of(*first), (std::vector<std::string>{"b", "a", "c"}));
}

TEST_F(PlanTest, RejectsCyclesNamingTheNodes) {
  auto plan = compile(R"JSON({
    "nodes": [ { "id": "a", "type": "const" }, { "id": "b", "type": "const" }, { "id": "c", "type": "const" } ],
    "connections": [
      { "source": "a", "target": "b", "targetHandle": "in" },
      { "source": "b", "target": "a", "targetHandle": "in" }
    ]
  })JSON");
  ASSERT_FALSE(plan.has_value());
  EXPECT_EQ(plan.error().kind, ErrorKind::Validation);
  EXPECT_EQ(plan.error().code, "CYCLIC_GRAPH");
  auto subjects = plan.error().subjects;
  std::sort(subjects.begin(), subjects.end());
  EXPECT_EQ(subjects, (std::vector<std::string>{"a", "b"}));

  auto self_loop = compile(R"JSON({
    "nodes": [ { "id": "a", "type": "const" } ],
    "connections": [ { "source": "a", "target": "a", "targetHandle": "in" } ]
  })JSON");
  ASSERT_FALSE(self_loop.has_value());
  EXPECT_EQ(self_loop.error().code, "CYCLIC_GRAPH");
}

TEST_F(PlanTest, ReportsStructuralErrors) {
  auto expect_code = [&](const char* text, const char* code) {
    auto plan = compile(text);
    ASSERT_FALSE(plan.has_value()) << text;
    EXPECT_EQ(plan.error().kind, ErrorKind::Validation);
    EXPECT_EQ(plan.error().code, code) << plan.error().message;
  };

  expect_code(R"JSON({ "nodes": [] })JSON", "EMPTY_PIPELINE");
  expect_code(R"JSON({ "nodes": [ { "id": "", "type": "const" } ] })JSON", "INVALID_NODE");
  expect_code(R"JSON({ "nodes": [ { "id": "a", "type": "const" }, { "id": "a", "type": "const" } ] })JSON",
              "DUPLICATE_NODE");
  expect_code(R"JSON({ "nodes": [ { "id": "a", "type": "teleport" } ] })JSON", "UNKNOWN_NODE_TYPE");
  expect_code(R"JSON({ "nodes": [ { "id": "a", "type": "const" } ],
                       "connections": [ { "source": "ghost", "target": "a" } ] })JSON",
              "UNKNOWN_NODE");
  expect_code(R"JSON({ "nodes": [ { "id": "a", "type": "const" }, { "id": "b", "type": "const" } ],
                       "connections": [ { "source": "a", "sourceHandle": "nope", "target": "b" } ] })JSON",
              "INVALID_HANDLE");
  expect_code(R"JSON({ "nodes": [ { "id": "a", "type": "const" }, { "id": "b", "type": "const" },
                                  { "id": "s", "type": "sink" } ],
                       "connections": [ { "source": "a", "target": "s", "targetHandle": "x" },
                                        { "source": "b", "target": "s", "targetHandle": "x" } ] })JSON",
              "DUPLICATE_BINDING");
}

TEST_F(PlanTest, AppliesRegistryPolicyAndConfigOverrides) {
  im::engine::CompileOptions options;
  options.default_max_retries = 2;
  options.default_timeout = std::chrono::milliseconds(1500);
  auto plan = compile(R"JSON({
    "nodes": [
      { "id": "plain", "type": "const" },
      { "id": "tuned", "type": "const", "config": { "max_retries": 0, "timeout_ms": 250 } },
      { "id": "extra", "type": "optional-broken" }
    ]
  })JSON",
                      options);
  ASSERT_TRUE(plan.has_value()) << plan.error().message;
  const auto& plain = plan->tasks[plan->task_index.at("plain")];
  const auto& tuned = plan->tasks[plan->task_index.at("tuned")];
  const auto& extra = plan->tasks[plan->task_index.at("extra")];
  EXPECT_EQ(plain.max_retries, 2);
  EXPECT_EQ(plain.timeout, std::chrono::milliseconds(1500));
  EXPECT_TRUE(plain.critical);
  EXPECT_EQ(tuned.max_retries, 0);
  EXPECT_EQ(tuned.timeout, std::chrono::milliseconds(250));
  EXPECT_FALSE(extra.critical);

  auto negative = compile(R"JSON({ "nodes": [ { "id": "a", "type": "const", "config": { "max_retries": -1 } } ] })JSON");
  ASSERT_FALSE(negative.has_value());
  EXPECT_EQ(negative.error().code, "INVALID_CONFIG");
  EXPECT_EQ(negative.error().subjects, (std::vector<std::string>{"a"}));

  auto too_large = compile(R"JSON({ "nodes": [ { "id": "a", "type": "const", "config": { "timeout_ms": 4294967296 } } ] })JSON");
  ASSERT_FALSE(too_large.has_value());
  EXPECT_EQ(too_large.error().code, "INVALID_CONFIG");
  EXPECT_EQ(too_large.error().subjects, (std::vector<std::string>{"a"}));
}

TEST_F(PlanTest, RunRetryBudgetAppliesWhereTheNodeSetsNone) {
  auto plan = compile(R"JSON({
    "nodes": [ { "id": "plain", "type": "const" },
               { "id": "tuned", "type": "const", "config": { "max_retries": 0 } } ]
  })JSON");
  ASSERT_TRUE(plan.has_value()) << plan.error().message;
  EXPECT_FALSE(plan->tasks[plan->task_index.at("plain")].max_retries_configured);
  EXPECT_TRUE(plan->tasks[plan->task_index.at("tuned")].max_retries_configured);

  im::engine::RunRequest request;
  request.max_retries = 5;
  auto aggregate = im::engine::make_aggregate(request, *plan, im::engine::Clock::now());
  EXPECT_EQ(aggregate.tasks[static_cast<std::size_t>(plan->task_index.at("plain"))].max_retries, 5);
  EXPECT_EQ(aggregate.tasks[static_cast<std::size_t>(plan->task_index.at("tuned"))].max_retries, 0);
}

TEST_F(PlanTest, UnnamedTargetHandleIsKeyedBySourceNode) {
  auto plan = compile(R"JSON({
    "nodes": [ { "id": "a", "type": "const" }, { "id": "s", "type": "sink" } ],
    "connections": [ { "source": "a", "target": "s" } ]
  })JSON");
  ASSERT_TRUE(plan.has_value()) << plan.error().message;
  const auto& sink = plan->tasks[1];
  ASSERT_EQ(sink.inputs.size(), 1u);
  EXPECT_EQ(sink.inputs[0].target_handle, "a");
  EXPECT_EQ(sink.inputs[0].source_task, 0);
  EXPECT_TRUE(sink.inputs[0].source_handle.empty());
}

}  // namespace
