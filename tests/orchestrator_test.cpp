#include "runtime/orchestrator.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>

#include <gtest/gtest.h>

#include "engine/memory_store.hpp"
#include "nodes/sample_nodes.hpp"
#include "test_support.hpp"

namespace {

using im::engine::ErrorKind;
using im::engine::EventType;
using im::engine::RunStatus;
using im::engine::TaskStatus;

constexpr auto kWait = std::chrono::seconds(10);

auto fast_config() -> im::engine::OrchestratorConfig {
  im::engine::OrchestratorConfig config;
  config.max_concurrent_tasks = 4;
  config.dispatch_poll_interval = std::chrono::milliseconds(10);
  config.retry = {std::chrono::milliseconds(5), std::chrono::milliseconds(20), 3};
  config.default_task_timeout = std::chrono::seconds(30);
  return config;
}

class OrchestratorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    store_ = std::make_shared<im::engine::MemoryExecutionStore>();
    orchestrator_ = std::make_unique<im::engine::Orchestrator>(fast_config(), store_);
    calls_ = std::make_shared<im::test::CallLog>();
    im::test::register_test_nodes(orchestrator_->registry(), calls_);
    im::nodes::register_sample_nodes(orchestrator_->registry());
    orchestrator_->events().add_sink(events_);
    auto started = orchestrator_->start();
    ASSERT_TRUE(started.has_value()) << started.error().message;
  }

  void TearDown() override { orchestrator_->stop(); }

  auto run(const char* text, im::engine::SubmitOptions options = {}) -> im::engine::Run {
    auto run_id = orchestrator_->submit(im::test::pipeline_from(text), options);
    EXPECT_TRUE(run_id.has_value()) << (run_id ? "" : run_id.error().message);
    if (!run_id) {
      return {};
    }
    auto finished = orchestrator_->wait_for(*run_id, kWait);
    EXPECT_TRUE(finished.has_value()) << (finished ? "" : finished.error().message);
    settle(*run_id);
    return finished ? *finished : im::engine::Run{};
  }

  /// The terminal event and the run summary log land just after the store commit.
  auto settle(im::engine::RunId run_id) -> void {
    EXPECT_TRUE(im::test::wait_for_condition(
      [&]() {
        auto logs = orchestrator_->logs(run_id);
        if (!logs) {
          return false;
        }
        for (const auto& entry : *logs) {
          if (!entry.task_id && entry.message.find("status=") != std::string::npos) {
            return true;
          }
        }
        return false;
      },
      kWait));
  }

  auto task(im::engine::RunId run_id, const std::string& node_id) -> im::engine::TaskExecution {
    auto view = orchestrator_->status(run_id);
    EXPECT_TRUE(view.has_value());
    for (const auto& candidate : view->tasks) {
      if (candidate.node_id == node_id) {
        return candidate;
      }
    }
    ADD_FAILURE() << "no task " << node_id;
    return {};
  }

  auto count(im::engine::RunId run_id, EventType type) -> int {
    int n = 0;
    for (const auto& event : events_->events(run_id)) {
      n += event.type == type ? 1 : 0;
    }
    return n;
  }

  std::shared_ptr<im::engine::MemoryExecutionStore> store_;
  std::unique_ptr<im::engine::Orchestrator> orchestrator_;
  std::shared_ptr<im::test::CallLog> calls_;
  std::shared_ptr<im::engine::MemoryEventSink> events_ = std::make_shared<im::engine::MemoryEventSink>();
};

TEST_F(OrchestratorTest, LinearPipelineSurvivesTransientFailures) {
  auto finished = run(R"JSON({
    "nodes": [ { "id": "a", "type": "const", "config": { "value": "x" } },
               { "id": "b", "type": "flaky", "config": { "fail_first": 2 } },
               { "id": "c", "type": "sink" } ],
    "connections": [ { "source": "a", "sourceHandle": "value", "target": "b", "targetHandle": "in" },
                     { "source": "b", "sourceHandle": "value", "target": "c", "targetHandle": "v" } ]
  })JSON");
  EXPECT_EQ(finished.status, RunStatus::Completed);
  EXPECT_EQ(finished.retry_count, 2);
  EXPECT_DOUBLE_EQ(finished.progress, 1.0);
  EXPECT_EQ(task(finished.id, "b").attempt, 3);
  EXPECT_EQ(calls_->calls("b"), 3);
  EXPECT_EQ(calls_->calls("c"), 1);
  EXPECT_EQ(count(finished.id, EventType::TaskRetrying), 2);

  auto events = events_->events(finished.id);
  ASSERT_FALSE(events.empty());
  EXPECT_EQ(events.front().type, EventType::RunQueued);
  EXPECT_EQ(events.back().type, EventType::RunCompleted);
  for (std::size_t i = 1; i < events.size(); ++i) {
    EXPECT_EQ(events[i].sequence, events[i - 1].sequence + 1);
    EXPECT_GE(events[i].progress, events[i - 1].progress);
  }

  auto logs = orchestrator_->logs(finished.id);
  ASSERT_TRUE(logs.has_value());
  EXPECT_FALSE(logs->empty());
  EXPECT_TRUE(std::any_of(logs->begin(), logs->end(), [](const im::engine::LogEntry& entry) {
    return entry.message.find("status=COMPLETED") != std::string::npos;
  }));
}

TEST_F(OrchestratorTest, ExhaustedRetriesFailTheRun) {
  auto finished = run(R"JSON({
    "nodes": [ { "id": "f", "type": "flaky", "config": { "fail_first": 10, "max_retries": 1 } } ]
  })JSON");
  EXPECT_EQ(finished.status, RunStatus::Failed);
  auto failed = task(finished.id, "f");
  EXPECT_EQ(failed.status, TaskStatus::Failed);
  EXPECT_EQ(failed.attempt, 2);
  EXPECT_EQ(calls_->calls("f"), 2);
  EXPECT_NE(finished.error.find("task f failed"), std::string::npos);
}

TEST_F(OrchestratorTest, RunRetryBudgetOverridesTheDefault) {
  im::engine::SubmitOptions options;
  options.max_retries = 1;
  auto finished = run(R"JSON({
    "nodes": [ { "id": "f", "type": "flaky", "config": { "fail_first": 10 } },
               { "id": "once", "type": "flaky", "config": { "fail_first": 10, "max_retries": 0 } } ]
  })JSON",
                      options);
  EXPECT_EQ(finished.status, RunStatus::Failed);
  EXPECT_EQ(task(finished.id, "f").attempt, 2);
  EXPECT_EQ(task(finished.id, "once").attempt, 1);

  options.max_retries = -1;
  auto rejected =
    orchestrator_->submit(im::test::pipeline_from(R"JSON({ "nodes": [ { "id": "a", "type": "const" } ] })JSON"), options);
  ASSERT_FALSE(rejected.has_value());
  EXPECT_EQ(rejected.error().kind, ErrorKind::Validation);
}

TEST_F(OrchestratorTest, RestartsAfterStop) {
  orchestrator_->stop();
  ASSERT_TRUE(orchestrator_->start().has_value());
  auto finished = run(R"JSON({ "nodes": [ { "id": "a", "type": "const" } ] })JSON");
  EXPECT_EQ(finished.status, RunStatus::Completed);
  EXPECT_EQ(orchestrator_->waiting_runs(), 0u);
}

TEST_F(OrchestratorTest, CriticalFailureLetsIndependentBranchFinish) {
  auto finished = run(R"JSON({
    "nodes": [ { "id": "root", "type": "const" },
               { "id": "bad", "type": "broken" }, { "id": "after_bad", "type": "const" },
               { "id": "good", "type": "const" }, { "id": "after_good", "type": "const" } ],
    "connections": [ { "source": "root", "target": "bad", "targetHandle": "in" },
                     { "source": "bad", "target": "after_bad", "targetHandle": "in" },
                     { "source": "root", "target": "good", "targetHandle": "in" },
                     { "source": "good", "target": "after_good", "targetHandle": "in" } ]
  })JSON");
  EXPECT_EQ(finished.status, RunStatus::Failed);
  EXPECT_EQ(task(finished.id, "bad").status, TaskStatus::Failed);
  EXPECT_EQ(task(finished.id, "bad").attempt, 1);
  EXPECT_EQ(task(finished.id, "after_bad").status, TaskStatus::Skipped);
  EXPECT_EQ(task(finished.id, "after_good").status, TaskStatus::Succeeded);
  EXPECT_EQ(calls_->calls("after_bad"), 0);
  EXPECT_EQ(finished.error, "task bad failed: INVALID_PROMPT: invalid prompt");
}

TEST_F(OrchestratorTest, OptionalNodeFailureDoesNotFailTheRun) {
  auto finished = run(R"JSON({
    "nodes": [ { "id": "base", "type": "const", "config": { "value": "img" } },
               { "id": "upscale", "type": "optional-broken" },
               { "id": "out", "type": "sink" } ],
    "connections": [ { "source": "base", "sourceHandle": "value", "target": "upscale", "targetHandle": "in" },
                     { "source": "base", "sourceHandle": "value", "target": "out", "targetHandle": "base" },
                     { "source": "upscale", "sourceHandle": "value", "target": "out", "targetHandle": "upscaled" } ]
  })JSON");
  EXPECT_EQ(finished.status, RunStatus::Completed);
  EXPECT_EQ(task(finished.id, "upscale").status, TaskStatus::Skipped);
  auto out = task(finished.id, "out");
  EXPECT_EQ(out.status, TaskStatus::Succeeded);
  EXPECT_EQ(out.output.at("result").at("base"), "img");
  EXPECT_FALSE(out.output.at("result").contains("upscaled"));
}

TEST_F(OrchestratorTest, CancellationStopsRunningWork) {
  auto run_id = orchestrator_->submit(im::test::pipeline_from(R"JSON({
    "nodes": [ { "id": "slow", "type": "sleep", "config": { "delay_ms": 10000 } }, { "id": "next", "type": "const" } ],
    "connections": [ { "source": "slow", "target": "next", "targetHandle": "in" } ]
  })JSON"));
  ASSERT_TRUE(run_id.has_value());
  ASSERT_TRUE(im::test::wait_for_condition([&]() { return task(*run_id, "slow").status == TaskStatus::Running; },
                                           std::chrono::seconds(5)));

  auto started = std::chrono::steady_clock::now();
  ASSERT_TRUE(orchestrator_->cancel(*run_id).has_value());
  auto finished = orchestrator_->wait_for(*run_id, kWait);
  ASSERT_TRUE(finished.has_value());
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
  EXPECT_EQ(finished->status, RunStatus::Cancelled);
  EXPECT_EQ(finished->cancel_reason, "cancelled by user");
  settle(*run_id);
  EXPECT_EQ(task(*run_id, "slow").status, TaskStatus::Skipped);
  EXPECT_EQ(task(*run_id, "next").status, TaskStatus::Skipped);
  EXPECT_EQ(calls_->calls("next"), 0);
  EXPECT_EQ(count(*run_id, EventType::RunCancelled), 1);

  EXPECT_TRUE(orchestrator_->cancel(*run_id).has_value());
  EXPECT_EQ(count(*run_id, EventType::RunCancelled), 1);
}

TEST_F(OrchestratorTest, RunDeadlineCancelsTheRun) {
  im::engine::SubmitOptions options;
  options.timeout = std::chrono::milliseconds(50);
  auto finished = run(R"JSON({ "nodes": [ { "id": "slow", "type": "sleep", "config": { "delay_ms": 10000 } } ] })JSON",
                      options);
  EXPECT_EQ(finished.status, RunStatus::Cancelled);
  EXPECT_EQ(finished.cancel_reason, "run deadline exceeded");
}

TEST_F(OrchestratorTest, TaskTimeoutIsReportedAsTimeout) {
  auto finished = run(R"JSON({
    "nodes": [ { "id": "slow", "type": "strict-sleep", "config": { "delay_ms": 5000, "timeout_ms": 30 } } ]
  })JSON");
  EXPECT_EQ(finished.status, RunStatus::Failed);
  auto slow = task(finished.id, "slow");
  EXPECT_EQ(slow.error_kind, ErrorKind::Timeout);
  EXPECT_EQ(slow.attempt, 1);
}

TEST_F(OrchestratorTest, InvalidPipelineCreatesNoRun) {
  auto rejected = orchestrator_->submit(im::test::pipeline_from(R"JSON({
    "nodes": [ { "id": "a", "type": "const" }, { "id": "b", "type": "const" } ],
    "connections": [ { "source": "a", "target": "b", "targetHandle": "in" },
                     { "source": "b", "target": "a", "targetHandle": "in" } ]
  })JSON"));
  ASSERT_FALSE(rejected.has_value());
  EXPECT_EQ(rejected.error().kind, ErrorKind::Validation);
  EXPECT_EQ(rejected.error().code, "CYCLIC_GRAPH");
  EXPECT_TRUE(store_->list_eligible_runs(0, im::engine::Clock::now())->empty());
  EXPECT_EQ(orchestrator_->status(1).error().kind, ErrorKind::NotFound);
}

TEST_F(OrchestratorTest, SamplePipelineRunsFromFile) {
  auto path = std::filesystem::temp_directory_path() /
              ("im_pipeline_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + ".json");
  {
    std::ofstream file(path);
    file << R"JSON({
      "id": "poster",
      "nodes": [
        { "id": "brief", "type": "text-input", "config": { "input": "brief" } },
        { "id": "style", "type": "text-transform", "config": { "mode": "prefix", "prefix": "poster: " } },
        { "id": "render", "type": "image-generator", "config": { "cost": 0.25, "fail_first": 1 } },
        { "id": "result", "type": "output" }
      ],
      "connections": [
        { "source": "brief", "sourceHandle": "text", "target": "style", "targetHandle": "text" },
        { "source": "style", "sourceHandle": "text", "target": "render", "targetHandle": "prompt" },
        { "source": "render", "sourceHandle": "image_url", "target": "result", "targetHandle": "image" }
      ]
    })JSON";
  }
  im::engine::SubmitOptions options;
  options.inputs = im::engine::Json{{"brief", "a red fox"}};
  options.user_id = "user-7";
  auto run_id = orchestrator_->submit_file(path.string(), options);
  std::filesystem::remove(path);
  ASSERT_TRUE(run_id.has_value()) << run_id.error().message;

  auto finished = orchestrator_->wait_for(*run_id, kWait);
  ASSERT_TRUE(finished.has_value());
  EXPECT_EQ(finished->status, RunStatus::Completed);
  EXPECT_EQ(finished->pipeline_id, "poster");
  EXPECT_EQ(finished->user_id, "user-7");
  EXPECT_DOUBLE_EQ(finished->total_cost, 0.25);
  EXPECT_EQ(finished->tokens_used, static_cast<std::int64_t>(std::string("poster: a red fox").size()));
  EXPECT_EQ(task(*run_id, "render").output.at("prompt"), "poster: a red fox");
  EXPECT_TRUE(task(*run_id, "result").output.at("result").contains("image"));

  auto view = orchestrator_->status(*run_id);
  ASSERT_TRUE(view.has_value());
  auto json = im::engine::to_json(*view);
  EXPECT_EQ(json.at("tasks").size(), 4u);

  auto missing = orchestrator_->submit_file("/nonexistent/pipeline.json");
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error().kind, ErrorKind::NotFound);
}

TEST_F(OrchestratorTest, PurgeRemovesFinishedRunsButKeepsLogs) {
  auto finished = run(R"JSON({ "nodes": [ { "id": "a", "type": "const" } ] })JSON");
  ASSERT_EQ(finished.status, RunStatus::Completed);
  ASSERT_TRUE(orchestrator_->purge(finished.id).has_value());
  EXPECT_EQ(orchestrator_->status(finished.id).error().kind, ErrorKind::NotFound);
  EXPECT_FALSE(orchestrator_->logs(finished.id)->empty());
}

TEST_F(OrchestratorTest, WaitForTimesOutOnSlowRuns) {
  auto run_id =
    orchestrator_->submit(im::test::pipeline_from(R"JSON({ "nodes": [ { "id": "s", "type": "sleep", "config": { "delay_ms": 2000 } } ] })JSON"));
  ASSERT_TRUE(run_id.has_value());
  auto waited = orchestrator_->wait_for(*run_id, std::chrono::milliseconds(30));
  ASSERT_FALSE(waited.has_value());
  EXPECT_EQ(waited.error().kind, ErrorKind::Timeout);
  ASSERT_TRUE(orchestrator_->cancel(*run_id).has_value());
  EXPECT_TRUE(orchestrator_->wait_for(*run_id, kWait).has_value());
}

TEST(OrchestratorSqlite, RunsAgainstAPersistentStore) {
  auto path = std::filesystem::temp_directory_path() /
              ("im_orchestrator_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + ".db");
  auto config = fast_config();
  config.store_path = path.string();
  {
    auto orchestrator = im::engine::Orchestrator::create(config);
    ASSERT_TRUE(orchestrator.has_value()) << orchestrator.error().message;
    im::test::register_test_nodes((*orchestrator)->registry(), std::make_shared<im::test::CallLog>());
    ASSERT_TRUE((*orchestrator)->start().has_value());
    auto run_id = (*orchestrator)->submit(im::test::pipeline_from(R"JSON({
      "nodes": [ { "id": "a", "type": "const" }, { "id": "b", "type": "flaky", "config": { "fail_first": 1 } } ],
      "connections": [ { "source": "a", "target": "b", "targetHandle": "in" } ]
    })JSON"));
    ASSERT_TRUE(run_id.has_value());
    auto finished = (*orchestrator)->wait_for(*run_id, kWait);
    ASSERT_TRUE(finished.has_value());
    EXPECT_EQ(finished->status, RunStatus::Completed);
    EXPECT_EQ(finished->retry_count, 1);
    (*orchestrator)->stop();
  }
  std::error_code ec;
  std::filesystem::remove(path, ec);
  std::filesystem::remove(path.string() + "-wal", ec);
  std::filesystem::remove(path.string() + "-shm", ec);
}

}  // namespace
