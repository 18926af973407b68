#include "runtime/dispatcher.hpp"

#include <mutex>
#include <vector>

#include <gtest/gtest.h>

#include "engine/memory_store.hpp"
#include "test_support.hpp"

namespace {

using im::engine::DispatcherHealth;
using im::engine::RunStatus;
using im::engine::TaskStatus;

constexpr const char* kSingle = R"JSON({ "nodes": [ { "id": "only", "type": "record" } ] })JSON";

/// Cycles are driven by hand; the timed loop is never started.
class DispatcherTest : public ::testing::Test {
 protected:
  void SetUp() override {
    im::test::register_test_nodes(registry_, std::make_shared<im::test::CallLog>());
    im::engine::NodeTypeInfo record;
    record.type = "record";
    record.open_inputs = true;
    registry_.register_fn(record, [this](const im::engine::NodeInvocation& invocation,
                                         const im::engine::CancellationToken&) -> im::engine::Expected<im::engine::NodeResult> {
      std::lock_guard<std::mutex> lock(order_mutex_);
      order_.push_back(invocation.run_id);
      return im::engine::NodeResult{};
    });
    make(1);
  }

  void TearDown() override { pool_->stop(); }

  auto make(int concurrency, std::size_t admission_batch = 16) -> void {
    if (pool_) {
      pool_->stop();
    }
    dispatcher_.reset();
    pool_.reset();
    supervisor_ = std::make_unique<im::engine::RunSupervisor>(store_, registry_, events_);
    im::engine::ExecutorConfig executor_config;
    executor_config.workers = concurrency;
    pool_ = std::make_unique<im::engine::TaskExecutorPool>(
      executor_config, store_, registry_, *supervisor_,
      im::engine::RetryPolicy({std::chrono::milliseconds(1), std::chrono::milliseconds(2), 3}));
    im::engine::DispatcherConfig config;
    config.max_concurrent_tasks = concurrency;
    config.admission_batch = admission_batch;
    dispatcher_ = std::make_unique<im::engine::Dispatcher>(config, store_, *pool_, *supervisor_);
    pool_->start();
  }

  auto submit(const char* text, im::engine::RunRequest request = {}) -> im::engine::RunId {
    auto run = supervisor_->submit(im::test::pipeline_from(text), request);
    EXPECT_TRUE(run.has_value()) << (run ? "" : run.error().message);
    return run ? run->id : 0;
  }

  /// Run cycles until nothing is left to dispatch.
  auto drain() -> void {
    for (int i = 0; i < 200; ++i) {
      auto report = dispatcher_->run_cycle();
      pool_->wait_idle();
      if (report.dispatched == 0 && report.requeued == 0 && store_.list_eligible_runs(0, im::engine::Clock::now())->empty()) {
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    ADD_FAILURE() << "dispatcher did not drain";
  }

  im::engine::NodeRegistry registry_;
  im::engine::MemoryExecutionStore store_;
  im::engine::EventPublisher events_;
  std::unique_ptr<im::engine::RunSupervisor> supervisor_;
  std::unique_ptr<im::engine::TaskExecutorPool> pool_;
  std::unique_ptr<im::engine::Dispatcher> dispatcher_;
  std::mutex order_mutex_;
  std::vector<im::engine::RunId> order_;
};

TEST_F(DispatcherTest, DispatchesByPriorityThenSubmissionOrder) {
  std::vector<im::engine::RunId> ids;
  for (int priority : {10, 5, 10, 1, 5}) {
    im::engine::RunRequest request;
    request.priority = priority;
    ids.push_back(submit(kSingle, request));
  }
  drain();
  EXPECT_EQ(order_, (std::vector<im::engine::RunId>{ids[0], ids[2], ids[1], ids[4], ids[3]}));
  for (auto id : ids) {
    EXPECT_EQ(store_.load_run(id)->status, RunStatus::Completed);
  }
}

TEST_F(DispatcherTest, RespectsTheConcurrencyLimit) {
  make(2);
  for (int i = 0; i < 4; ++i) {
    submit(R"JSON({ "nodes": [ { "id": "slow", "type": "sleep", "config": { "delay_ms": 200 } } ] })JSON");
  }
  auto report = dispatcher_->run_cycle();
  EXPECT_EQ(report.dispatched, 2);
  EXPECT_EQ(dispatcher_->run_cycle().dispatched, 0);
  EXPECT_LE(pool_->in_flight(), 2);
  drain();
}

TEST_F(DispatcherTest, LowerPriorityRunsTakeCapacityLeftIdle) {
  make(1, 1);
  im::engine::RunRequest urgent;
  urgent.priority = 10;
  auto backing_off = submit(kSingle, urgent);
  auto task_id = store_.load_tasks(backing_off)->front().id;
  ASSERT_TRUE(store_.update_task_status(task_id, im::engine::TaskTransition::claim()).has_value());
  ASSERT_TRUE(store_
                .update_task_status(task_id, im::engine::TaskTransition::schedule_retry(
                                               1, im::engine::Clock::now() + std::chrono::hours(1), "RATE_LIMIT: slow down",
                                               im::engine::ErrorKind::TransientTask))
                .has_value());
  auto waiting = submit(kSingle);

  auto report = dispatcher_->run_cycle();
  pool_->wait_idle();
  EXPECT_EQ(report.dispatched, 1);
  EXPECT_EQ(order_, (std::vector<im::engine::RunId>{waiting}));
  EXPECT_EQ(store_.load_run(waiting)->status, RunStatus::Completed);
  EXPECT_EQ(store_.load_tasks(backing_off)->front().status, TaskStatus::Retrying);
}

TEST_F(DispatcherTest, RequeuesDueRetries) {
  auto run_id = submit(R"JSON({ "nodes": [ { "id": "f", "type": "flaky", "config": { "fail_first": 2 } } ] })JSON");
  drain();
  auto run = store_.load_run(run_id);
  EXPECT_EQ(run->status, RunStatus::Completed);
  EXPECT_EQ(run->retry_count, 2);
  EXPECT_EQ(store_.load_tasks(run_id)->front().attempt, 3);
}

TEST_F(DispatcherTest, HoldsScheduledRunsUntilDue) {
  im::engine::RunRequest request;
  request.scheduled_for = im::engine::Clock::now() + std::chrono::hours(1);
  auto run_id = submit(kSingle, request);
  EXPECT_EQ(dispatcher_->run_cycle().dispatched, 0);
  EXPECT_EQ(store_.load_run(run_id)->status, RunStatus::Queued);
}

TEST_F(DispatcherTest, CancelsRunsPastTheirDeadline) {
  im::engine::RunRequest request;
  request.deadline = im::engine::Clock::now() - std::chrono::milliseconds(1);
  auto run_id = submit(kSingle, request);
  auto report = dispatcher_->run_cycle();
  EXPECT_EQ(report.deadlines_enforced, 1);
  EXPECT_EQ(report.dispatched, 0);
  auto run = store_.load_run(run_id);
  EXPECT_EQ(run->status, RunStatus::Cancelled);
  EXPECT_EQ(run->cancel_reason, "run deadline exceeded");
}

TEST_F(DispatcherTest, DegradesWhileTheStoreIsUnavailable) {
  auto run_id = submit(kSingle);
  store_.set_available(false);
  auto report = dispatcher_->run_cycle();
  EXPECT_EQ(report.health, DispatcherHealth::Degraded);
  EXPECT_EQ(dispatcher_->health(), DispatcherHealth::Degraded);
  EXPECT_EQ(report.dispatched, 0);

  store_.set_available(true);
  drain();
  EXPECT_EQ(dispatcher_->health(), DispatcherHealth::Healthy);
  EXPECT_EQ(store_.load_run(run_id)->status, RunStatus::Completed);
}

TEST_F(DispatcherTest, TimedLoopDrivesRunsWithoutManualCycles) {
  im::engine::DispatcherConfig config;
  config.max_concurrent_tasks = 1;
  config.poll_interval = std::chrono::milliseconds(5);
  dispatcher_ = std::make_unique<im::engine::Dispatcher>(config, store_, *pool_, *supervisor_);
  pool_->set_on_settled([this]() { dispatcher_->wake(); });
  dispatcher_->start();

  auto run_id = submit(R"JSON({
    "nodes": [ { "id": "a", "type": "const" }, { "id": "b", "type": "record" } ],
    "connections": [ { "source": "a", "target": "b", "targetHandle": "x" } ]
  })JSON");
  EXPECT_TRUE(im::test::wait_for_condition(
    [&]() { return store_.load_run(run_id)->status == RunStatus::Completed; }, std::chrono::seconds(5)));
  dispatcher_->stop();
  pool_->set_on_settled({});
}

}  // namespace
