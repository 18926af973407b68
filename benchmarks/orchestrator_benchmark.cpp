#include <benchmark/benchmark.h>

#include <string>
#include <vector>

#include <spdlog/fmt/fmt.h>

#include "engine/memory_store.hpp"
#include "engine/plan.hpp"
#include "engine/state_machine.hpp"
#include "nodes/sample_nodes.hpp"

namespace {

/// A chain of `width` parallel transform branches between one input and one output.
auto make_fan_pipeline(int width) -> im::engine::PipelineDefinition {
  im::engine::PipelineDefinition pipeline;
  pipeline.id = "fan";
  pipeline.nodes.push_back({"in", "text-input", "", im::engine::Json{{"text", "hello"}}});
  pipeline.nodes.push_back({"out", "output", "", im::engine::Json::object()});
  for (int i = 0; i < width; ++i) {
    auto id = fmt::format("t{}", i);
    pipeline.nodes.push_back({id, "text-transform", "", im::engine::Json{{"mode", "uppercase"}}});
    pipeline.connections.push_back({"", "in", "text", id, "text"});
    pipeline.connections.push_back({"", id, "text", "out", id});
  }
  return pipeline;
}

auto sample_registry() -> const im::engine::NodeRegistry& {
  static const im::engine::NodeRegistry registry = [] {
    im::engine::NodeRegistry r;
    im::nodes::register_sample_nodes(r);
    return r;
  }();
  return registry;
}

}  // namespace

static void BM_CompilePlan(benchmark::State& state) {
  auto pipeline = make_fan_pipeline(static_cast<int>(state.range(0)));
  const auto& registry = sample_registry();
  for (auto _ : state) {
    auto plan = im::engine::compile_plan(pipeline, registry);
    if (!plan) {
      state.SkipWithError(plan.error().message.c_str());
      break;
    }
    benchmark::DoNotOptimize(plan->tasks.size());
  }
  state.SetItemsProcessed(state.iterations() * (state.range(0) + 2));
}
BENCHMARK(BM_CompilePlan)->Arg(8)->Arg(64)->Arg(512);

/// Claim and settle every task of a freshly created run against the in-memory store.
static void BM_MemoryStoreRunLifecycle(benchmark::State& state) {
  auto pipeline = make_fan_pipeline(static_cast<int>(state.range(0)));
  auto plan = im::engine::compile_plan(pipeline, sample_registry());
  if (!plan) {
    state.SkipWithError(plan.error().message.c_str());
    return;
  }
  im::engine::MemoryExecutionStore store;
  std::int64_t transitions = 0;

  for (auto _ : state) {
    auto run = store.create_run(im::engine::RunRequest{}, *plan);
    if (!run) {
      state.SkipWithError(run.error().message.c_str());
      break;
    }
    bool progressed = true;
    while (progressed) {
      progressed = false;
      auto tasks = store.load_tasks(run->id);
      for (const auto& task : *tasks) {
        if (task.status != im::engine::TaskStatus::Ready) {
          continue;
        }
        auto claimed = store.update_task_status(task.id, im::engine::TaskTransition::claim());
        if (!claimed) {
          continue;
        }
        auto done = store.update_task_status(
          task.id, im::engine::TaskTransition::succeed(task.attempt + 1, im::engine::Json{{"text", "HELLO"}}));
        benchmark::DoNotOptimize(done);
        transitions += 2;
        progressed = true;
      }
    }
    if (auto purged = store.purge_run(run->id); !purged) {
      state.SkipWithError(purged.error().message.c_str());
      break;
    }
  }
  state.SetItemsProcessed(transitions);
}
BENCHMARK(BM_MemoryStoreRunLifecycle)->Arg(8)->Arg(64);

BENCHMARK_MAIN();
