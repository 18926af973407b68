#include <chrono>
#include <exception>
#include <iostream>
#include <memory>

#include <gflags/gflags.h>
#include <spdlog/fmt/fmt.h>

#include "common/logging/log.hpp"
#include "engine/events.hpp"
#include "nodes/sample_nodes.hpp"
#include "runtime/orchestrator.hpp"

DEFINE_string(pipeline, "", "Path to a pipeline definition JSON file");
DEFINE_string(inputs, "{}", "Run inputs as a JSON object");
DEFINE_int32(priority, 0, "Run priority; higher runs are dispatched first");
DEFINE_int32(run_timeout_ms, 0, "Cancel the run when it has not finished after this long (0 = none)");
DEFINE_int32(wait_ms, 60000, "How long to wait for the run to finish");

int main(int argc, char** argv) {
  gflags::SetUsageMessage("im_run_pipeline --pipeline=<file.json> [--inputs='{...}']");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  if (FLAGS_pipeline.empty()) {
    std::cerr << "--pipeline is required\n";
    return 2;
  }

  im::engine::SubmitOptions options;
  options.priority = FLAGS_priority;
  try {
    options.inputs = im::engine::Json::parse(FLAGS_inputs);
  } catch (const std::exception& ex) {
    std::cerr << "Failed to parse --inputs: " << ex.what() << "\n";
    return 2;
  }
  if (FLAGS_run_timeout_ms > 0) {
    options.timeout = std::chrono::milliseconds(FLAGS_run_timeout_ms);
  }

  auto orchestrator = im::engine::Orchestrator::create(im::engine::OrchestratorConfig::from_flags());
  if (!orchestrator) {
    std::cerr << "Failed to open store: " << orchestrator.error().message << "\n";
    return 1;
  }
  auto& engine = **orchestrator;
  im::nodes::register_sample_nodes(engine.registry());
  auto events = std::make_shared<im::engine::MemoryEventSink>();
  engine.events().add_sink(events);

  if (auto started = engine.start(); !started) {
    std::cerr << "Failed to start: " << started.error().message << "\n";
    return 1;
  }

  auto run_id = engine.submit_file(FLAGS_pipeline, options);
  if (!run_id) {
    const auto& error = run_id.error();
    std::cerr << fmt::format("Rejected ({}): {}\n", error.code, error.message);
    for (const auto& subject : error.subjects) {
      std::cerr << "  - " << subject << "\n";
    }
    return 1;
  }
  std::cout << fmt::format("submitted run {}\n", *run_id);

  auto finished = engine.wait_for(*run_id, std::chrono::milliseconds(FLAGS_wait_ms));
  if (!finished) {
    std::cerr << finished.error().message << "\n";
    engine.stop();
    return 1;
  }

  std::cout << "\nevents:\n";
  for (const auto& event : events->events(*run_id)) {
    std::cout << "  " << im::engine::to_json(event).dump() << "\n";
  }

  std::cout << "\nlogs:\n";
  if (auto logs = engine.logs(*run_id); logs) {
    for (const auto& entry : *logs) {
      std::cout << fmt::format("  [{}] task={} attempt={} {}: {}\n", im::engine::to_string(entry.level),
                               entry.task_id ? fmt::format("{}", *entry.task_id) : std::string("-"), entry.attempt,
                               entry.category, entry.message);
    }
  }

  if (auto view = engine.status(*run_id); view) {
    std::cout << "\nstatus:\n" << im::engine::to_json(*view).dump(2) << "\n";
  }

  engine.stop();
  im::log::shutdown();
  return finished->status == im::engine::RunStatus::Completed ? 0 : 3;
}
