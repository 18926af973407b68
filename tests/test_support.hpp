#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include <gtest/gtest.h>

#include "engine/error.hpp"
#include "engine/node.hpp"
#include "engine/pipeline.hpp"
#include "engine/registry.hpp"
#include "engine/types.hpp"

namespace im::test {

using im::engine::CancellationToken;
using im::engine::Expected;
using im::engine::Json;
using im::engine::NodeInvocation;
using im::engine::NodeResult;
using im::engine::NodeTypeInfo;

/// Wait until predicate returns true or the timeout expires.
inline auto wait_for_condition(const std::function<bool()>& predicate, std::chrono::milliseconds timeout) -> bool {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return predicate();
}

/// Parse a pipeline literal, failing the current test on malformed input.
inline auto pipeline_from(const char* text) -> im::engine::PipelineDefinition {
  auto pipeline = im::engine::parse_pipeline_text(text);
  EXPECT_TRUE(pipeline.has_value()) << (pipeline ? std::string() : pipeline.error().message);
  return pipeline ? *pipeline : im::engine::PipelineDefinition{};
}

/// Counts node invocations per node id across attempts.
class CallLog {
 public:
  auto record(const std::string& node_id) -> int {
    std::lock_guard<std::mutex> lock(mutex_);
    return ++calls_[node_id];
  }

  auto calls(const std::string& node_id) const -> int {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = calls_.find(node_id);
    return it == calls_.end() ? 0 : it->second;
  }

 private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, int> calls_;
};

inline auto config_int(const NodeInvocation& invocation, const char* key, std::int64_t fallback) -> std::int64_t {
  if (!invocation.config || !invocation.config->contains(key)) {
    return fallback;
  }
  return invocation.config->at(key).get<std::int64_t>();
}

/// Scripted node types for orchestration tests:
///  - `const`: emits `{"value": config.value}`
///  - `flaky`: fails transiently for the first `config.fail_first` attempts
///  - `broken`: always fails permanently
///  - `optional-broken`: optional type that always fails permanently
///  - `sleep`: waits `config.delay_ms` while honouring cancellation and the deadline
///  - `strict-sleep`: like `sleep` but its timeouts are not retried
///  - `sink`: collects every input into `result`
inline auto register_test_nodes(im::engine::NodeRegistry& registry, std::shared_ptr<CallLog> calls) -> void {
  auto value_of = [](const NodeInvocation& invocation) {
    return invocation.config && invocation.config->contains("value") ? invocation.config->at("value") : Json(1);
  };

  NodeTypeInfo const_info;
  const_info.type = "const";
  const_info.inputs = {"in"};
  const_info.open_inputs = true;
  const_info.outputs = {"value"};
  registry.register_fn(const_info, [calls, value_of](const NodeInvocation& invocation,
                                                     const CancellationToken&) -> Expected<NodeResult> {
    calls->record(invocation.node_id);
    NodeResult result;
    result.outputs["value"] = value_of(invocation);
    result.cost = 0.5;
    result.tokens_used = 10;
    return result;
  });

  NodeTypeInfo flaky_info = const_info;
  flaky_info.type = "flaky";
  registry.register_fn(flaky_info, [calls, value_of](const NodeInvocation& invocation,
                                                     const CancellationToken&) -> Expected<NodeResult> {
    calls->record(invocation.node_id);
    if (invocation.attempt <= config_int(invocation, "fail_first", 0)) {
      return tl::unexpected(im::engine::transient_error("rate limited", "RATE_LIMIT"));
    }
    NodeResult result;
    result.outputs["value"] = value_of(invocation);
    return result;
  });

  NodeTypeInfo broken_info = const_info;
  broken_info.type = "broken";
  registry.register_fn(broken_info, [calls](const NodeInvocation& invocation,
                                            const CancellationToken&) -> Expected<NodeResult> {
    calls->record(invocation.node_id);
    return tl::unexpected(im::engine::permanent_error("invalid prompt", "INVALID_PROMPT"));
  });

  NodeTypeInfo optional_info = broken_info;
  optional_info.type = "optional-broken";
  optional_info.optional = true;
  registry.register_fn(optional_info, [calls](const NodeInvocation& invocation,
                                              const CancellationToken&) -> Expected<NodeResult> {
    calls->record(invocation.node_id);
    return tl::unexpected(im::engine::permanent_error("enhancement unavailable", "UNAVAILABLE"));
  });

  auto sleeper = [calls, value_of](const NodeInvocation& invocation,
                                   const CancellationToken& token) -> Expected<NodeResult> {
    calls->record(invocation.node_id);
    auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(config_int(invocation, "delay_ms", 0));
    while (std::chrono::steady_clock::now() < until) {
      if (token.should_stop()) {
        return tl::unexpected(im::engine::transient_error("interrupted", "INTERRUPTED"));
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    NodeResult result;
    result.outputs["value"] = value_of(invocation);
    return result;
  };

  NodeTypeInfo sleep_info = const_info;
  sleep_info.type = "sleep";
  registry.register_fn(sleep_info, sleeper);

  NodeTypeInfo strict_info = const_info;
  strict_info.type = "strict-sleep";
  strict_info.retryable = false;
  registry.register_fn(strict_info, sleeper);

  NodeTypeInfo sink_info;
  sink_info.type = "sink";
  sink_info.open_inputs = true;
  sink_info.outputs = {"result"};
  registry.register_fn(sink_info, [calls](const NodeInvocation& invocation,
                                          const CancellationToken&) -> Expected<NodeResult> {
    calls->record(invocation.node_id);
    NodeResult result;
    result.outputs["result"] = invocation.inputs;
    return result;
  });
}

}  // namespace im::test
