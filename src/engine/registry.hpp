#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "engine/node.hpp"

namespace im::engine {

/// Static description of a node type: its handles and failure policy.
struct NodeTypeInfo {
  std::string type;
  std::vector<std::string> inputs;
  std::vector<std::string> outputs;
  /// Accept any input handle name (e.g. fan-in collectors).
  bool open_inputs = false;
  /// Accept any output handle name.
  bool open_outputs = false;
  /// Failures of optional types are non-critical and never fail the run.
  bool optional = false;
  /// When false, a timeout is final instead of being retried.
  bool retryable = true;
  /// Zero means the orchestrator-wide default.
  std::chrono::milliseconds timeout{0};
  std::optional<int> max_retries;

  auto accepts_input(std::string_view handle) const -> bool;
  auto provides_output(std::string_view handle) const -> bool;
};

namespace detail {

template <typename Fn>
class FunctionNodeExecutor final : public NodeExecutor {
 public:
  explicit FunctionNodeExecutor(Fn fn) : fn_(std::move(fn)) {}

  auto execute(const NodeInvocation& invocation, const CancellationToken& token) -> Expected<NodeResult> override {
    return fn_(invocation, token);
  }

 private:
  Fn fn_;
};

}  // namespace detail

class NodeRegistry {
 public:
  struct Entry {
    NodeTypeInfo info;
    std::shared_ptr<NodeExecutor> executor;
  };

  auto register_type(NodeTypeInfo info, std::shared_ptr<NodeExecutor> executor) -> void;

  template <typename Fn>
    requires std::is_invocable_r_v<Expected<NodeResult>, Fn&, const NodeInvocation&, const CancellationToken&>
  auto register_fn(NodeTypeInfo info, Fn fn) -> void {
    register_type(std::move(info), std::make_shared<detail::FunctionNodeExecutor<Fn>>(std::move(fn)));
  }

  auto find(std::string_view type) const -> const Entry*;
  auto types() const -> std::vector<std::string>;

 private:
  std::unordered_map<std::string, Entry> entries_;
};

}  // namespace im::engine
