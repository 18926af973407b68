#include "nodes/sample_nodes.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>
#include <utility>

#include <spdlog/fmt/fmt.h>

#include "engine/error.hpp"
#include "engine/types.hpp"

namespace im::nodes {
namespace {

using im::engine::CancellationToken;
using im::engine::Expected;
using im::engine::Json;
using im::engine::LogLevel;
using im::engine::NodeInvocation;
using im::engine::NodeResult;
using im::engine::NodeTypeInfo;

auto get_int_param(const Json* params, const char* key, std::int64_t fallback) -> std::int64_t {
  if (!params || !params->is_object()) {
    return fallback;
  }
  auto it = params->find(key);
  if (it != params->end() && it->is_number_integer()) {
    return it->get<std::int64_t>();
  }
  return fallback;
}

auto get_double_param(const Json* params, const char* key, double fallback) -> double {
  if (!params || !params->is_object()) {
    return fallback;
  }
  auto it = params->find(key);
  if (it != params->end() && it->is_number()) {
    return it->get<double>();
  }
  return fallback;
}

auto get_bool_param(const Json* params, const char* key, bool fallback) -> bool {
  if (!params || !params->is_object()) {
    return fallback;
  }
  auto it = params->find(key);
  if (it != params->end() && it->is_boolean()) {
    return it->get<bool>();
  }
  return fallback;
}

auto get_string_param(const Json* params, const char* key, std::string fallback) -> std::string {
  if (!params || !params->is_object()) {
    return fallback;
  }
  auto it = params->find(key);
  if (it != params->end() && it->is_string()) {
    return it->get<std::string>();
  }
  return fallback;
}

auto text_of(const Json& value) -> std::string {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (value.is_object() && value.contains("text") && value.at("text").is_string()) {
    return value.at("text").get<std::string>();
  }
  return value.is_null() ? std::string{} : value.dump(-1, ' ', false, Json::error_handler_t::replace);
}

/// Sleeps in short slices so cancellation and the task deadline are honoured.
auto cooperative_sleep(std::chrono::milliseconds total, const CancellationToken& token) -> bool {
  const auto until = std::chrono::steady_clock::now() + total;
  while (std::chrono::steady_clock::now() < until) {
    if (token.should_stop()) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return !token.should_stop();
}

auto text_input(const NodeInvocation& invocation, const CancellationToken&) -> Expected<NodeResult> {
  std::string key = get_string_param(invocation.config, "input", "text");
  std::string text = get_string_param(invocation.config, "text", "");
  if (text.empty() && invocation.run_inputs && invocation.run_inputs->contains(key)) {
    text = text_of(invocation.run_inputs->at(key));
  }
  if (text.empty()) {
    return tl::unexpected(im::engine::permanent_error(
      fmt::format("node {} has no text: set config.text or run input '{}'", invocation.node_id, key), "MISSING_INPUT"));
  }
  NodeResult result;
  result.outputs["text"] = std::move(text);
  return result;
}

auto text_transform(const NodeInvocation& invocation, const CancellationToken&) -> Expected<NodeResult> {
  if (!invocation.inputs.contains("text")) {
    return tl::unexpected(
      im::engine::permanent_error(fmt::format("node {} received no text", invocation.node_id), "MISSING_INPUT"));
  }
  std::string text = text_of(invocation.inputs.at("text"));
  std::string mode = get_string_param(invocation.config, "mode", "uppercase");
  if (mode == "uppercase") {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::toupper(c); });
  } else if (mode == "lowercase") {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::tolower(c); });
  } else if (mode == "prefix") {
    text = get_string_param(invocation.config, "prefix", "") + text;
  } else {
    return tl::unexpected(
      im::engine::permanent_error(fmt::format("unknown text-transform mode: {}", mode), "INVALID_CONFIG"));
  }
  NodeResult result;
  result.outputs["text"] = std::move(text);
  return result;
}

/// Mock of a paid image generation call. Config knobs: `cost`, `delay_ms`,
/// `fail_first` (attempts failing with a transient error), `fail_permanently`.
auto image_generator(const NodeInvocation& invocation, const CancellationToken& token) -> Expected<NodeResult> {
  const auto* config = invocation.config;
  std::string prompt = invocation.inputs.contains("prompt") ? text_of(invocation.inputs.at("prompt"))
                                                            : get_string_param(config, "prompt", "");
  if (prompt.empty()) {
    return tl::unexpected(
      im::engine::permanent_error(fmt::format("node {} received no prompt", invocation.node_id), "MISSING_INPUT"));
  }

  if (auto delay = get_int_param(config, "delay_ms", 0); delay > 0) {
    if (!cooperative_sleep(std::chrono::milliseconds(delay), token)) {
      return tl::unexpected(im::engine::transient_error("image generation interrupted", "INTERRUPTED"));
    }
  }

  if (get_bool_param(config, "fail_permanently", false)) {
    if (invocation.log) {
      invocation.log(LogLevel::Error, "provider rejected the prompt");
    }
    return tl::unexpected(im::engine::permanent_error("content policy violation", "CONTENT_POLICY"));
  }
  if (invocation.attempt <= get_int_param(config, "fail_first", 0)) {
    if (invocation.log) {
      invocation.log(LogLevel::Warn, fmt::format("provider rate limited attempt {}", invocation.attempt));
    }
    return tl::unexpected(im::engine::transient_error("provider rate limit exceeded", "RATE_LIMIT"));
  }

  NodeResult result;
  result.cost = get_double_param(config, "cost", 0.04);
  result.tokens_used = static_cast<std::int64_t>(prompt.size());
  result.outputs["image_url"] =
    fmt::format("mock://images/{}/{}-{}.png", invocation.run_id, invocation.node_id, invocation.attempt);
  result.outputs["prompt"] = prompt;
  if (invocation.log) {
    invocation.log(LogLevel::Info, fmt::format("generated image for prompt of {} chars", prompt.size()));
  }
  return result;
}

auto output(const NodeInvocation& invocation, const CancellationToken&) -> Expected<NodeResult> {
  NodeResult result;
  result.outputs["result"] = invocation.inputs;
  return result;
}

}  // namespace

auto register_sample_nodes(im::engine::NodeRegistry& registry) -> void {
  NodeTypeInfo input_info;
  input_info.type = "text-input";
  input_info.outputs = {"text"};
  registry.register_fn(std::move(input_info), &text_input);

  NodeTypeInfo transform_info;
  transform_info.type = "text-transform";
  transform_info.inputs = {"text"};
  transform_info.outputs = {"text"};
  registry.register_fn(std::move(transform_info), &text_transform);

  NodeTypeInfo image_info;
  image_info.type = "image-generator";
  image_info.inputs = {"prompt"};
  image_info.outputs = {"image_url", "prompt"};
  image_info.timeout = std::chrono::seconds(60);
  registry.register_fn(std::move(image_info), &image_generator);

  NodeTypeInfo output_info;
  output_info.type = "output";
  output_info.open_inputs = true;
  output_info.outputs = {"result"};
  registry.register_fn(std::move(output_info), &output);
}

}  // namespace im::nodes
