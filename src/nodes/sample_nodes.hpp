#pragma once

#include "engine/registry.hpp"

namespace im::nodes {

/// Registers the built-in node types used by the example CLI, tests and benchmarks:
/// `text-input`, `text-transform`, `image-generator` (a mock AI call) and `output`.
auto register_sample_nodes(im::engine::NodeRegistry& registry) -> void;

}  // namespace im::nodes
