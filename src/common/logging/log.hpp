#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

#include <spdlog/spdlog.h>

namespace im::log {

using spdlog::critical;
using spdlog::debug;
using spdlog::error;
using spdlog::info;
using spdlog::trace;
using spdlog::warn;

/// Installs the async process logger configured by the --log_* flags.
/// Later calls are no-ops until shutdown().
void init();

/// Flushes pending lines and drops the logger.
void shutdown();

/// Writes `event` followed by `key=value` pairs in key order.
void info(std::string_view event, std::unordered_map<std::string, std::string> fields);

}  // namespace im::log
