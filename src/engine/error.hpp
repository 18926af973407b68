#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <tl/expected.hpp>

namespace im::engine {

enum class ErrorKind {
  Validation,
  ClaimConflict,
  TransientTask,
  PermanentTask,
  Timeout,
  StoreUnavailable,
  NotFound,
  InvalidTransition,
};

struct EngineError {
  ErrorKind kind = ErrorKind::PermanentTask;
  std::string message;
  /// Machine-readable code (e.g. CYCLIC_GRAPH, RATE_LIMIT).
  std::string code;
  /// Node ids or other identifiers the error refers to.
  std::vector<std::string> subjects;
};

template <typename T>
using Expected = tl::expected<T, EngineError>;

inline auto make_error(ErrorKind kind, std::string message, std::string code = {}) -> EngineError {
  return EngineError{kind, std::move(message), std::move(code), {}};
}

inline auto make_validation_error(std::string code, std::string message,
                                  std::vector<std::string> subjects = {}) -> EngineError {
  return EngineError{ErrorKind::Validation, std::move(message), std::move(code), std::move(subjects)};
}

/// Errors the store reports for contention or outages; callers retry these with backoff.
inline auto is_retryable_store_error(const EngineError& error) -> bool {
  return error.kind == ErrorKind::ClaimConflict || error.kind == ErrorKind::StoreUnavailable;
}

auto to_string(ErrorKind kind) -> std::string_view;

}  // namespace im::engine
