#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <variant>

#include "engine/error.hpp"

namespace im::engine {

struct RetryAfter {
  std::chrono::milliseconds delay{0};
};

struct GiveUp {};

using RetryDecision = std::variant<RetryAfter, GiveUp>;

struct RetryPolicyConfig {
  std::chrono::milliseconds base{1000};
  std::chrono::milliseconds max_delay{std::chrono::minutes(1)};
  int max_retries = 3;
};

/// Exponential backoff with jitter: `base * 2^attempt ± random(0, base)`, capped at
/// max_delay. `attempt` counts the attempts already made, so the first retry is decided
/// with attempt == 1. For attempt >= 1 the jitter bands of consecutive attempts do not
/// overlap, which keeps delays non-decreasing.
class RetryPolicy {
 public:
  /// Returns a value in [-1, 1] scaling the jitter.
  using JitterSource = std::function<double()>;

  explicit RetryPolicy(RetryPolicyConfig config = {});
  RetryPolicy(RetryPolicyConfig config, JitterSource jitter);

  auto decide(int attempt, int max_retries, ErrorKind classification, bool retryable = true) const
    -> RetryDecision;
  auto decide(int attempt, ErrorKind classification) const -> RetryDecision;

  /// Delay for a retry after `attempt` attempts, jitter included.
  auto backoff(int attempt) const -> std::chrono::milliseconds;

  auto config() const -> const RetryPolicyConfig& { return config_; }

 private:
  RetryPolicyConfig config_;
  JitterSource jitter_;
};

/// Backoff used for store conflicts and outages (no jitter source, no retry limit).
auto store_backoff(int attempt, std::chrono::milliseconds base = std::chrono::milliseconds(5),
                   std::chrono::milliseconds cap = std::chrono::milliseconds(1000)) -> std::chrono::milliseconds;

}  // namespace im::engine
