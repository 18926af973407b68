#include "engine/retry.hpp"

#include <algorithm>
#include <memory>
#include <mutex>
#include <random>

namespace im::engine {
namespace {

auto default_jitter() -> RetryPolicy::JitterSource {
  struct State {
    std::mutex mutex;
    std::mt19937_64 rng{std::random_device{}()};
    std::uniform_real_distribution<double> dist{-1.0, 1.0};
  };
  auto state = std::make_shared<State>();
  return [state]() {
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->dist(state->rng);
  };
}

auto exponential(std::chrono::milliseconds base, int attempt, std::chrono::milliseconds cap) -> std::int64_t {
  const std::int64_t base_ms = base.count();
  const std::int64_t cap_ms = cap.count();
  std::int64_t value = base_ms;
  for (int i = 0; i < attempt; ++i) {
    if (value >= cap_ms) {
      return cap_ms;
    }
    value *= 2;
  }
  return std::min(value, cap_ms);
}

}  // namespace

RetryPolicy::RetryPolicy(RetryPolicyConfig config) : RetryPolicy(config, default_jitter()) {}

RetryPolicy::RetryPolicy(RetryPolicyConfig config, JitterSource jitter)
    : config_(config), jitter_(std::move(jitter)) {
  if (config_.base.count() < 0) {
    config_.base = std::chrono::milliseconds(0);
  }
  if (config_.max_delay < config_.base) {
    config_.max_delay = config_.base;
  }
}

auto RetryPolicy::backoff(int attempt) const -> std::chrono::milliseconds {
  attempt = std::max(attempt, 0);
  // Cap far enough above max_delay that jitter cannot pull a capped value below it.
  const auto scaled = exponential(config_.base, attempt, config_.max_delay + config_.base);
  double factor = jitter_ ? std::clamp(jitter_(), -1.0, 1.0) : 0.0;
  auto jitter = static_cast<std::int64_t>(factor * static_cast<double>(config_.base.count()));
  auto delay = std::clamp<std::int64_t>(scaled + jitter, 0, config_.max_delay.count());
  return std::chrono::milliseconds(delay);
}

auto RetryPolicy::decide(int attempt, int max_retries, ErrorKind classification, bool retryable) const
  -> RetryDecision {
  switch (classification) {
    case ErrorKind::TransientTask:
      break;
    case ErrorKind::Timeout:
      if (!retryable) {
        return GiveUp{};
      }
      break;
    default:
      return GiveUp{};
  }
  if (attempt > max_retries) {
    return GiveUp{};
  }
  return RetryAfter{backoff(attempt)};
}

auto RetryPolicy::decide(int attempt, ErrorKind classification) const -> RetryDecision {
  return decide(attempt, config_.max_retries, classification);
}

auto store_backoff(int attempt, std::chrono::milliseconds base, std::chrono::milliseconds cap)
  -> std::chrono::milliseconds {
  return std::chrono::milliseconds(exponential(base, std::max(attempt, 0), cap));
}

}  // namespace im::engine
