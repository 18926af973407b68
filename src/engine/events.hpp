#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>

#include "engine/types.hpp"

namespace im::engine {

enum class EventType {
  RunQueued,
  RunStarted,
  TaskStarted,
  TaskCompleted,
  TaskFailed,
  TaskRetrying,
  TaskSkipped,
  RunCompleted,
  RunFailed,
  RunCancelled,
};

auto to_string(EventType type) -> std::string_view;

/// Lifecycle notification. `sequence` is per run, strictly increasing, and assigned in
/// the same store transaction as the state change it reports.
struct Event {
  RunId run_id = 0;
  std::uint64_t sequence = 0;
  EventType type = EventType::RunQueued;
  std::optional<TaskId> task_id;
  std::string node_id;
  int attempt = 0;
  double progress = 0.0;
  std::string message;
  TimePoint at{};
};

auto to_json(const Event& event) -> Json;

class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual auto publish(RunId run_id, const Event& event) -> void = 0;
};

/// Fan-out to registered sinks, in registration order.
class EventPublisher {
 public:
  auto add_sink(std::shared_ptr<EventSink> sink) -> void;
  auto publish(const Event& event) -> void;
  auto publish(const std::vector<Event>& events) -> void;

 private:
  mutable std::shared_mutex mutex_;
  std::vector<std::shared_ptr<EventSink>> sinks_;
};

/// Keeps every event per run; subscribers that lost their connection resync with since().
class MemoryEventSink final : public EventSink {
 public:
  auto publish(RunId run_id, const Event& event) -> void override;

  auto events(RunId run_id) const -> std::vector<Event>;
  /// Events with a sequence strictly greater than `sequence`.
  auto since(RunId run_id, std::uint64_t sequence) const -> std::vector<Event>;
  auto clear() -> void;

 private:
  mutable std::mutex mutex_;
  std::unordered_map<RunId, std::vector<Event>> events_;
};

/// Writes events to the process logger.
class LoggingEventSink final : public EventSink {
 public:
  auto publish(RunId run_id, const Event& event) -> void override;
};

/// Queues events and delivers them to the wrapped sink on its own thread, so a slow
/// subscriber never stalls a worker.
class AsyncEventSink final : public EventSink {
 public:
  explicit AsyncEventSink(std::shared_ptr<EventSink> inner);
  ~AsyncEventSink() override;

  AsyncEventSink(const AsyncEventSink&) = delete;
  auto operator=(const AsyncEventSink&) -> AsyncEventSink& = delete;

  auto publish(RunId run_id, const Event& event) -> void override;
  /// Block until every queued event has been delivered.
  auto flush() -> void;
  auto stop() -> void;

 private:
  auto deliver_loop() -> void;

  std::shared_ptr<EventSink> inner_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::condition_variable drained_;
  std::deque<Event> queue_;
  bool delivering_ = false;
  bool stopped_ = false;
  std::thread thread_;
};

}  // namespace im::engine
