#include "engine/events.hpp"

#include <array>
#include <utility>

#include "common/logging/log.hpp"

namespace im::engine {
namespace {

constexpr std::array<std::pair<EventType, std::string_view>, 10> kEventNames{{
  {EventType::RunQueued, "RunQueued"},
  {EventType::RunStarted, "RunStarted"},
  {EventType::TaskStarted, "TaskStarted"},
  {EventType::TaskCompleted, "TaskCompleted"},
  {EventType::TaskFailed, "TaskFailed"},
  {EventType::TaskRetrying, "TaskRetrying"},
  {EventType::TaskSkipped, "TaskSkipped"},
  {EventType::RunCompleted, "RunCompleted"},
  {EventType::RunFailed, "RunFailed"},
  {EventType::RunCancelled, "RunCancelled"},
}};

}  // namespace

auto to_string(EventType type) -> std::string_view {
  for (const auto& [value, name] : kEventNames) {
    if (value == type) {
      return name;
    }
  }
  return "Unknown";
}

auto to_json(const Event& event) -> Json {
  Json json = {
    {"runId", event.run_id},
    {"sequence", event.sequence},
    {"type", std::string(to_string(event.type))},
    {"progress", event.progress},
    {"timestamp", to_millis(event.at)},
  };
  if (event.task_id) {
    json["taskId"] = *event.task_id;
    json["nodeId"] = event.node_id;
    json["attempt"] = event.attempt;
  }
  if (!event.message.empty()) {
    json["message"] = event.message;
  }
  return json;
}

auto EventPublisher::add_sink(std::shared_ptr<EventSink> sink) -> void {
  if (!sink) {
    return;
  }
  std::unique_lock<std::shared_mutex> lock(mutex_);
  sinks_.push_back(std::move(sink));
}

auto EventPublisher::publish(const Event& event) -> void {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  for (const auto& sink : sinks_) {
    sink->publish(event.run_id, event);
  }
}

auto EventPublisher::publish(const std::vector<Event>& events) -> void {
  for (const auto& event : events) {
    publish(event);
  }
}

auto MemoryEventSink::publish(RunId run_id, const Event& event) -> void {
  std::lock_guard<std::mutex> lock(mutex_);
  events_[run_id].push_back(event);
}

auto MemoryEventSink::events(RunId run_id) const -> std::vector<Event> {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = events_.find(run_id);
  if (it == events_.end()) {
    return {};
  }
  return it->second;
}

auto MemoryEventSink::since(RunId run_id, std::uint64_t sequence) const -> std::vector<Event> {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Event> out;
  auto it = events_.find(run_id);
  if (it == events_.end()) {
    return out;
  }
  for (const auto& event : it->second) {
    if (event.sequence > sequence) {
      out.push_back(event);
    }
  }
  return out;
}

auto MemoryEventSink::clear() -> void {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.clear();
}

auto LoggingEventSink::publish(RunId run_id, const Event& event) -> void {
  if (event.task_id) {
    im::log::debug("event run={} seq={} type={} task={} node={} attempt={} progress={:.2f} {}", run_id,
                   event.sequence, to_string(event.type), *event.task_id, event.node_id, event.attempt,
                   event.progress, event.message);
    return;
  }
  im::log::info("event run={} seq={} type={} progress={:.2f} {}", run_id, event.sequence, to_string(event.type),
                event.progress, event.message);
}

AsyncEventSink::AsyncEventSink(std::shared_ptr<EventSink> inner)
    : inner_(std::move(inner)), thread_([this] { deliver_loop(); }) {}

AsyncEventSink::~AsyncEventSink() { stop(); }

auto AsyncEventSink::publish(RunId, const Event& event) -> void {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) {
      return;
    }
    queue_.push_back(event);
  }
  cv_.notify_one();
}

auto AsyncEventSink::flush() -> void {
  std::unique_lock<std::mutex> lock(mutex_);
  drained_.wait(lock, [&]() { return queue_.empty() && !delivering_; });
}

auto AsyncEventSink::stop() -> void {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) {
      return;
    }
    stopped_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

auto AsyncEventSink::deliver_loop() -> void {
  std::unique_lock<std::mutex> lock(mutex_);
  while (true) {
    cv_.wait(lock, [&]() { return stopped_ || !queue_.empty(); });
    if (queue_.empty()) {
      break;
    }
    auto event = std::move(queue_.front());
    queue_.pop_front();
    delivering_ = true;
    lock.unlock();
    inner_->publish(event.run_id, event);
    lock.lock();
    delivering_ = false;
    if (queue_.empty()) {
      drained_.notify_all();
    }
  }
  drained_.notify_all();
}

}  // namespace im::engine
