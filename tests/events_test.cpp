#include "engine/events.hpp"

#include <atomic>
#include <chrono>
#include <thread>

#include <gtest/gtest.h>

namespace {

using im::engine::Event;
using im::engine::EventType;

auto make_event(im::engine::RunId run_id, std::uint64_t sequence, EventType type) -> Event {
  Event event;
  event.run_id = run_id;
  event.sequence = sequence;
  event.type = type;
  event.at = im::engine::from_millis(1700000000000);
  return event;
}

/// Records the order deliveries arrive in, optionally slowly.
class RecordingSink final : public im::engine::EventSink {
 public:
  explicit RecordingSink(std::chrono::milliseconds delay = {}) : delay_(delay) {}

  auto publish(im::engine::RunId, const Event& event) -> void override {
    if (delay_.count() > 0) {
      std::this_thread::sleep_for(delay_);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    sequences_.push_back(event.sequence);
  }

  auto sequences() -> std::vector<std::uint64_t> {
    std::lock_guard<std::mutex> lock(mutex_);
    return sequences_;
  }

 private:
  std::chrono::milliseconds delay_;
  std::mutex mutex_;
  std::vector<std::uint64_t> sequences_;
};

TEST(Events, SerializesToCamelCaseJson) {
  auto event = make_event(3, 4, EventType::TaskRetrying);
  event.task_id = 11;
  event.node_id = "render";
  event.attempt = 2;
  event.progress = 0.5;
  event.message = "rate limited";

  auto json = im::engine::to_json(event);
  EXPECT_EQ(json.at("runId"), 3);
  EXPECT_EQ(json.at("sequence"), 4);
  EXPECT_EQ(json.at("type"), "TaskRetrying");
  EXPECT_EQ(json.at("taskId"), 11);
  EXPECT_EQ(json.at("nodeId"), "render");
  EXPECT_EQ(json.at("attempt"), 2);
  EXPECT_EQ(json.at("message"), "rate limited");
  EXPECT_EQ(json.at("timestamp"), 1700000000000);

  auto run_event = im::engine::to_json(make_event(3, 1, EventType::RunQueued));
  EXPECT_FALSE(run_event.contains("taskId"));
  EXPECT_FALSE(run_event.contains("message"));
}

TEST(Events, MemorySinkReplaysSinceSequence) {
  auto sink = std::make_shared<im::engine::MemoryEventSink>();
  im::engine::EventPublisher publisher;
  publisher.add_sink(sink);
  publisher.publish(std::vector<Event>{make_event(1, 1, EventType::RunQueued), make_event(1, 2, EventType::RunStarted),
                                       make_event(2, 1, EventType::RunQueued),
                                       make_event(1, 3, EventType::TaskStarted)});

  EXPECT_EQ(sink->events(1).size(), 3u);
  EXPECT_EQ(sink->events(2).size(), 1u);
  EXPECT_TRUE(sink->events(9).empty());

  auto missed = sink->since(1, 1);
  ASSERT_EQ(missed.size(), 2u);
  EXPECT_EQ(missed[0].sequence, 2u);
  EXPECT_EQ(missed[1].type, EventType::TaskStarted);

  sink->clear();
  EXPECT_TRUE(sink->events(1).empty());
}

TEST(Events, PublisherFansOutToEverySinkInOrder) {
  auto first = std::make_shared<RecordingSink>();
  auto second = std::make_shared<RecordingSink>();
  im::engine::EventPublisher publisher;
  publisher.add_sink(first);
  publisher.add_sink(nullptr);
  publisher.add_sink(second);
  for (std::uint64_t sequence = 1; sequence <= 5; ++sequence) {
    publisher.publish(make_event(1, sequence, EventType::TaskCompleted));
  }
  std::vector<std::uint64_t> expected{1, 2, 3, 4, 5};
  EXPECT_EQ(first->sequences(), expected);
  EXPECT_EQ(second->sequences(), expected);
}

TEST(Events, AsyncSinkDecouplesSlowSubscribers) {
  auto slow = std::make_shared<RecordingSink>(std::chrono::milliseconds(20));
  im::engine::AsyncEventSink async(slow);

  auto started = std::chrono::steady_clock::now();
  for (std::uint64_t sequence = 1; sequence <= 10; ++sequence) {
    async.publish(1, make_event(1, sequence, EventType::TaskCompleted));
  }
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(150));

  async.flush();
  EXPECT_EQ(slow->sequences(), (std::vector<std::uint64_t>{1, 2, 3, 4, 5, 6, 7, 8, 9, 10}));
  async.stop();
  async.publish(1, make_event(1, 11, EventType::RunCompleted));
  EXPECT_EQ(slow->sequences().size(), 10u);
}

}  // namespace
