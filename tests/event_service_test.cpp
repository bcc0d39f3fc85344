#include "batchq/app/services/event_service.hpp"
#include "batchq/scheduler/scheduler.hpp"

#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace batchq;
using batchq::test::request;
using batchq::test::queue_config;
using batchq::test::worker_id;

TEST(EventServiceTest, TaskEventJson) {
  Task task;
  task.id = batchq::test::task_id("t-1");
  task.user_id = "alice";
  task.symbol = "AAPL";
  task.status = TaskStatus::Failed;
  task.retry_count = 2;
  task.worker_id = worker_id("w1");
  task.error = "boom";

  auto j = EventService::to_json(
      SchedulerEvent::for_task(EventKind::TaskFailed, task, from_unix_ms(1234)));

  EXPECT_EQ(j["type"], "task_failed");
  EXPECT_EQ(j["task_id"], "t-1");
  EXPECT_EQ(j["user_id"], "alice");
  EXPECT_EQ(j["symbol"], "AAPL");
  EXPECT_EQ(j["status"], "failed");
  EXPECT_EQ(j["retry_count"], 2);
  EXPECT_EQ(j["worker_id"], "w1");
  EXPECT_EQ(j["error"], "boom");
  EXPECT_EQ(j["timestamp"], 1234);
  EXPECT_FALSE(j.contains("batch_id"));
}

TEST(EventServiceTest, BatchEventJson) {
  Batch batch;
  batch.id = batchq::test::batch_id("b-1");
  batch.user_id = "bob";
  batch.status = BatchStatus::Completed;
  batch.total_tasks = 4;
  batch.completed_tasks = 3;
  batch.failed_tasks = 1;

  auto j = EventService::to_json(
      SchedulerEvent::for_batch(EventKind::BatchFinished, batch, Clock::now()));

  EXPECT_EQ(j["type"], "batch_finished");
  EXPECT_EQ(j["batch_id"], "b-1");
  EXPECT_EQ(j["status"], "completed");
  EXPECT_EQ(j["progress"], 100);
  EXPECT_FALSE(j.contains("task_id"));
  EXPECT_FALSE(j.contains("worker_id"));
}

TEST(EventServiceTest, ForwardsSchedulerEventsToSink) {
  EventService events;
  std::vector<std::string> lines;
  events.set_sink([&](std::string_view line) { lines.emplace_back(line); });

  Scheduler scheduler(queue_config());
  scheduler.set_event_listener(
      [&](const SchedulerEvent& e) { events.on_event(e); });

  auto id = scheduler.enqueue(request("alice", "AAPL"));
  ASSERT_TRUE(id.has_value());
  auto task = scheduler.dequeue(worker_id("w1"));
  ASSERT_TRUE(task.has_value());
  ASSERT_TRUE(
      scheduler.ack(*id, worker_id("w1"), true, {{"decision", "buy"}}));

  EXPECT_EQ(events.count(EventKind::TaskQueued), 1u);
  EXPECT_EQ(events.count(EventKind::TaskStarted), 1u);
  EXPECT_EQ(events.count(EventKind::TaskCompleted), 1u);
  EXPECT_EQ(events.count(EventKind::TaskFailed), 0u);

  ASSERT_EQ(lines.size(), 3u);
  auto last = nlohmann::json::parse(lines.back());
  EXPECT_EQ(last["type"], "task_completed");
  EXPECT_EQ(last["task_id"], id->str());
  for (std::size_t i = 0; i < lines.size(); ++i) {
    EXPECT_EQ(nlohmann::json::parse(lines[i])["seq"], i + 1);
  }
}

TEST(EventServiceTest, CountsWithoutSink) {
  EventService events;
  Batch batch;
  batch.id = batchq::test::batch_id("b-1");

  events.on_event(
      SchedulerEvent::for_batch(EventKind::BatchCreated, batch, Clock::now()));
  events.on_event(
      SchedulerEvent::for_batch(EventKind::BatchCreated, batch, Clock::now()));

  EXPECT_EQ(events.count(EventKind::BatchCreated), 2u);
  EXPECT_EQ(events.count(EventKind::BatchFinished), 0u);
}
