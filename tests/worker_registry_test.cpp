#include "batchq/queue/worker_registry.hpp"

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace batchq;
using namespace std::chrono_literals;
using batchq::test::task_id;
using batchq::test::worker_id;

class WorkerRegistryTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(registry_.register_worker(WorkerInfo{
        .id = worker_id("w1"),
        .type = "analysis",
        .last_heartbeat = now_,
        .started_at = now_,
    }));
  }

  WorkerRegistry registry_;
  TimePoint now_{Clock::now()};
};

TEST_F(WorkerRegistryTest, Register_Twice_RefreshesExisting) {
  EXPECT_FALSE(registry_.register_worker(WorkerInfo{
      .id = worker_id("w1"), .type = "fast", .last_heartbeat = now_ + 1s}));

  auto w = registry_.get(worker_id("w1"));
  ASSERT_TRUE(w.has_value());
  EXPECT_EQ(w->type, "fast");
  EXPECT_EQ(w->last_heartbeat, now_ + 1s);
  EXPECT_EQ(registry_.size(), 1u);
}

TEST_F(WorkerRegistryTest, BusyThenIdle_CountsProcessed) {
  EXPECT_TRUE(registry_.mark_busy(worker_id("w1"), task_id("t1"), now_));

  auto busy = registry_.get(worker_id("w1"));
  ASSERT_TRUE(busy.has_value());
  EXPECT_EQ(busy->status, WorkerStatus::Busy);
  EXPECT_EQ(busy->current_task_id, task_id("t1"));

  EXPECT_TRUE(registry_.mark_idle(worker_id("w1"), true, now_));
  EXPECT_TRUE(registry_.mark_busy(worker_id("w1"), task_id("t2"), now_));
  EXPECT_TRUE(registry_.mark_idle(worker_id("w1"), false, now_));

  auto idle = registry_.get(worker_id("w1"));
  ASSERT_TRUE(idle.has_value());
  EXPECT_EQ(idle->status, WorkerStatus::Idle);
  EXPECT_FALSE(idle->current_task_id.has_value());
  EXPECT_EQ(idle->tasks_processed, 1);
}

TEST_F(WorkerRegistryTest, UnknownWorker_OperationsFail) {
  EXPECT_FALSE(registry_.heartbeat(worker_id("ghost"), std::nullopt, now_));
  EXPECT_FALSE(registry_.mark_busy(worker_id("ghost"), task_id("t"), now_));
  EXPECT_FALSE(registry_.mark_idle(worker_id("ghost"), true, now_));
  EXPECT_FALSE(registry_.unregister_worker(worker_id("ghost")));
  EXPECT_FALSE(registry_.get(worker_id("ghost")).has_value());
}

TEST_F(WorkerRegistryTest, Stale_ReportsMissedHeartbeats) {
  registry_.register_worker(WorkerInfo{.id = worker_id("w2"),
                                       .type = "analysis",
                                       .last_heartbeat = now_ + 10s});

  auto stale = registry_.stale(now_ + 12s, 5s);

  ASSERT_EQ(stale.size(), 1u);
  EXPECT_EQ(stale[0].id, worker_id("w1"));

  registry_.heartbeat(worker_id("w1"), std::nullopt, now_ + 11s);
  EXPECT_TRUE(registry_.stale(now_ + 12s, 5s).empty());
}

TEST_F(WorkerRegistryTest, Unregister_RemovesFromList) {
  EXPECT_TRUE(registry_.unregister_worker(worker_id("w1")));
  EXPECT_TRUE(registry_.list().empty());
}
