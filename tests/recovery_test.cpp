#include "batchq/scheduler/scheduler.hpp"
#include "batchq/storage/persistence.hpp"
#include "batchq/storage/recovery.hpp"

#include <memory>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace batchq;
using namespace std::chrono_literals;
using batchq::test::batch_id;
using batchq::test::queue_config;
using batchq::test::task_id;
using batchq::test::worker_id;

class RecoveryTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(db_path_.valid());
    db_ = std::make_unique<Persistence>(db_path_.str());
    ASSERT_TRUE(db_->open().has_value());
  }

  auto make_task(std::string_view id, TaskStatus status,
                 std::optional<BatchId> batch = std::nullopt) -> Task {
    Task t;
    t.id = task_id(id);
    t.user_id = "alice";
    t.symbol = std::string{id};
    t.status = status;
    t.batch_id = std::move(batch);
    t.created_at = Clock::now() - 1h;
    t.enqueued_at = t.created_at + std::chrono::seconds(seq_++);
    if (status == TaskStatus::Processing) {
      t.worker_id = worker_id("crashed");
      t.started_at = Clock::now() - 1min;
    }
    if (is_terminal(status)) {
      t.completed_at = Clock::now() - 30min;
    }
    return t;
  }

  batchq::test::TempDbPath db_path_;
  std::unique_ptr<Persistence> db_;
  int seq_{0};
};

TEST_F(RecoveryTest, EmptyDatabase_NothingRestored) {
  Scheduler scheduler(queue_config());

  auto result = Recovery(*db_).recover(scheduler);

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->tasks_restored, 0u);
  EXPECT_EQ(result->batches_restored, 0u);
  EXPECT_EQ(scheduler.get_queue_stats().total, 0u);
}

TEST_F(RecoveryTest, RestoresUnfinishedWorkAndRequeuesOrphans) {
  Batch batch;
  batch.id = batch_id("b1");
  batch.user_id = "alice";
  batch.task_ids = {task_id("m1"), task_id("m2"), task_id("m3")};
  batch.total_tasks = 3;
  batch.completed_tasks = 1;
  batch.status = BatchStatus::Processing;
  batch.created_at = Clock::now() - 1h;
  ASSERT_TRUE(db_->save_batch(batch).has_value());

  ASSERT_TRUE(db_->save_task(make_task("m1", TaskStatus::Completed, batch.id))
                  .has_value());
  ASSERT_TRUE(db_->save_task(make_task("m2", TaskStatus::Processing, batch.id))
                  .has_value());
  ASSERT_TRUE(
      db_->save_task(make_task("m3", TaskStatus::Queued, batch.id)).has_value());
  ASSERT_TRUE(db_->save_task(make_task("solo", TaskStatus::Queued)).has_value());

  Scheduler scheduler(queue_config());
  auto result = Recovery(*db_).recover(scheduler);

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->batches_restored, 1u);
  EXPECT_EQ(result->tasks_restored, 3u);
  EXPECT_EQ(result->tasks_orphaned, 1u);
  EXPECT_EQ(result->tasks_queued, 3u);

  auto orphan = scheduler.get_task(task_id("m2"));
  ASSERT_TRUE(orphan.has_value());
  EXPECT_EQ(orphan->status, TaskStatus::Queued);
  EXPECT_EQ(orphan->retry_count, 1);
  EXPECT_FALSE(orphan->worker_id.has_value());
  EXPECT_FALSE(scheduler.get_task(task_id("m1")).has_value());

  while (auto t = scheduler.dequeue(worker_id("w"))) {
    ASSERT_TRUE(scheduler.ack(t->id, worker_id("w"), true));
  }

  auto restored = scheduler.get_batch_status(batch_id("b1"));
  ASSERT_TRUE(restored.has_value());
  EXPECT_EQ(restored->status, BatchStatus::Completed);
  EXPECT_EQ(restored->completed_tasks, 3);
}

TEST_F(RecoveryTest, TerminalBatchesAreNotReloaded) {
  Batch done;
  done.id = batch_id("done");
  done.user_id = "alice";
  done.total_tasks = 1;
  done.completed_tasks = 1;
  done.status = BatchStatus::Completed;
  done.finished_at = Clock::now();
  ASSERT_TRUE(db_->save_batch(done).has_value());

  Scheduler scheduler(queue_config());
  auto result = Recovery(*db_).recover(scheduler);

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->batches_restored, 0u);
  EXPECT_FALSE(scheduler.get_batch_status(batch_id("done")).has_value());
}

TEST_F(RecoveryTest, ClosedRepository_ReportsError) {
  db_->close();
  Scheduler scheduler(queue_config());

  auto result = Recovery(*db_).recover(scheduler);

  EXPECT_FALSE(result.has_value());
}

TEST(RecoveryMaxRetriesTest, OrphanOverRetryBudget_FailsAndSettlesBatch) {
  batchq::test::TempDbPath path;
  ASSERT_TRUE(path.valid());
  Persistence db(path.str());
  ASSERT_TRUE(db.open().has_value());

  Batch batch;
  batch.id = batch_id("b1");
  batch.user_id = "alice";
  batch.task_ids = {task_id("t1")};
  batch.total_tasks = 1;
  batch.status = BatchStatus::Processing;
  ASSERT_TRUE(db.save_batch(batch).has_value());

  Task t;
  t.id = task_id("t1");
  t.user_id = "alice";
  t.symbol = "AAPL";
  t.status = TaskStatus::Processing;
  t.batch_id = batch.id;
  t.worker_id = worker_id("crashed");
  t.retry_count = 2;
  ASSERT_TRUE(db.save_task(t).has_value());

  auto config = queue_config();
  config.max_retries = 2;
  Scheduler scheduler(config);
  auto result = Recovery(db).recover(scheduler);

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->tasks_queued, 0u);
  auto task = scheduler.get_task(task_id("t1"));
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->status, TaskStatus::Failed);
  auto restored = scheduler.get_batch_status(batch_id("b1"));
  ASSERT_TRUE(restored.has_value());
  EXPECT_EQ(restored->status, BatchStatus::Failed);
}
