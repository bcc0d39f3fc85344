#include "batchq/storage/persistence.hpp"

#include <chrono>
#include <cstring>
#include <filesystem>
#include <memory>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace batchq;
using namespace std::chrono_literals;
using batchq::test::batch_id;
using batchq::test::task_id;
using batchq::test::worker_id;

class PersistenceTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(db_path_.valid()) << "Failed to create temp file: "
                                  << std::strerror(errno);
    persistence_ = std::make_unique<Persistence>(db_path_.str());
  }

  void TearDown() override {
    persistence_.reset();
  }

  batchq::test::TempDbPath db_path_;
  std::unique_ptr<Persistence> persistence_;
};

class OpenPersistenceTest : public PersistenceTest {
protected:
  void SetUp() override {
    PersistenceTest::SetUp();
    ASSERT_TRUE(persistence_->open().has_value());
  }

  void TearDown() override {
    persistence_->close();
    PersistenceTest::TearDown();
  }

  auto make_task(std::string_view id, TaskStatus status = TaskStatus::Queued)
      -> Task {
    Task t;
    t.id = task_id(id);
    t.user_id = "alice";
    t.symbol = "AAPL";
    t.status = status;
    t.created_at = from_unix_ms(1'700'000'000'000);
    t.enqueued_at = t.created_at;
    return t;
  }
};

TEST_F(PersistenceTest, InitialState_IsNotOpen) {
  EXPECT_FALSE(persistence_->is_open());
}

TEST_F(PersistenceTest, Open_Succeeds) {
  auto result = persistence_->open();

  EXPECT_TRUE(result.has_value());
  EXPECT_TRUE(persistence_->is_open());
}

TEST_F(PersistenceTest, DoubleOpen_IsIdempotent) {
  ASSERT_TRUE(persistence_->open().has_value());

  EXPECT_TRUE(persistence_->open().has_value());
}

TEST_F(PersistenceTest, Open_UnwritableDirectory_Fails) {
  Persistence bad("/nonexistent-dir/batchq/test.db");

  auto result = bad.open();

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::DatabaseOpenFailed));
  EXPECT_FALSE(bad.is_open());
}

TEST_F(PersistenceTest, OperationsOnClosedDb_Fail) {
  Task t;
  t.id = task_id("t1");

  EXPECT_FALSE(persistence_->save_task(t).has_value());
  EXPECT_FALSE(persistence_->load_task(task_id("t1")).has_value());
}

TEST_F(OpenPersistenceTest, SaveAndLoadTask_RoundTripsAllFields) {
  auto t = make_task("t1", TaskStatus::Completed);
  t.parameters = {{"depth", 3}, {"lang", "en"}};
  t.priority = Priority::Urgent;
  t.batch_id = batch_id("b1");
  t.started_at = t.created_at + 1s;
  t.completed_at = t.created_at + 5s;
  t.requeued_at = t.created_at + 2s;
  t.retry_count = 2;
  t.lease_timeout = 30s;
  t.result = nlohmann::json{{"decision", "buy"}};

  ASSERT_TRUE(persistence_->save_task(t).has_value());
  auto loaded = persistence_->load_task(task_id("t1"));

  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->user_id, "alice");
  EXPECT_EQ(loaded->symbol, "AAPL");
  EXPECT_EQ(loaded->parameters["depth"], 3);
  EXPECT_EQ(loaded->priority, Priority::Urgent);
  EXPECT_EQ(loaded->status, TaskStatus::Completed);
  EXPECT_EQ(loaded->batch_id, batch_id("b1"));
  EXPECT_FALSE(loaded->worker_id.has_value());
  EXPECT_EQ(loaded->created_at, t.created_at);
  EXPECT_EQ(loaded->started_at, t.started_at);
  EXPECT_EQ(loaded->completed_at, t.completed_at);
  EXPECT_FALSE(loaded->cancelled_at.has_value());
  EXPECT_EQ(loaded->requeued_at, t.requeued_at);
  EXPECT_EQ(loaded->retry_count, 2);
  EXPECT_EQ(loaded->lease_timeout, 30s);
  ASSERT_TRUE(loaded->result.has_value());
  EXPECT_EQ((*loaded->result)["decision"], "buy");
  EXPECT_FALSE(loaded->error.has_value());
}

TEST_F(OpenPersistenceTest, SaveTask_UpsertUpdatesState) {
  auto t = make_task("t1");
  ASSERT_TRUE(persistence_->save_task(t).has_value());

  t.status = TaskStatus::Processing;
  t.worker_id = worker_id("w1");
  t.started_at = t.created_at + 1s;
  ASSERT_TRUE(persistence_->save_task(t).has_value());

  auto loaded = persistence_->load_task(task_id("t1"));
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->status, TaskStatus::Processing);
  EXPECT_EQ(loaded->worker_id, worker_id("w1"));

  auto all = persistence_->query_tasks({});
  ASSERT_TRUE(all.has_value());
  EXPECT_EQ(all->size(), 1u);
}

TEST_F(OpenPersistenceTest, LoadTask_Missing_NotFound) {
  auto loaded = persistence_->load_task(task_id("nope"));

  ASSERT_FALSE(loaded.has_value());
  EXPECT_EQ(loaded.error(), make_error_code(Error::NotFound));
}

TEST_F(OpenPersistenceTest, QueryTasks_FiltersAndLimits) {
  auto a = make_task("a", TaskStatus::Queued);
  auto b = make_task("b", TaskStatus::Processing);
  b.enqueued_at += 1s;
  auto c = make_task("c", TaskStatus::Completed);
  c.user_id = "bob";
  c.enqueued_at += 2s;
  auto d = make_task("d", TaskStatus::Queued);
  d.batch_id = batch_id("b1");
  d.enqueued_at += 3s;
  for (const auto& t : {a, b, c, d}) {
    ASSERT_TRUE(persistence_->save_task(t).has_value());
  }

  auto unfinished = persistence_->query_tasks(
      TaskFilter{.statuses = {TaskStatus::Queued, TaskStatus::Processing}});
  ASSERT_TRUE(unfinished.has_value());
  ASSERT_EQ(unfinished->size(), 3u);
  EXPECT_EQ((*unfinished)[0].id, task_id("a"));
  EXPECT_EQ((*unfinished)[1].id, task_id("b"));
  EXPECT_EQ((*unfinished)[2].id, task_id("d"));

  auto bobs = persistence_->query_tasks(TaskFilter{.user_id = "bob"});
  ASSERT_TRUE(bobs.has_value());
  ASSERT_EQ(bobs->size(), 1u);
  EXPECT_EQ(bobs->front().id, task_id("c"));

  auto members =
      persistence_->query_tasks(TaskFilter{.batch_id = batch_id("b1")});
  ASSERT_TRUE(members.has_value());
  ASSERT_EQ(members->size(), 1u);
  EXPECT_EQ(members->front().id, task_id("d"));

  auto limited = persistence_->query_tasks(TaskFilter{.limit = 2});
  ASSERT_TRUE(limited.has_value());
  EXPECT_EQ(limited->size(), 2u);
}

TEST_F(OpenPersistenceTest, SaveAndLoadBatch) {
  Batch b;
  b.id = batch_id("b1");
  b.user_id = "alice";
  b.task_ids = {task_id("t1"), task_id("t2"), task_id("t3")};
  b.total_tasks = 3;
  b.completed_tasks = 1;
  b.failed_tasks = 1;
  b.status = BatchStatus::Processing;
  b.priority = Priority::High;
  b.created_at = from_unix_ms(1'700'000'000'000);
  b.started_at = b.created_at + 1s;

  ASSERT_TRUE(persistence_->save_batch(b).has_value());
  b.completed_tasks = 2;
  b.status = BatchStatus::Failed;
  b.finished_at = b.created_at + 9s;
  ASSERT_TRUE(persistence_->save_batch(b).has_value());

  auto loaded = persistence_->load_batch(batch_id("b1"));
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->task_ids, b.task_ids);
  EXPECT_EQ(loaded->total_tasks, 3);
  EXPECT_EQ(loaded->completed_tasks, 2);
  EXPECT_EQ(loaded->failed_tasks, 1);
  EXPECT_EQ(loaded->status, BatchStatus::Failed);
  EXPECT_EQ(loaded->priority, Priority::High);
  EXPECT_EQ(loaded->started_at, b.started_at);
  EXPECT_EQ(loaded->finished_at, b.finished_at);

  auto failed = persistence_->query_batches(
      BatchFilter{.statuses = {BatchStatus::Failed}});
  ASSERT_TRUE(failed.has_value());
  EXPECT_EQ(failed->size(), 1u);
  auto pending = persistence_->query_batches(
      BatchFilter{.statuses = {BatchStatus::Pending}});
  ASSERT_TRUE(pending.has_value());
  EXPECT_TRUE(pending->empty());
}

TEST_F(OpenPersistenceTest, PurgeFinishedBefore_RemovesOldTerminalRows) {
  auto now = Clock::now();
  auto old_done = make_task("old_done", TaskStatus::Completed);
  old_done.completed_at = now - 10 * 24h;
  auto old_cancelled = make_task("old_cancelled", TaskStatus::Cancelled);
  old_cancelled.cancelled_at = now - 10 * 24h;
  auto fresh = make_task("fresh", TaskStatus::Failed);
  fresh.completed_at = now;
  auto queued = make_task("queued");
  for (const auto& t : {old_done, old_cancelled, fresh, queued}) {
    ASSERT_TRUE(persistence_->save_task(t).has_value());
  }

  Batch old_batch;
  old_batch.id = batch_id("old");
  old_batch.user_id = "alice";
  old_batch.total_tasks = 1;
  old_batch.status = BatchStatus::Completed;
  old_batch.finished_at = now - 10 * 24h;
  ASSERT_TRUE(persistence_->save_batch(old_batch).has_value());

  auto removed = persistence_->purge_finished_before(now - 7 * 24h);

  ASSERT_TRUE(removed.has_value());
  EXPECT_EQ(*removed, 2u);
  EXPECT_FALSE(persistence_->load_task(task_id("old_done")).has_value());
  EXPECT_TRUE(persistence_->load_task(task_id("fresh")).has_value());
  EXPECT_TRUE(persistence_->load_task(task_id("queued")).has_value());
  EXPECT_FALSE(persistence_->load_batch(batch_id("old")).has_value());
}

TEST_F(OpenPersistenceTest, Transaction_RollbackDiscardsWrites) {
  ASSERT_TRUE(persistence_->begin_transaction().has_value());
  ASSERT_TRUE(persistence_->save_task(make_task("t1")).has_value());
  ASSERT_TRUE(persistence_->rollback_transaction().has_value());

  EXPECT_FALSE(persistence_->load_task(task_id("t1")).has_value());

  ASSERT_TRUE(persistence_->begin_transaction().has_value());
  ASSERT_TRUE(persistence_->save_task(make_task("t2")).has_value());
  ASSERT_TRUE(persistence_->commit_transaction().has_value());

  EXPECT_TRUE(persistence_->load_task(task_id("t2")).has_value());
}

TEST_F(PersistenceTest, DataSurvivesReopen) {
  ASSERT_TRUE(persistence_->open().has_value());
  Task t;
  t.id = task_id("t1");
  t.user_id = "alice";
  t.symbol = "MSFT";
  ASSERT_TRUE(persistence_->save_task(t).has_value());
  persistence_->close();

  Persistence reopened(db_path_.str());
  ASSERT_TRUE(reopened.open().has_value());
  auto loaded = reopened.load_task(task_id("t1"));
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->symbol, "MSFT");
}
