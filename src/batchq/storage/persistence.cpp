#include "batchq/storage/persistence.hpp"

#include "batchq/queue/state_strings.hpp"
#include "batchq/util/log.hpp"
#include "batchq/util/util.hpp"

#include <nlohmann/json.hpp>
#include <sqlite3.h>

#include <algorithm>
#include <format>
#include <iterator>
#include <utility>

namespace batchq {

namespace {

constexpr auto kTaskColumns = R"(
  id, user_id, symbol, parameters, priority, status, batch_id, worker_id,
  created_at, enqueued_at, started_at, completed_at, cancelled_at,
  requeued_at, retry_count, lease_timeout_sec, result, error
)";

constexpr auto kBatchColumns = R"(
  id, user_id, task_ids, total_tasks, completed_tasks, failed_tasks,
  cancelled_tasks, status, priority, created_at, started_at, finished_at
)";

// Helper to safely get text from sqlite column
auto col_text(sqlite3_stmt* stmt, int col) -> std::string {
  auto* p = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
  return p ? p : "";
}

auto col_opt_text(sqlite3_stmt* stmt, int col) -> std::optional<std::string> {
  if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
    return std::nullopt;
  }
  return col_text(stmt, col);
}

auto col_time(sqlite3_stmt* stmt, int col) -> TimePoint {
  return from_unix_ms(sqlite3_column_int64(stmt, col));
}

auto col_opt_time(sqlite3_stmt* stmt, int col) -> std::optional<TimePoint> {
  if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
    return std::nullopt;
  }
  return col_time(stmt, col);
}

auto col_json(sqlite3_stmt* stmt, int col) -> std::optional<nlohmann::json> {
  if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
    return std::nullopt;
  }
  auto parsed = nlohmann::json::parse(col_text(stmt, col), nullptr, false);
  if (parsed.is_discarded()) {
    log::warn("Discarding malformed JSON in column {}", col);
    return std::nullopt;
  }
  return parsed;
}

auto bind_text(sqlite3_stmt* stmt, int idx, std::string_view text) -> void {
  sqlite3_bind_text(stmt, idx, text.data(), static_cast<int>(text.size()),
                    SQLITE_TRANSIENT);
}

template <typename T>
auto bind_opt_text(sqlite3_stmt* stmt, int idx, const std::optional<T>& v)
    -> void {
  if (v) {
    bind_text(stmt, idx, std::string_view(*v));
  } else {
    sqlite3_bind_null(stmt, idx);
  }
}

auto bind_time(sqlite3_stmt* stmt, int idx, TimePoint tp) -> void {
  sqlite3_bind_int64(stmt, idx, to_unix_ms(tp));
}

auto bind_opt_time(sqlite3_stmt* stmt, int idx,
                   const std::optional<TimePoint>& tp) -> void {
  if (tp) {
    bind_time(stmt, idx, *tp);
  } else {
    sqlite3_bind_null(stmt, idx);
  }
}

auto read_task(sqlite3_stmt* stmt) -> Task {
  Task task;
  task.id = TaskId{col_text(stmt, 0)};
  task.user_id = col_text(stmt, 1);
  task.symbol = col_text(stmt, 2);
  task.parameters = col_json(stmt, 3).value_or(Parameters::object());
  task.priority = static_cast<Priority>(
      std::clamp(sqlite3_column_int(stmt, 4), 0,
                 static_cast<int>(kPriorityLevels) - 1));
  task.status =
      parse_task_status(col_text(stmt, 5)).value_or(TaskStatus::Queued);
  if (auto batch = col_opt_text(stmt, 6)) {
    task.batch_id = BatchId{std::move(*batch)};
  }
  if (auto worker = col_opt_text(stmt, 7)) {
    task.worker_id = WorkerId{std::move(*worker)};
  }
  task.created_at = col_time(stmt, 8);
  task.enqueued_at = col_time(stmt, 9);
  task.started_at = col_opt_time(stmt, 10);
  task.completed_at = col_opt_time(stmt, 11);
  task.cancelled_at = col_opt_time(stmt, 12);
  task.requeued_at = col_opt_time(stmt, 13);
  task.retry_count = sqlite3_column_int(stmt, 14);
  if (sqlite3_column_type(stmt, 15) != SQLITE_NULL) {
    task.lease_timeout = std::chrono::seconds(sqlite3_column_int64(stmt, 15));
  }
  task.result = col_json(stmt, 16);
  task.error = col_opt_text(stmt, 17);
  return task;
}

auto read_batch(sqlite3_stmt* stmt) -> Batch {
  Batch batch;
  batch.id = BatchId{col_text(stmt, 0)};
  batch.user_id = col_text(stmt, 1);
  if (auto ids = col_json(stmt, 2); ids && ids->is_array()) {
    for (const auto& id : *ids) {
      if (id.is_string()) {
        batch.task_ids.emplace_back(id.get<std::string>());
      }
    }
  }
  batch.total_tasks = sqlite3_column_int(stmt, 3);
  batch.completed_tasks = sqlite3_column_int(stmt, 4);
  batch.failed_tasks = sqlite3_column_int(stmt, 5);
  batch.cancelled_tasks = sqlite3_column_int(stmt, 6);
  batch.status =
      parse_batch_status(col_text(stmt, 7)).value_or(BatchStatus::Pending);
  batch.priority = static_cast<Priority>(
      std::clamp(sqlite3_column_int(stmt, 8), 0,
                 static_cast<int>(kPriorityLevels) - 1));
  batch.created_at = col_time(stmt, 9);
  batch.started_at = col_opt_time(stmt, 10);
  batch.finished_at = col_opt_time(stmt, 11);
  return batch;
}

// Appends "<column> IN (?, ?, ...)" for `count` placeholders.
auto append_in_clause(std::string& sql, std::string_view column,
                      std::size_t count) -> void {
  std::format_to(std::back_inserter(sql), " AND {} IN (", column);
  for (std::size_t i = 0; i < count; ++i) {
    sql += i == 0 ? "?" : ", ?";
  }
  sql += ")";
}

}  // namespace

auto Persistence::DbDeleter::operator()(sqlite3* db) const -> void {
  if (db)
    sqlite3_close(db);
}

Persistence::Statement::~Statement() {
  reset();
}

auto Persistence::Statement::reset() -> void {
  if (stmt_) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
  }
}

auto Persistence::prepare(const char* sql) -> Result<sqlite3_stmt*> {
  if (!db_) {
    return fail(Error::DatabaseError);
  }
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_.get(), sql, -1, &stmt, nullptr) != SQLITE_OK) {
    log::error("Failed to prepare statement: {}", sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return stmt;
}

Persistence::Persistence(std::string_view db_path) : db_path_(db_path) {
}

Persistence::~Persistence() {
  close();
}

auto Persistence::open() -> Result<void> {
  if (db_) {
    return ok();
  }

  sqlite3* raw_db = nullptr;
  int rc = sqlite3_open(db_path_.c_str(), &raw_db);
  if (rc != SQLITE_OK) {
    log::error("Failed to open database: {}", sqlite3_errmsg(raw_db));
    if (raw_db) {
      sqlite3_close(raw_db);
    }
    return fail(Error::DatabaseOpenFailed);
  }
  db_.reset(raw_db);

  // PRAGMA statements may fail on some configurations, but we continue anyway
  if (auto r = execute("PRAGMA journal_mode=WAL;"); !r) {
    log::warn("Failed to set WAL mode: {}", r.error().message());
  }
  if (auto r = execute("PRAGMA synchronous=NORMAL;"); !r) {
    log::warn("Failed to set synchronous mode: {}", r.error().message());
  }

  if (auto r = create_tables(); !r) {
    close();
    return r;
  }

  log::info("Database opened: {}", db_path_);
  return ok();
}

auto Persistence::close() -> void {
  db_.reset();
}

auto Persistence::create_tables() -> Result<void> {
  const char* sql = R"(
    CREATE TABLE IF NOT EXISTS tasks (
      id TEXT PRIMARY KEY,
      user_id TEXT NOT NULL,
      symbol TEXT NOT NULL,
      parameters TEXT NOT NULL DEFAULT '{}',
      priority INTEGER NOT NULL DEFAULT 1,
      status TEXT NOT NULL DEFAULT 'queued',
      batch_id TEXT,
      worker_id TEXT,
      created_at INTEGER NOT NULL,
      enqueued_at INTEGER NOT NULL,
      started_at INTEGER,
      completed_at INTEGER,
      cancelled_at INTEGER,
      requeued_at INTEGER,
      retry_count INTEGER NOT NULL DEFAULT 0,
      lease_timeout_sec INTEGER,
      result TEXT,
      error TEXT
    );

    CREATE TABLE IF NOT EXISTS batches (
      id TEXT PRIMARY KEY,
      user_id TEXT NOT NULL,
      task_ids TEXT NOT NULL DEFAULT '[]',
      total_tasks INTEGER NOT NULL,
      completed_tasks INTEGER NOT NULL DEFAULT 0,
      failed_tasks INTEGER NOT NULL DEFAULT 0,
      cancelled_tasks INTEGER NOT NULL DEFAULT 0,
      status TEXT NOT NULL DEFAULT 'pending',
      priority INTEGER NOT NULL DEFAULT 1,
      created_at INTEGER NOT NULL,
      started_at INTEGER,
      finished_at INTEGER
    );

    CREATE INDEX IF NOT EXISTS idx_tasks_status ON tasks(status);
    CREATE INDEX IF NOT EXISTS idx_tasks_user ON tasks(user_id);
    CREATE INDEX IF NOT EXISTS idx_tasks_batch ON tasks(batch_id);
    CREATE INDEX IF NOT EXISTS idx_batches_status ON batches(status);
  )";

  return execute(sql);
}

auto Persistence::execute(std::string_view sql) -> Result<void> {
  if (!db_) {
    return fail(Error::DatabaseError);
  }
  char* err_msg = nullptr;
  std::string sql_str{sql};
  int rc = sqlite3_exec(db_.get(), sql_str.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    log::error("SQL error: {}", err_msg ? err_msg : "unknown");
    sqlite3_free(err_msg);
    return fail(Error::DatabaseQueryFailed);
  }
  return ok();
}

auto Persistence::save_task(const Task& task) -> Result<void> {
  constexpr auto sql = R"(
    INSERT INTO tasks
      (id, user_id, symbol, parameters, priority, status, batch_id, worker_id,
       created_at, enqueued_at, started_at, completed_at, cancelled_at,
       requeued_at, retry_count, lease_timeout_sec, result, error)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    ON CONFLICT(id) DO UPDATE SET
      status = excluded.status,
      worker_id = excluded.worker_id,
      started_at = excluded.started_at,
      completed_at = excluded.completed_at,
      cancelled_at = excluded.cancelled_at,
      requeued_at = excluded.requeued_at,
      retry_count = excluded.retry_count,
      result = excluded.result,
      error = excluded.error;
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);
  auto* s = stmt.get();

  bind_text(s, 1, task.id.value());
  bind_text(s, 2, task.user_id);
  bind_text(s, 3, task.symbol);
  bind_text(s, 4, task.parameters.is_null() ? std::string{"{}"}
                                            : task.parameters.dump());
  sqlite3_bind_int(s, 5, static_cast<int>(task.priority));
  bind_text(s, 6, task_status_name(task.status));
  bind_opt_text(s, 7, task.batch_id.transform(
                          [](const BatchId& id) { return id.str(); }));
  bind_opt_text(s, 8, task.worker_id.transform(
                          [](const WorkerId& id) { return id.str(); }));
  bind_time(s, 9, task.created_at);
  bind_time(s, 10, task.enqueued_at);
  bind_opt_time(s, 11, task.started_at);
  bind_opt_time(s, 12, task.completed_at);
  bind_opt_time(s, 13, task.cancelled_at);
  bind_opt_time(s, 14, task.requeued_at);
  sqlite3_bind_int(s, 15, task.retry_count);
  if (task.lease_timeout) {
    sqlite3_bind_int64(s, 16, task.lease_timeout->count());
  } else {
    sqlite3_bind_null(s, 16);
  }
  bind_opt_text(s, 17, task.result.transform(
                           [](const nlohmann::json& j) { return j.dump(); }));
  bind_opt_text(s, 18, task.error);

  if (sqlite3_step(s) != SQLITE_DONE) {
    log::error("Failed to save task {}: {}", task.id,
               sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return ok();
}

auto Persistence::load_task(const TaskId& id) -> Result<Task> {
  auto sql = std::format("SELECT {} FROM tasks WHERE id = ?;", kTaskColumns);
  auto result = prepare(sql.c_str());
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, id.value());
  if (sqlite3_step(stmt.get()) != SQLITE_ROW)
    return fail(Error::NotFound);
  return read_task(stmt.get());
}

auto Persistence::query_tasks(const TaskFilter& filter)
    -> Result<std::vector<Task>> {
  auto sql = std::format("SELECT {} FROM tasks WHERE 1 = 1", kTaskColumns);
  if (filter.user_id) {
    sql += " AND user_id = ?";
  }
  if (filter.batch_id) {
    sql += " AND batch_id = ?";
  }
  if (!filter.statuses.empty()) {
    append_in_clause(sql, "status", filter.statuses.size());
  }
  sql += " ORDER BY enqueued_at ASC, created_at ASC";
  if (filter.limit > 0) {
    sql += " LIMIT ?";
  }
  sql += ";";

  auto result = prepare(sql.c_str());
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  int idx = 1;
  if (filter.user_id) {
    bind_text(stmt.get(), idx++, *filter.user_id);
  }
  if (filter.batch_id) {
    bind_text(stmt.get(), idx++, filter.batch_id->value());
  }
  for (auto status : filter.statuses) {
    bind_text(stmt.get(), idx++, task_status_name(status));
  }
  if (filter.limit > 0) {
    sqlite3_bind_int64(stmt.get(), idx++,
                       static_cast<sqlite3_int64>(filter.limit));
  }

  std::vector<Task> tasks;
  int rc;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    tasks.push_back(read_task(stmt.get()));
  }
  if (rc != SQLITE_DONE) {
    log::error("Task query failed: {}", sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return tasks;
}

auto Persistence::save_batch(const Batch& batch) -> Result<void> {
  constexpr auto sql = R"(
    INSERT INTO batches
      (id, user_id, task_ids, total_tasks, completed_tasks, failed_tasks,
       cancelled_tasks, status, priority, created_at, started_at, finished_at)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    ON CONFLICT(id) DO UPDATE SET
      completed_tasks = excluded.completed_tasks,
      failed_tasks = excluded.failed_tasks,
      cancelled_tasks = excluded.cancelled_tasks,
      status = excluded.status,
      started_at = excluded.started_at,
      finished_at = excluded.finished_at;
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);
  auto* s = stmt.get();

  nlohmann::json ids = nlohmann::json::array();
  for (const auto& id : batch.task_ids) {
    ids.push_back(id.str());
  }

  bind_text(s, 1, batch.id.value());
  bind_text(s, 2, batch.user_id);
  bind_text(s, 3, ids.dump());
  sqlite3_bind_int(s, 4, batch.total_tasks);
  sqlite3_bind_int(s, 5, batch.completed_tasks);
  sqlite3_bind_int(s, 6, batch.failed_tasks);
  sqlite3_bind_int(s, 7, batch.cancelled_tasks);
  bind_text(s, 8, batch_status_name(batch.status));
  sqlite3_bind_int(s, 9, static_cast<int>(batch.priority));
  bind_time(s, 10, batch.created_at);
  bind_opt_time(s, 11, batch.started_at);
  bind_opt_time(s, 12, batch.finished_at);

  if (sqlite3_step(s) != SQLITE_DONE) {
    log::error("Failed to save batch {}: {}", batch.id,
               sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return ok();
}

auto Persistence::load_batch(const BatchId& id) -> Result<Batch> {
  auto sql = std::format("SELECT {} FROM batches WHERE id = ?;", kBatchColumns);
  auto result = prepare(sql.c_str());
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, id.value());
  if (sqlite3_step(stmt.get()) != SQLITE_ROW)
    return fail(Error::NotFound);
  return read_batch(stmt.get());
}

auto Persistence::query_batches(const BatchFilter& filter)
    -> Result<std::vector<Batch>> {
  auto sql = std::format("SELECT {} FROM batches WHERE 1 = 1", kBatchColumns);
  if (filter.user_id) {
    sql += " AND user_id = ?";
  }
  if (!filter.statuses.empty()) {
    append_in_clause(sql, "status", filter.statuses.size());
  }
  sql += " ORDER BY created_at ASC";
  if (filter.limit > 0) {
    sql += " LIMIT ?";
  }
  sql += ";";

  auto result = prepare(sql.c_str());
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  int idx = 1;
  if (filter.user_id) {
    bind_text(stmt.get(), idx++, *filter.user_id);
  }
  for (auto status : filter.statuses) {
    bind_text(stmt.get(), idx++, batch_status_name(status));
  }
  if (filter.limit > 0) {
    sqlite3_bind_int64(stmt.get(), idx++,
                       static_cast<sqlite3_int64>(filter.limit));
  }

  std::vector<Batch> batches;
  int rc;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    batches.push_back(read_batch(stmt.get()));
  }
  if (rc != SQLITE_DONE) {
    log::error("Batch query failed: {}", sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return batches;
}

auto Persistence::purge_finished_before(TimePoint cutoff)
    -> Result<std::size_t> {
  constexpr auto task_sql = R"(
    DELETE FROM tasks
    WHERE status IN ('completed', 'failed', 'cancelled')
      AND COALESCE(completed_at, cancelled_at) < ?;
  )";
  constexpr auto batch_sql = R"(
    DELETE FROM batches
    WHERE status IN ('completed', 'failed', 'cancelled')
      AND finished_at < ?;
  )";

  std::size_t removed = 0;
  for (const char* sql : {task_sql, batch_sql}) {
    auto result = prepare(sql);
    if (!result)
      return std::unexpected(result.error());
    Statement stmt(*result);

    bind_time(stmt.get(), 1, cutoff);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
      log::error("Purge failed: {}", sqlite3_errmsg(db_.get()));
      return fail(Error::DatabaseQueryFailed);
    }
    if (sql == task_sql) {
      removed = static_cast<std::size_t>(sqlite3_changes(db_.get()));
    }
  }
  return removed;
}

auto Persistence::begin_transaction() -> Result<void> {
  return execute("BEGIN TRANSACTION;");
}

auto Persistence::commit_transaction() -> Result<void> {
  return execute("COMMIT;");
}

auto Persistence::rollback_transaction() -> Result<void> {
  return execute("ROLLBACK;");
}

}  // namespace batchq
