#pragma once

#include "batchq/core/error.hpp"
#include "batchq/storage/task_repository.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace batchq {

// TaskRepository on a single sqlite3 connection. Not thread-safe; the
// persistence service serializes access on its writer thread.
class Persistence : public TaskRepository {
public:
  explicit Persistence(std::string_view db_path);
  ~Persistence() override;

  Persistence(const Persistence&) = delete;
  Persistence& operator=(const Persistence&) = delete;

  [[nodiscard]] auto open() -> Result<void>;
  auto close() -> void;
  [[nodiscard]] auto is_open() const noexcept -> bool {
    return db_ != nullptr;
  }

  [[nodiscard]] auto save_task(const Task& task) -> Result<void> override;
  [[nodiscard]] auto load_task(const TaskId& id) -> Result<Task> override;
  [[nodiscard]] auto query_tasks(const TaskFilter& filter)
      -> Result<std::vector<Task>> override;

  [[nodiscard]] auto save_batch(const Batch& batch) -> Result<void> override;
  [[nodiscard]] auto load_batch(const BatchId& id) -> Result<Batch> override;
  [[nodiscard]] auto query_batches(const BatchFilter& filter)
      -> Result<std::vector<Batch>> override;

  [[nodiscard]] auto purge_finished_before(TimePoint cutoff)
      -> Result<std::size_t> override;

  [[nodiscard]] auto begin_transaction() -> Result<void>;
  [[nodiscard]] auto commit_transaction() -> Result<void>;
  [[nodiscard]] auto rollback_transaction() -> Result<void>;

private:
  [[nodiscard]] auto create_tables() -> Result<void>;
  [[nodiscard]] auto execute(std::string_view sql) -> Result<void>;
  [[nodiscard]] auto prepare(const char* sql) -> Result<sqlite3_stmt*>;

  struct DbDeleter {
    void operator()(sqlite3* db) const;
  };

  class Statement {
  public:
    explicit Statement(sqlite3_stmt* stmt = nullptr) noexcept : stmt_(stmt) {
    }
    ~Statement();
    Statement(Statement&& other) noexcept
        : stmt_(std::exchange(other.stmt_, nullptr)) {
    }
    Statement& operator=(Statement&& other) noexcept {
      if (this != &other) {
        reset();
        stmt_ = std::exchange(other.stmt_, nullptr);
      }
      return *this;
    }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    [[nodiscard]] auto get() const noexcept -> sqlite3_stmt* {
      return stmt_;
    }
    [[nodiscard]] explicit operator bool() const noexcept {
      return stmt_ != nullptr;
    }
    auto reset() -> void;

  private:
    sqlite3_stmt* stmt_ = nullptr;
  };

  std::string db_path_;
  std::unique_ptr<sqlite3, DbDeleter> db_{nullptr};
};

}  // namespace batchq
