#pragma once

#include "batchq/core/error.hpp"
#include "batchq/queue/batch.hpp"
#include "batchq/queue/task.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace batchq {

struct TaskFilter {
  std::optional<std::string> user_id;
  // Empty matches every status.
  std::vector<TaskStatus> statuses;
  std::optional<BatchId> batch_id;
  // 0 means no limit.
  std::size_t limit{0};
};

struct BatchFilter {
  std::optional<std::string> user_id;
  std::vector<BatchStatus> statuses;
  std::size_t limit{0};
};

// Durable store for task and batch records. The scheduler's memory is the
// authority; a repository only mirrors it and feeds recovery.
class TaskRepository {
public:
  virtual ~TaskRepository() = default;

  [[nodiscard]] virtual auto save_task(const Task& task) -> Result<void> = 0;
  [[nodiscard]] virtual auto load_task(const TaskId& id) -> Result<Task> = 0;
  [[nodiscard]] virtual auto query_tasks(const TaskFilter& filter)
      -> Result<std::vector<Task>> = 0;

  [[nodiscard]] virtual auto save_batch(const Batch& batch) -> Result<void> = 0;
  [[nodiscard]] virtual auto load_batch(const BatchId& id) -> Result<Batch> = 0;
  [[nodiscard]] virtual auto query_batches(const BatchFilter& filter)
      -> Result<std::vector<Batch>> = 0;

  // Deletes terminal records that finished before `cutoff`.
  [[nodiscard]] virtual auto purge_finished_before(TimePoint cutoff)
      -> Result<std::size_t> = 0;
};

}  // namespace batchq
