#pragma once

#include "batchq/core/error.hpp"
#include "batchq/storage/task_repository.hpp"

#include <cstddef>

namespace batchq {

class Scheduler;

struct RecoveryResult {
  std::size_t batches_restored{0};
  std::size_t tasks_restored{0};
  // Tasks found Processing; their worker died with the previous process.
  std::size_t tasks_orphaned{0};
  std::size_t tasks_queued{0};
};

// Reloads non-terminal batches and tasks into a fresh scheduler.
class Recovery {
public:
  explicit Recovery(TaskRepository& repository);

  [[nodiscard]] auto recover(Scheduler& scheduler) -> Result<RecoveryResult>;

private:
  TaskRepository& repository_;
};

}  // namespace batchq
