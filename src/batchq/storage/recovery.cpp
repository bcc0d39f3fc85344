#include "batchq/storage/recovery.hpp"

#include "batchq/scheduler/scheduler.hpp"
#include "batchq/util/log.hpp"

#include <algorithm>

namespace batchq {

Recovery::Recovery(TaskRepository& repository) : repository_(repository) {
}

auto Recovery::recover(Scheduler& scheduler) -> Result<RecoveryResult> {
  RecoveryResult result;

  auto batches = repository_.query_batches(BatchFilter{
      .statuses = {BatchStatus::Pending, BatchStatus::Processing}});
  if (!batches) {
    log::error("Failed to load unfinished batches");
    return fail(batches.error());
  }

  auto tasks = repository_.query_tasks(TaskFilter{
      .statuses = {TaskStatus::Queued, TaskStatus::Processing}});
  if (!tasks) {
    log::error("Failed to load unfinished tasks");
    return fail(tasks.error());
  }

  result.batches_restored = batches->size();
  result.tasks_restored = tasks->size();
  result.tasks_orphaned = static_cast<std::size_t>(
      std::ranges::count(*tasks, TaskStatus::Processing, &Task::status));
  log::info("Found {} unfinished batch(es) and {} unfinished task(s) to "
            "recover",
            result.batches_restored, result.tasks_restored);

  result.tasks_queued =
      scheduler.restore(std::move(*tasks), std::move(*batches));

  log::info("Recovery complete: {} task(s) queued, {} orphaned by the "
            "previous process",
            result.tasks_queued, result.tasks_orphaned);
  return ok(std::move(result));
}

}  // namespace batchq
