#include "batchq/queue/batch_store.hpp"

#include <algorithm>

namespace batchq {

auto BatchStore::insert(Batch batch) -> bool {
  auto id = batch.id;
  return batches_.try_emplace(std::move(id), std::move(batch)).second;
}

auto BatchStore::find(const BatchId& id) -> Batch* {
  auto it = batches_.find(id);
  return it == batches_.end() ? nullptr : &it->second;
}

auto BatchStore::find(const BatchId& id) const -> const Batch* {
  auto it = batches_.find(id);
  return it == batches_.end() ? nullptr : &it->second;
}

auto BatchStore::mark_processing(const BatchId& id, TimePoint now) -> bool {
  auto* batch = find(id);
  if (batch == nullptr || batch->status != BatchStatus::Pending) {
    return false;
  }
  batch->status = BatchStatus::Processing;
  batch->started_at = now;
  return true;
}

auto BatchStore::apply_outcome(Batch& batch, TaskStatus outcome) -> bool {
  if (batch.settled() >= batch.total_tasks) {
    return false;
  }
  switch (outcome) {
    case TaskStatus::Completed:
      ++batch.completed_tasks;
      return true;
    case TaskStatus::Failed:
      ++batch.failed_tasks;
      return true;
    case TaskStatus::Cancelled:
      ++batch.cancelled_tasks;
      return true;
    default:
      return false;
  }
}

auto BatchStore::record_outcome(const BatchId& id, TaskStatus outcome,
                                TimePoint now) -> bool {
  auto* batch = find(id);
  if (batch == nullptr || !apply_outcome(*batch, outcome)) {
    return false;
  }
  if (batch->terminal() || batch->settled() < batch->total_tasks) {
    return false;
  }

  if (batch->failed_tasks > 0) {
    batch->status = BatchStatus::Failed;
  } else if (batch->cancelled_tasks > 0) {
    batch->status = BatchStatus::Cancelled;
  } else {
    batch->status = BatchStatus::Completed;
  }
  batch->finished_at = now;
  return true;
}

auto BatchStore::count_outcome(const BatchId& id, TaskStatus outcome) -> bool {
  auto* batch = find(id);
  return batch != nullptr && apply_outcome(*batch, outcome);
}

auto BatchStore::finalize(const BatchId& id, BatchStatus status, TimePoint now)
    -> bool {
  auto* batch = find(id);
  if (batch == nullptr || batch->terminal()) {
    return false;
  }
  batch->status = status;
  batch->finished_at = now;
  return true;
}

auto BatchStore::purge_finished(TimePoint cutoff) -> std::vector<BatchId> {
  std::vector<BatchId> purged;
  for (auto it = batches_.begin(); it != batches_.end();) {
    const auto& batch = it->second;
    if (batch.terminal() && batch.finished_at && *batch.finished_at < cutoff) {
      purged.push_back(it->first);
      it = batches_.erase(it);
    } else {
      ++it;
    }
  }
  return purged;
}

auto BatchStore::count(BatchStatus status) const -> std::size_t {
  return static_cast<std::size_t>(
      std::ranges::count_if(batches_, [status](const auto& entry) {
        return entry.second.status == status;
      }));
}

}  // namespace batchq
