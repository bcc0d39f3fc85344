#include "batchq/queue/lease_manager.hpp"

namespace batchq {

auto LeaseManager::acquire(const TaskId& task_id, Duration duration,
                           TimePoint now) -> void {
  release(task_id);
  auto it = schedule_.emplace(now + duration, task_id);
  by_task_.emplace(task_id, it);
}

auto LeaseManager::release(const TaskId& task_id) -> bool {
  auto it = by_task_.find(task_id);
  if (it == by_task_.end()) {
    return false;
  }
  schedule_.erase(it->second);
  by_task_.erase(it);
  return true;
}

auto LeaseManager::sweep(TimePoint now) -> std::vector<TaskId> {
  std::vector<TaskId> expired;
  while (!schedule_.empty()) {
    auto it = schedule_.begin();
    if (it->first > now)
      break;

    expired.push_back(it->second);
    by_task_.erase(it->second);
    schedule_.erase(it);
  }
  return expired;
}

auto LeaseManager::deadline(const TaskId& task_id) const
    -> std::optional<TimePoint> {
  auto it = by_task_.find(task_id);
  if (it == by_task_.end()) {
    return std::nullopt;
  }
  return it->second->first;
}

auto LeaseManager::next_deadline() const -> std::optional<TimePoint> {
  if (schedule_.empty()) {
    return std::nullopt;
  }
  return schedule_.begin()->first;
}

}  // namespace batchq
