#include "batchq/queue/worker_registry.hpp"

#include <mutex>

namespace batchq {

auto WorkerRegistry::register_worker(WorkerInfo info) -> bool {
  std::unique_lock lock(mu_);
  if (auto it = workers_.find(info.id); it != workers_.end()) {
    it->second.type = std::move(info.type);
    it->second.last_heartbeat = info.last_heartbeat;
    return false;
  }
  auto id = info.id;
  workers_.emplace(std::move(id), std::move(info));
  return true;
}

auto WorkerRegistry::heartbeat(const WorkerId& id,
                               std::optional<TaskId> current_task,
                               TimePoint now) -> bool {
  std::unique_lock lock(mu_);
  auto it = workers_.find(id);
  if (it == workers_.end()) {
    return false;
  }
  auto& w = it->second;
  w.last_heartbeat = now;
  w.status = current_task ? WorkerStatus::Busy : WorkerStatus::Idle;
  w.current_task_id = std::move(current_task);
  return true;
}

auto WorkerRegistry::unregister_worker(const WorkerId& id) -> bool {
  std::unique_lock lock(mu_);
  return workers_.erase(id) > 0;
}

auto WorkerRegistry::mark_busy(const WorkerId& id, const TaskId& task_id,
                               TimePoint now) -> bool {
  std::unique_lock lock(mu_);
  auto it = workers_.find(id);
  if (it == workers_.end()) {
    return false;
  }
  it->second.status = WorkerStatus::Busy;
  it->second.current_task_id = task_id;
  it->second.last_heartbeat = now;
  return true;
}

auto WorkerRegistry::mark_idle(const WorkerId& id, bool processed,
                               TimePoint now) -> bool {
  std::unique_lock lock(mu_);
  auto it = workers_.find(id);
  if (it == workers_.end()) {
    return false;
  }
  auto& w = it->second;
  w.status = WorkerStatus::Idle;
  w.current_task_id.reset();
  w.last_heartbeat = now;
  if (processed) {
    ++w.tasks_processed;
  }
  return true;
}

auto WorkerRegistry::get(const WorkerId& id) const
    -> std::optional<WorkerInfo> {
  std::shared_lock lock(mu_);
  auto it = workers_.find(id);
  if (it == workers_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto WorkerRegistry::list() const -> std::vector<WorkerInfo> {
  std::shared_lock lock(mu_);
  std::vector<WorkerInfo> out;
  out.reserve(workers_.size());
  for (const auto& [_, info] : workers_) {
    out.push_back(info);
  }
  return out;
}

auto WorkerRegistry::stale(TimePoint now,
                           std::chrono::milliseconds max_age) const
    -> std::vector<WorkerInfo> {
  std::shared_lock lock(mu_);
  std::vector<WorkerInfo> out;
  for (const auto& [_, info] : workers_) {
    if (now - info.last_heartbeat > max_age) {
      out.push_back(info);
    }
  }
  return out;
}

auto WorkerRegistry::size() const -> std::size_t {
  std::shared_lock lock(mu_);
  return workers_.size();
}

}  // namespace batchq
