#include "batchq/queue/task_store.hpp"

namespace batchq {

auto TaskStore::insert(Task task) -> bool {
  auto status = task.status;
  auto id = task.id;
  auto [_, inserted] = tasks_.try_emplace(std::move(id), std::move(task));
  if (inserted) {
    ++counts_[static_cast<std::size_t>(status)];
  }
  return inserted;
}

auto TaskStore::find(const TaskId& id) -> Task* {
  auto it = tasks_.find(id);
  return it == tasks_.end() ? nullptr : &it->second;
}

auto TaskStore::find(const TaskId& id) const -> const Task* {
  auto it = tasks_.find(id);
  return it == tasks_.end() ? nullptr : &it->second;
}

auto TaskStore::set_status(Task& task, TaskStatus status) -> void {
  if (task.status == status) {
    return;
  }
  --counts_[static_cast<std::size_t>(task.status)];
  ++counts_[static_cast<std::size_t>(status)];
  task.status = status;
}

auto TaskStore::erase(const TaskId& id) -> bool {
  auto it = tasks_.find(id);
  if (it == tasks_.end()) {
    return false;
  }
  --counts_[static_cast<std::size_t>(it->second.status)];
  tasks_.erase(it);
  return true;
}

auto TaskStore::purge_finished(TimePoint cutoff) -> std::vector<TaskId> {
  std::vector<TaskId> purged;
  for (auto it = tasks_.begin(); it != tasks_.end();) {
    const auto& task = it->second;
    auto finished = task.finished_at();
    if (task.terminal() && finished && *finished < cutoff) {
      --counts_[static_cast<std::size_t>(task.status)];
      purged.push_back(it->first);
      it = tasks_.erase(it);
    } else {
      ++it;
    }
  }
  return purged;
}

}  // namespace batchq
