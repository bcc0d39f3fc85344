#pragma once

#include "batchq/queue/task.hpp"

#include <array>
#include <cstddef>
#include <unordered_map>
#include <vector>

namespace batchq {

// Owns Task records. Status changes must go through set_status() so the
// per-status counters stay exact. Not synchronized.
class TaskStore {
public:
  // False if a task with the same id exists.
  auto insert(Task task) -> bool;

  [[nodiscard]] auto find(const TaskId& id) -> Task*;
  [[nodiscard]] auto find(const TaskId& id) const -> const Task*;

  auto set_status(Task& task, TaskStatus status) -> void;

  auto erase(const TaskId& id) -> bool;

  // Drops terminal tasks that finished before `cutoff`; returns their ids.
  auto purge_finished(TimePoint cutoff) -> std::vector<TaskId>;

  [[nodiscard]] auto count(TaskStatus status) const noexcept -> std::size_t {
    return counts_[static_cast<std::size_t>(status)];
  }
  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return tasks_.size();
  }

  template <typename Fn>
  auto for_each(Fn&& fn) const -> void {
    for (const auto& [_, task] : tasks_) {
      fn(task);
    }
  }

private:
  std::unordered_map<TaskId, Task> tasks_;
  std::array<std::size_t, kTaskStatusCount> counts_{};
};

}  // namespace batchq
