#pragma once

#include "batchq/util/id.hpp"
#include "batchq/util/util.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <unordered_map>
#include <vector>

namespace batchq {

// Visibility-timeout deadlines for tasks held by workers. Not synchronized.
class LeaseManager {
public:
  using Duration = std::chrono::milliseconds;

  // Replaces any existing lease for `task_id`.
  auto acquire(const TaskId& task_id, Duration duration, TimePoint now) -> void;

  auto release(const TaskId& task_id) -> bool;

  // Removes and returns every lease whose deadline is <= now, earliest first.
  [[nodiscard]] auto sweep(TimePoint now) -> std::vector<TaskId>;

  [[nodiscard]] auto deadline(const TaskId& task_id) const
      -> std::optional<TimePoint>;
  [[nodiscard]] auto next_deadline() const -> std::optional<TimePoint>;

  [[nodiscard]] auto holds(const TaskId& task_id) const -> bool {
    return by_task_.contains(task_id);
  }
  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return by_task_.size();
  }

private:
  using Schedule = std::multimap<TimePoint, TaskId>;

  Schedule schedule_;
  std::unordered_map<TaskId, Schedule::iterator> by_task_;
};

}  // namespace batchq
