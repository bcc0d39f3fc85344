#pragma once

#include "batchq/util/id.hpp"
#include "batchq/util/util.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace batchq {

enum class WorkerStatus : std::uint8_t {
  Idle,
  Busy,
};

struct WorkerInfo {
  WorkerId id;
  std::string type;
  WorkerStatus status{WorkerStatus::Idle};
  std::optional<TaskId> current_task_id;
  TimePoint last_heartbeat{};
  TimePoint started_at{};
  int tasks_processed{0};
};

// Advisory view of live workers. Never consulted for scheduling decisions.
class WorkerRegistry {
public:
  // Returns false when the worker was already known; its type and heartbeat
  // are refreshed in that case.
  auto register_worker(WorkerInfo info) -> bool;

  auto heartbeat(const WorkerId& id, std::optional<TaskId> current_task,
                 TimePoint now) -> bool;

  auto unregister_worker(const WorkerId& id) -> bool;

  auto mark_busy(const WorkerId& id, const TaskId& task_id, TimePoint now)
      -> bool;
  // Clears the current task; `processed` counts it as handled.
  auto mark_idle(const WorkerId& id, bool processed, TimePoint now) -> bool;

  [[nodiscard]] auto get(const WorkerId& id) const -> std::optional<WorkerInfo>;
  [[nodiscard]] auto list() const -> std::vector<WorkerInfo>;

  // Workers whose last heartbeat is older than `max_age`.
  [[nodiscard]] auto stale(TimePoint now, std::chrono::milliseconds max_age) const
      -> std::vector<WorkerInfo>;

  [[nodiscard]] auto size() const -> std::size_t;

private:
  mutable std::shared_mutex mu_;
  std::unordered_map<WorkerId, WorkerInfo> workers_;
};

}  // namespace batchq
