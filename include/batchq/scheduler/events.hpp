#pragma once

#include "batchq/queue/batch.hpp"
#include "batchq/queue/task.hpp"

#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace batchq {

enum class EventKind : std::uint8_t {
  TaskQueued,
  TaskStarted,
  TaskRequeued,
  TaskCompleted,
  TaskFailed,
  TaskCancelled,
  BatchCreated,
  BatchFinished,
};

[[nodiscard]] constexpr auto event_kind_name(EventKind kind) noexcept
    -> std::string_view {
  constexpr std::array<std::string_view, 8> names = {
      "task_queued",    "task_started",   "task_requeued", "task_completed",
      "task_failed",    "task_cancelled", "batch_created", "batch_finished",
  };
  return names[static_cast<std::uint8_t>(kind)];
}

// Snapshot of a status transition. Batch events leave task_id empty.
struct SchedulerEvent {
  EventKind kind;
  TaskId task_id;
  std::optional<BatchId> batch_id;
  std::string user_id;
  std::string symbol;
  std::optional<WorkerId> worker_id;
  std::optional<TaskStatus> task_status;
  std::optional<BatchStatus> batch_status;
  int retry_count{0};
  int progress{0};
  std::optional<std::string> error;
  TimePoint timestamp{};
  // Assigned by the scheduler; listeners observe strictly increasing values.
  std::uint64_t sequence{0};

  [[nodiscard]] static auto for_task(EventKind kind, const Task& task,
                                     TimePoint now) -> SchedulerEvent {
    return SchedulerEvent{
        .kind = kind,
        .task_id = task.id,
        .batch_id = task.batch_id,
        .user_id = task.user_id,
        .symbol = task.symbol,
        .worker_id = task.worker_id,
        .task_status = task.status,
        .retry_count = task.retry_count,
        .error = task.error,
        .timestamp = now,
    };
  }

  [[nodiscard]] static auto for_batch(EventKind kind, const Batch& batch,
                                      TimePoint now) -> SchedulerEvent {
    return SchedulerEvent{
        .kind = kind,
        .batch_id = batch.id,
        .user_id = batch.user_id,
        .batch_status = batch.status,
        .progress = batch.progress(),
        .timestamp = now,
    };
  }
};

using EventListener = std::move_only_function<void(const SchedulerEvent&)>;

}  // namespace batchq
