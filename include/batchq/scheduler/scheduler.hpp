#pragma once

#include "batchq/config/system_config.hpp"
#include "batchq/core/error.hpp"
#include "batchq/queue/admission_controller.hpp"
#include "batchq/queue/batch.hpp"
#include "batchq/queue/batch_store.hpp"
#include "batchq/queue/lease_manager.hpp"
#include "batchq/queue/priority_queue.hpp"
#include "batchq/queue/task.hpp"
#include "batchq/queue/task_store.hpp"
#include "batchq/queue/worker_registry.hpp"
#include "batchq/scheduler/events.hpp"
#include "batchq/scheduler/state_mirror.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace batchq {

struct QueueStats {
  std::size_t queued{0};
  std::size_t processing{0};
  std::size_t completed{0};
  std::size_t failed{0};
  std::size_t cancelled{0};
  std::size_t total{0};
};

struct BatchQueueStats {
  QueueStats tasks;
  std::size_t active_batches{0};
  std::size_t completed_batches{0};
  std::size_t pending_batches{0};
};

struct UserQueueStatus {
  int processing{0};
  int concurrent_limit{0};
  int available_slots{0};
};

// Owns every task, batch and queue entry. One mutex guards the queue, the
// task and batch stores and the admission counters together; lifecycle
// events are numbered under it and delivered to the listener in that order
// after it is released, possibly on another producer's thread.
class Scheduler {
public:
  explicit Scheduler(QueueConfig config);
  ~Scheduler();

  Scheduler(const Scheduler&) = delete;
  auto operator=(const Scheduler&) -> Scheduler& = delete;

  // Both must be set before start() or any producer runs.
  auto set_event_listener(EventListener listener) -> void;
  auto set_state_mirror(StateMirror* mirror) -> void;

  // Background lease sweep and cleanup.
  auto start() -> void;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load();
  }

  [[nodiscard]] auto enqueue(TaskRequest request) -> Result<TaskId>;

  // Never blocks. nullopt when the queue is empty or the head task's owner
  // (or the whole system) is at its concurrency ceiling.
  [[nodiscard]] auto dequeue(const WorkerId& worker_id) -> std::optional<Task>;

  // False if the task is unknown, no longer Processing, or leased to a
  // worker other than `worker_id`.
  auto ack(const TaskId& task_id, const WorkerId& worker_id, bool success,
           nlohmann::json result = nullptr, std::string error = {}) -> bool;

  // Ok(false) when the task is already terminal.
  [[nodiscard]] auto cancel(const TaskId& task_id) -> Result<bool>;

  [[nodiscard]] auto create_batch(BatchRequest request) -> Result<BatchId>;
  [[nodiscard]] auto get_batch_status(const BatchId& batch_id) const
      -> Result<Batch>;
  // Returns the number of member tasks cancelled.
  [[nodiscard]] auto cancel_batch(const BatchId& batch_id)
      -> Result<std::size_t>;

  [[nodiscard]] auto get_task(const TaskId& task_id) const -> Result<Task>;
  [[nodiscard]] auto list_batch_tasks(const BatchId& batch_id) const
      -> Result<std::vector<Task>>;

  // Requeues (or fails) every task whose lease ran out by `now`.
  auto sweep_expired(TimePoint now) -> std::size_t;

  // Forgets terminal tasks and batches that finished before `cutoff`.
  auto purge_finished(TimePoint cutoff) -> std::size_t;

  // Loads state from a previous process. Processing tasks lost their worker
  // and are treated as expired leases. Returns the number of tasks queued.
  auto restore(std::vector<Task> tasks, std::vector<Batch> batches)
      -> std::size_t;

  [[nodiscard]] auto get_queue_stats() const -> QueueStats;
  [[nodiscard]] auto get_batch_queue_stats() const -> BatchQueueStats;
  [[nodiscard]] auto get_user_queue_status(std::string_view user_id) const
      -> UserQueueStatus;

  auto set_limits(int user_limit, int global_limit) -> void;

  [[nodiscard]] auto workers() noexcept -> WorkerRegistry& { return workers_; }
  [[nodiscard]] auto workers() const noexcept -> const WorkerRegistry& {
    return workers_;
  }

  [[nodiscard]] auto config() const noexcept -> const QueueConfig& {
    return config_;
  }

private:
  using Events = std::vector<SchedulerEvent>;

  [[nodiscard]] auto validate_request(std::string_view user_id,
                                      std::string_view symbol) const
      -> Result<void>;
  auto make_task(std::string user_id, std::string symbol,
                 Parameters parameters, Priority priority,
                 std::optional<BatchId> batch_id, TimePoint now) -> Task;
  auto admit_locked(Task task, TimePoint now, Events& events) -> void;

  auto settle_locked(Task& task, TaskStatus status, TimePoint now,
                     Events& events, bool finalize_batch = true) -> void;
  auto expire_locked(Task& task, TimePoint now, Events& events) -> void;
  [[nodiscard]] auto lease_duration(const Task& task) const
      -> LeaseManager::Duration;
  [[nodiscard]] auto queue_stats_locked() const -> QueueStats;

  auto mirror(const Task& task) -> void;
  auto mirror(const Batch& batch) -> void;
  auto emit_locked(Events& events, SchedulerEvent event) -> void;
  auto dispatch(Events events) -> void;

  auto run_loop() -> void;
  auto notify() -> void;

  QueueConfig config_;

  mutable std::mutex mu_;
  PriorityQueue queue_;
  TaskStore tasks_;
  BatchStore batches_;
  AdmissionController admission_;
  LeaseManager leases_;

  WorkerRegistry workers_;

  std::uint64_t next_sequence_{0};

  // Events wait here until every lower sequence has been delivered.
  std::mutex dispatch_mu_;
  std::map<std::uint64_t, SchedulerEvent> pending_;
  std::uint64_t delivered_{0};
  bool delivering_{false};

  EventListener listener_;
  StateMirror* mirror_{nullptr};

  std::atomic<bool> running_{false};
  int wake_fd_{-1};
  std::thread sweeper_;
};

}  // namespace batchq
