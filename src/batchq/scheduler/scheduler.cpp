#include "batchq/scheduler/scheduler.hpp"

#include "batchq/queue/state_strings.hpp"
#include "batchq/util/log.hpp"
#include "batchq/util/util.hpp"

#include <sys/eventfd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <exception>
#include <format>
#include <utility>

#include <poll.h>
#include <unistd.h>

namespace batchq {

Scheduler::Scheduler(QueueConfig config)
    : config_(std::move(config)),
      admission_(config_.user_concurrent_limit,
                 config_.global_concurrent_limit) {
  wake_fd_ = eventfd(0, EFD_NONBLOCK);
  if (wake_fd_ < 0) {
    log::error("Failed to create eventfd: {}", std::strerror(errno));
  }
}

Scheduler::~Scheduler() {
  stop();
  if (wake_fd_ >= 0) {
    close(wake_fd_);
    wake_fd_ = -1;
  }
}

auto Scheduler::set_event_listener(EventListener listener) -> void {
  listener_ = std::move(listener);
}

auto Scheduler::set_state_mirror(StateMirror* mirror) -> void {
  std::lock_guard lock(mu_);
  mirror_ = mirror;
}

auto Scheduler::start() -> void {
  if (running_.exchange(true))
    return;

  sweeper_ = std::thread([this] { run_loop(); });
  log::info("Scheduler started (user limit {}, global limit {}, visibility "
            "timeout {}s)",
            config_.user_concurrent_limit, config_.global_concurrent_limit,
            config_.visibility_timeout_sec);
}

auto Scheduler::stop() -> void {
  if (!running_.exchange(false))
    return;
  notify();
  if (sweeper_.joinable()) {
    sweeper_.join();
  }
  log::info("Scheduler stopped");
}

auto Scheduler::run_loop() -> void {
  log::set_thread_label("sweeper");
  pollfd pfd{wake_fd_, POLLIN, 0};
  auto next_cleanup = Clock::now() + config_.cleanup_interval();

  while (running_.load(std::memory_order_relaxed)) {
    auto now = Clock::now();
    if (auto n = sweep_expired(now); n > 0) {
      log::info("Lease sweep handled {} expired task(s)", n);
    }
    if (now >= next_cleanup) {
      auto purged = purge_finished(now - config_.cleanup_age());
      if (purged > 0) {
        log::info("Cleanup removed {} finished task(s)", purged);
      }
      next_cleanup = now + config_.cleanup_interval();
    }

    auto timeout = std::min<std::chrono::milliseconds>(
        config_.sweep_interval(),
        std::chrono::duration_cast<std::chrono::milliseconds>(next_cleanup -
                                                              now));
    int timeout_ms = std::max(0, static_cast<int>(timeout.count()));

    int ret = ::poll(&pfd, 1, timeout_ms);
    if (ret < 0 && errno != EINTR) {
      log::error("poll failed: {}", std::strerror(errno));
      break;
    }

    std::uint64_t val;
    while (::read(wake_fd_, &val, sizeof(val)) > 0) {
    }
  }
}

auto Scheduler::notify() -> void {
  std::uint64_t val = 1;
  if (write(wake_fd_, &val, sizeof(val)) < 0) {
    log::warn("Failed to write to wake fd: {}", std::strerror(errno));
  }
}

auto Scheduler::validate_request(std::string_view user_id,
                                 std::string_view symbol) const
    -> Result<void> {
  if (user_id.empty() || symbol.empty()) {
    return fail(Error::InvalidInput);
  }
  return ok();
}

auto Scheduler::make_task(std::string user_id, std::string symbol,
                          Parameters parameters, Priority priority,
                          std::optional<BatchId> batch_id, TimePoint now)
    -> Task {
  Task task;
  task.id = TaskId::generate();
  task.user_id = std::move(user_id);
  task.symbol = std::move(symbol);
  task.parameters =
      parameters.is_null() ? Parameters::object() : std::move(parameters);
  task.priority = priority;
  task.status = TaskStatus::Queued;
  task.batch_id = std::move(batch_id);
  task.created_at = now;
  task.enqueued_at = now;
  return task;
}

auto Scheduler::admit_locked(Task task, TimePoint now, Events& events)
    -> void {
  auto id = task.id;
  auto priority = task.priority;
  tasks_.insert(std::move(task));
  queue_.push(id, priority);

  const auto& stored = *tasks_.find(id);
  mirror(stored);
  emit_locked(events,
              SchedulerEvent::for_task(EventKind::TaskQueued, stored, now));
}

auto Scheduler::enqueue(TaskRequest request) -> Result<TaskId> {
  if (auto r = validate_request(request.user_id, request.symbol); !r) {
    return std::unexpected(r.error());
  }

  auto now = Clock::now();
  Events events;
  TaskId id;
  {
    std::lock_guard lock(mu_);
    if (!admission_.can_admit(request.user_id)) {
      log::debug("Enqueue denied for user {}: {} in flight (limit {})",
                 request.user_id, admission_.in_flight(request.user_id),
                 admission_.user_limit());
      return fail(Error::AdmissionDenied);
    }

    auto task = make_task(std::move(request.user_id), std::move(request.symbol),
                          std::move(request.parameters), request.priority,
                          std::nullopt, now);
    task.lease_timeout = request.lease_timeout;
    id = task.id;
    admit_locked(std::move(task), now, events);
  }

  log::debug("Task {} enqueued", id);
  dispatch(std::move(events));
  return id;
}

auto Scheduler::dequeue(const WorkerId& worker_id) -> std::optional<Task> {
  auto now = Clock::now();
  Events events;
  std::optional<Task> taken;
  {
    std::lock_guard lock(mu_);
    while (auto entry = queue_.pop()) {
      auto* task = tasks_.find(entry->id);
      if (task == nullptr || task->status != TaskStatus::Queued) {
        log::warn("Dropping stale queue entry {}", entry->id);
        continue;
      }

      if (!admission_.try_admit(task->user_id, task->id)) {
        queue_.push_front(entry->id, entry->priority);
        return std::nullopt;
      }

      tasks_.set_status(*task, TaskStatus::Processing);
      task->worker_id = worker_id;
      task->started_at = now;
      leases_.acquire(task->id, lease_duration(*task), now);

      if (task->batch_id && batches_.mark_processing(*task->batch_id, now)) {
        mirror(*batches_.find(*task->batch_id));
      }
      mirror(*task);
      emit_locked(events,
                  SchedulerEvent::for_task(EventKind::TaskStarted, *task, now));
      taken = *task;

      // Registry updates stay under mu_ so a racing cancel or sweep cannot
      // mark the worker idle before it is marked busy.
      if (!workers_.mark_busy(worker_id, task->id, now)) {
        workers_.register_worker(WorkerInfo{.id = worker_id,
                                            .type = "anonymous",
                                            .last_heartbeat = now,
                                            .started_at = now});
        workers_.mark_busy(worker_id, task->id, now);
      }
      break;
    }
  }

  if (!taken) {
    return std::nullopt;
  }

  log::debug("Task {} ({}) assigned to worker {}", taken->id, taken->symbol,
             worker_id);
  dispatch(std::move(events));
  return taken;
}

auto Scheduler::ack(const TaskId& task_id, const WorkerId& worker_id,
                    bool success, nlohmann::json result, std::string error)
    -> bool {
  auto now = Clock::now();
  Events events;
  {
    std::lock_guard lock(mu_);
    auto* task = tasks_.find(task_id);
    if (task == nullptr || task->status != TaskStatus::Processing) {
      return false;
    }
    if (task->worker_id != worker_id) {
      log::debug("Ack for task {} from worker {} rejected: leased to {}",
                 task_id, worker_id,
                 task->worker_id ? task->worker_id->str() : "?");
      return false;
    }

    if (success) {
      task->result = result.is_null() ? nlohmann::json::object()
                                      : std::move(result);
    } else {
      task->error = error.empty() ? std::string{"unknown error"}
                                  : std::move(error);
    }
    settle_locked(*task,
                  success ? TaskStatus::Completed : TaskStatus::Failed, now,
                  events);
    workers_.mark_idle(worker_id, true, now);
  }

  dispatch(std::move(events));
  return true;
}

auto Scheduler::cancel(const TaskId& task_id) -> Result<bool> {
  auto now = Clock::now();
  Events events;
  {
    std::lock_guard lock(mu_);
    auto* task = tasks_.find(task_id);
    if (task == nullptr) {
      log::debug("cancel: no {} {}", TaskId::kind(), task_id);
      return fail(Error::NotFound);
    }
    if (task->terminal()) {
      return false;
    }

    auto worker = task->worker_id;
    queue_.remove(task_id);
    settle_locked(*task, TaskStatus::Cancelled, now, events);
    if (worker) {
      workers_.mark_idle(*worker, false, now);
    }
  }

  log::info("Task {} cancelled", task_id);
  dispatch(std::move(events));
  return true;
}

auto Scheduler::create_batch(BatchRequest request) -> Result<BatchId> {
  if (request.user_id.empty() || request.symbols.empty()) {
    return fail(Error::InvalidInput);
  }
  if (std::ranges::any_of(request.symbols,
                          [](const auto& s) { return s.empty(); })) {
    return fail(Error::InvalidInput);
  }
  if (std::cmp_greater(request.symbols.size(), config_.max_batch_size)) {
    return fail(Error::BatchTooLarge);
  }

  auto now = Clock::now();
  Events events;
  Batch batch;
  batch.id = BatchId::generate();
  batch.user_id = request.user_id;
  batch.total_tasks = static_cast<int>(request.symbols.size());
  batch.priority = request.priority;
  batch.created_at = now;
  batch.task_ids.reserve(request.symbols.size());

  {
    std::lock_guard lock(mu_);
    if (!admission_.can_admit(request.user_id)) {
      return fail(Error::AdmissionDenied);
    }

    std::vector<Task> members;
    members.reserve(request.symbols.size());
    for (auto& symbol : request.symbols) {
      auto task = make_task(request.user_id, std::move(symbol),
                            request.parameters, request.priority, batch.id,
                            now);
      batch.task_ids.push_back(task.id);
      members.push_back(std::move(task));
    }

    batches_.insert(batch);
    mirror(batch);
    emit_locked(events,
                SchedulerEvent::for_batch(EventKind::BatchCreated, batch, now));
    for (auto& task : members) {
      admit_locked(std::move(task), now, events);
    }
  }

  log::info("Batch {} created for user {} with {} task(s)", batch.id,
            batch.user_id, batch.total_tasks);
  dispatch(std::move(events));
  return batch.id;
}

auto Scheduler::get_batch_status(const BatchId& batch_id) const
    -> Result<Batch> {
  std::lock_guard lock(mu_);
  const auto* batch = batches_.find(batch_id);
  if (batch == nullptr) {
    return fail(Error::NotFound);
  }
  return *batch;
}

auto Scheduler::cancel_batch(const BatchId& batch_id) -> Result<std::size_t> {
  auto now = Clock::now();
  Events events;
  std::size_t cancelled = 0;
  {
    std::lock_guard lock(mu_);
    auto* batch = batches_.find(batch_id);
    if (batch == nullptr) {
      log::debug("cancel_batch: no {} {}", BatchId::kind(), batch_id);
      return fail(Error::NotFound);
    }
    if (batch->terminal()) {
      return std::size_t{0};
    }

    for (const auto& id : batch->task_ids) {
      auto* task = tasks_.find(id);
      if (task == nullptr || task->terminal()) {
        continue;
      }
      if (task->worker_id) {
        workers_.mark_idle(*task->worker_id, false, now);
      }
      queue_.remove(id);
      settle_locked(*task, TaskStatus::Cancelled, now, events, false);
      ++cancelled;
    }

    if (batches_.finalize(batch_id, BatchStatus::Cancelled, now)) {
      mirror(*batch);
      emit_locked(events, SchedulerEvent::for_batch(EventKind::BatchFinished,
                                                    *batch, now));
    }
  }

  log::info("Batch {} cancelled ({} task(s))", batch_id, cancelled);
  dispatch(std::move(events));
  return cancelled;
}

auto Scheduler::get_task(const TaskId& task_id) const -> Result<Task> {
  std::lock_guard lock(mu_);
  const auto* task = tasks_.find(task_id);
  if (task == nullptr) {
    return fail(Error::NotFound);
  }
  return *task;
}

auto Scheduler::list_batch_tasks(const BatchId& batch_id) const
    -> Result<std::vector<Task>> {
  std::lock_guard lock(mu_);
  const auto* batch = batches_.find(batch_id);
  if (batch == nullptr) {
    return fail(Error::NotFound);
  }
  std::vector<Task> out;
  out.reserve(batch->task_ids.size());
  for (const auto& id : batch->task_ids) {
    if (const auto* task = tasks_.find(id)) {
      out.push_back(*task);
    }
  }
  return out;
}

auto Scheduler::sweep_expired(TimePoint now) -> std::size_t {
  Events events;
  std::size_t handled = 0;
  {
    std::lock_guard lock(mu_);
    for (const auto& id : leases_.sweep(now)) {
      auto* task = tasks_.find(id);
      if (task == nullptr || task->status != TaskStatus::Processing) {
        continue;
      }
      if (task->worker_id) {
        workers_.mark_idle(*task->worker_id, false, now);
      }
      expire_locked(*task, now, events);
      ++handled;
    }
  }

  dispatch(std::move(events));
  return handled;
}

auto Scheduler::purge_finished(TimePoint cutoff) -> std::size_t {
  std::lock_guard lock(mu_);
  auto task_ids = tasks_.purge_finished(cutoff);
  auto batch_ids = batches_.purge_finished(cutoff);
  if (mirror_ != nullptr) {
    mirror_->purge_finished_before(cutoff);
  }
  if (!task_ids.empty() || !batch_ids.empty()) {
    log::debug("Purged {} task(s) and {} batch(es) finished before {}",
               task_ids.size(), batch_ids.size(), format_timestamp(cutoff));
  }
  return task_ids.size();
}

auto Scheduler::restore(std::vector<Task> tasks, std::vector<Batch> batches)
    -> std::size_t {
  auto now = Clock::now();
  Events events;
  std::size_t queued = 0;

  std::ranges::stable_sort(tasks, {}, &Task::enqueued_at);
  {
    std::lock_guard lock(mu_);
    for (auto& batch : batches) {
      batches_.insert(std::move(batch));
    }

    for (auto& t : tasks) {
      auto id = t.id;
      bool was_processing = t.status == TaskStatus::Processing;
      bool terminal = t.terminal();
      if (!tasks_.insert(std::move(t))) {
        log::warn("Skipping duplicate task {} during restore", id);
        continue;
      }
      if (terminal) {
        continue;
      }

      auto& task = *tasks_.find(id);
      if (was_processing) {
        expire_locked(task, now, events);
      } else {
        queue_.push(id, task.priority);
      }
      if (task.status == TaskStatus::Queued) {
        ++queued;
      }
    }
  }

  dispatch(std::move(events));
  return queued;
}

auto Scheduler::get_queue_stats() const -> QueueStats {
  std::lock_guard lock(mu_);
  return queue_stats_locked();
}

auto Scheduler::get_batch_queue_stats() const -> BatchQueueStats {
  std::lock_guard lock(mu_);
  return BatchQueueStats{
      .tasks = queue_stats_locked(),
      .active_batches = batches_.count(BatchStatus::Processing),
      .completed_batches = batches_.count(BatchStatus::Completed) +
                           batches_.count(BatchStatus::Failed) +
                           batches_.count(BatchStatus::Cancelled),
      .pending_batches = batches_.count(BatchStatus::Pending),
  };
}

auto Scheduler::queue_stats_locked() const -> QueueStats {
  return QueueStats{
      .queued = tasks_.count(TaskStatus::Queued),
      .processing = tasks_.count(TaskStatus::Processing),
      .completed = tasks_.count(TaskStatus::Completed),
      .failed = tasks_.count(TaskStatus::Failed),
      .cancelled = tasks_.count(TaskStatus::Cancelled),
      .total = tasks_.size(),
  };
}

auto Scheduler::get_user_queue_status(std::string_view user_id) const
    -> UserQueueStatus {
  std::lock_guard lock(mu_);
  return UserQueueStatus{
      .processing = admission_.in_flight(user_id),
      .concurrent_limit = admission_.user_limit(),
      .available_slots = admission_.available_slots(user_id),
  };
}

auto Scheduler::set_limits(int user_limit, int global_limit) -> void {
  std::lock_guard lock(mu_);
  admission_.set_limits(user_limit, global_limit);
  config_.user_concurrent_limit = user_limit;
  config_.global_concurrent_limit = global_limit;
  log::info("Concurrency limits set to user={} global={}", user_limit,
            global_limit);
}

auto Scheduler::settle_locked(Task& task, TaskStatus status, TimePoint now,
                              Events& events, bool finalize_batch) -> void {
  tasks_.set_status(task, status);
  if (status == TaskStatus::Cancelled) {
    task.cancelled_at = now;
  } else {
    task.completed_at = now;
  }

  leases_.release(task.id);
  admission_.release(task.id);

  auto kind = status == TaskStatus::Completed ? EventKind::TaskCompleted
              : status == TaskStatus::Failed  ? EventKind::TaskFailed
                                              : EventKind::TaskCancelled;
  emit_locked(events, SchedulerEvent::for_task(kind, task, now));
  task.worker_id.reset();
  mirror(task);

  if (!task.batch_id) {
    return;
  }
  const auto& batch_id = *task.batch_id;
  if (!finalize_batch) {
    batches_.count_outcome(batch_id, status);
    return;
  }
  bool finished = batches_.record_outcome(batch_id, status, now);
  if (const auto* batch = batches_.find(batch_id)) {
    mirror(*batch);
    if (finished) {
      log::info("Batch {} finished: {} ({}/{} completed, {} failed)",
                batch_id, batch_status_name(batch->status),
                batch->completed_tasks, batch->total_tasks,
                batch->failed_tasks);
      emit_locked(events, SchedulerEvent::for_batch(EventKind::BatchFinished,
                                                    *batch, now));
    }
  }
}

auto Scheduler::expire_locked(Task& task, TimePoint now, Events& events)
    -> void {
  leases_.release(task.id);
  admission_.release(task.id);

  if (config_.max_retries && task.retry_count >= *config_.max_retries) {
    task.error = std::format("lease expired after {} retries",
                             task.retry_count);
    log::warn("Task {} failed: {}", task.id, *task.error);
    settle_locked(task, TaskStatus::Failed, now, events);
    return;
  }

  log::info("Task {} lease expired on worker {}, requeueing (retry {})",
            task.id, task.worker_id ? task.worker_id->str() : "?",
            task.retry_count + 1);
  ++task.retry_count;
  task.requeued_at = now;
  task.worker_id.reset();
  tasks_.set_status(task, TaskStatus::Queued);
  queue_.push(task.id, task.priority);
  mirror(task);
  emit_locked(events,
              SchedulerEvent::for_task(EventKind::TaskRequeued, task, now));
}

auto Scheduler::lease_duration(const Task& task) const
    -> LeaseManager::Duration {
  return std::chrono::duration_cast<LeaseManager::Duration>(
      task.lease_timeout.value_or(config_.visibility_timeout()));
}

auto Scheduler::mirror(const Task& task) -> void {
  if (mirror_ != nullptr) {
    mirror_->save_task(task);
  }
}

auto Scheduler::mirror(const Batch& batch) -> void {
  if (mirror_ != nullptr) {
    mirror_->save_batch(batch);
  }
}

auto Scheduler::emit_locked(Events& events, SchedulerEvent event) -> void {
  event.sequence = ++next_sequence_;
  events.push_back(std::move(event));
}

auto Scheduler::dispatch(Events events) -> void {
  if (events.empty()) {
    return;
  }

  std::unique_lock lock(dispatch_mu_);
  for (auto& e : events) {
    auto seq = e.sequence;
    pending_.emplace(seq, std::move(e));
  }
  // Whoever is already delivering picks these up once the gap closes.
  if (delivering_) {
    return;
  }

  delivering_ = true;
  while (!pending_.empty() && pending_.begin()->first == delivered_ + 1) {
    auto node = pending_.extract(pending_.begin());
    ++delivered_;
    lock.unlock();
    if (listener_) {
      try {
        listener_(node.mapped());
      } catch (const std::exception& e) {
        log::error("Event listener failed on {} #{}: {}",
                   event_kind_name(node.mapped().kind), node.key(), e.what());
      }
    }
    lock.lock();
  }
  delivering_ = false;
}

}  // namespace batchq
