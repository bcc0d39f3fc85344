#include "batchq/worker/worker.hpp"

#include "batchq/scheduler/scheduler.hpp"
#include "batchq/util/log.hpp"
#include "batchq/util/util.hpp"

#include <exception>

namespace batchq {

Worker::Worker(Scheduler& scheduler, IAnalysisEngine& engine,
               WorkerOptions options)
    : scheduler_(scheduler), engine_(engine), options_(std::move(options)) {
  if (options_.id.empty()) {
    options_.id = WorkerId::generate();
  }
}

Worker::~Worker() {
  stop();
}

auto Worker::start() -> void {
  if (thread_.joinable())
    return;
  thread_ = std::jthread([this](std::stop_token st) { run(st); });
}

auto Worker::stop() -> void {
  if (!thread_.joinable())
    return;
  thread_.request_stop();
  thread_.join();
}

auto Worker::notify() -> void {
  {
    std::lock_guard lock(mu_);
    woken_ = true;
  }
  cv_.notify_one();
}

auto Worker::run(std::stop_token stop) -> void {
  log::set_thread_label(options_.id.str());
  auto now = Clock::now();
  scheduler_.workers().register_worker(WorkerInfo{.id = options_.id,
                                                  .type = options_.type,
                                                  .last_heartbeat = now,
                                                  .started_at = now});
  log::debug("Worker {} started ({}, engine {} {})", options_.id,
             options_.type, engine_.name(), engine_.version());

  auto last_heartbeat = now;
  while (!stop.stop_requested()) {
    now = Clock::now();
    if (now - last_heartbeat >= options_.heartbeat_interval) {
      scheduler_.workers().heartbeat(options_.id, std::nullopt, now);
      last_heartbeat = now;
    }

    if (auto task = scheduler_.dequeue(options_.id)) {
      process(*task, stop);
      last_heartbeat = Clock::now();
      continue;
    }

    std::unique_lock lock(mu_);
    cv_.wait_for(lock, stop, options_.poll_interval, [this] { return woken_; });
    woken_ = false;
  }

  scheduler_.workers().unregister_worker(options_.id);
  log::debug("Worker {} stopped after {} task(s)", options_.id, processed());
}

auto Worker::process(const Task& task, std::stop_token stop) -> void {
  AnalysisRequest request{
      .task_id = task.id,
      .user_id = task.user_id,
      .symbol = task.symbol,
      .parameters = task.parameters,
      .attempt = task.retry_count + 1,
  };

  AnalysisResult outcome;
  if (!engine_.is_available()) {
    outcome.error = make_error_code(Error::EngineUnavailable).message();
  } else {
    try {
      outcome = engine_.analyze(request, stop);
    } catch (const std::exception& e) {
      log::warn("Engine {} threw on task {}: {}", engine_.name(), task.id,
                e.what());
      outcome = AnalysisResult{.error = e.what()};
    }
  }

  if (outcome.interrupted) {
    // Left Processing; the lease or recovery requeues it.
    log::info("Worker {} interrupted on task {}", options_.id, task.id);
    return;
  }

  if (!scheduler_.ack(task.id, options_.id, outcome.success,
                      std::move(outcome.result), std::move(outcome.error))) {
    log::debug("Ack for task {} ignored (cancelled or lease expired)",
               task.id);
  }
  processed_.fetch_add(1, std::memory_order_relaxed);
}

}  // namespace batchq
