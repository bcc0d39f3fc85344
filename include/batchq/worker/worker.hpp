#pragma once

#include "batchq/util/id.hpp"
#include "batchq/worker/analysis_engine.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>

namespace batchq {

class Scheduler;
struct Task;

struct WorkerOptions {
  WorkerId id;
  std::string type{"analysis"};
  std::chrono::milliseconds poll_interval{200};
  std::chrono::milliseconds heartbeat_interval{1000};
};

// Polls the scheduler, runs the engine and acks, on its own thread.
class Worker {
public:
  Worker(Scheduler& scheduler, IAnalysisEngine& engine, WorkerOptions options);
  ~Worker();

  Worker(const Worker&) = delete;
  auto operator=(const Worker&) -> Worker& = delete;

  auto start() -> void;
  // Interrupts the poll wait and any stop-aware analysis, then joins.
  auto stop() -> void;

  // Wakes the worker if it is idle-waiting.
  auto notify() -> void;

  [[nodiscard]] auto id() const noexcept -> const WorkerId& {
    return options_.id;
  }
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return thread_.joinable();
  }
  [[nodiscard]] auto processed() const noexcept -> std::uint64_t {
    return processed_.load(std::memory_order_relaxed);
  }

private:
  auto run(std::stop_token stop) -> void;
  auto process(const Task& task, std::stop_token stop) -> void;

  Scheduler& scheduler_;
  IAnalysisEngine& engine_;
  WorkerOptions options_;

  std::mutex mu_;
  std::condition_variable_any cv_;
  bool woken_{false};
  std::atomic<std::uint64_t> processed_{0};
  std::jthread thread_;
};

}  // namespace batchq
