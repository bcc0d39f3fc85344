#pragma once

#include "batchq/config/config.hpp"
#include "batchq/core/error.hpp"
#include "batchq/queue/batch.hpp"
#include "batchq/storage/recovery.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <vector>

namespace batchq {

class EventService;
class IAnalysisEngine;
class PersistenceService;
class Scheduler;
class Worker;

// Application facade - wires scheduler, persistence, events and workers
class Application {
public:
  explicit Application(Config config);
  ~Application();

  Application(const Application&) = delete;
  auto operator=(const Application&) -> Application& = delete;

  // Validates config, opens storage and builds the services.
  [[nodiscard]] auto init() -> Result<void>;

  // Reloads unfinished work; a no-op when storage is disabled.
  [[nodiscard]] auto recover_from_crash() -> Result<RecoveryResult>;

  [[nodiscard]] auto start() -> Result<void>;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  // create_batch plus a wake-up for idle workers.
  [[nodiscard]] auto submit_batch(BatchRequest request) -> Result<BatchId>;

  // Polls until the batch is terminal or `timeout` elapses; returns the last
  // snapshot either way.
  [[nodiscard]] auto wait_for_batch(const BatchId& batch_id,
                                    std::chrono::milliseconds timeout)
      -> Result<Batch>;

  [[nodiscard]] auto config() const noexcept -> const Config& {
    return config_;
  }
  [[nodiscard]] auto scheduler() -> Scheduler&;
  [[nodiscard]] auto events() -> EventService&;
  [[nodiscard]] auto persistence() -> PersistenceService*;

private:
  auto notify_workers() -> void;

  std::atomic<bool> running_{false};
  bool initialized_{false};
  Config config_;

  std::unique_ptr<PersistenceService> persistence_;
  std::unique_ptr<EventService> events_;
  std::unique_ptr<Scheduler> scheduler_;
  std::unique_ptr<IAnalysisEngine> engine_;
  std::vector<std::unique_ptr<Worker>> workers_;
};

}  // namespace batchq
