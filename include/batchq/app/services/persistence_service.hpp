#pragma once

#include "batchq/core/error.hpp"
#include "batchq/core/lockfree_queue.hpp"
#include "batchq/scheduler/state_mirror.hpp"
#include "batchq/storage/persistence.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string_view>
#include <thread>
#include <variant>

namespace batchq {

// Mirrors scheduler state into sqlite with fire-and-forget semantics: the
// scheduler pushes snapshots without blocking and a single writer thread
// applies them in order. Failures are logged, never propagated.
class PersistenceService : public StateMirror {
public:
  static constexpr std::size_t kQueueCapacity = 16384;

  explicit PersistenceService(std::string_view db_path);
  ~PersistenceService() override;

  PersistenceService(const PersistenceService&) = delete;
  auto operator=(const PersistenceService&) -> PersistenceService& = delete;

  [[nodiscard]] auto open() -> Result<void>;
  auto close() -> void;
  [[nodiscard]] auto is_open() const -> bool;

  auto start() -> void;
  // Drains pending writes, then joins the writer. Writes submitted while
  // stopping are applied inline once the writer is gone.
  auto stop() -> void;

  // Blocks until every write pushed so far has been applied.
  auto flush() -> void;

  // Direct access, only while the writer is stopped (recovery, CLI queries).
  [[nodiscard]] auto persistence() -> Persistence*;

  auto save_task(const Task& task) -> void override;
  auto save_batch(const Batch& batch) -> void override;
  auto purge_finished_before(TimePoint cutoff) -> void override;

  [[nodiscard]] auto dropped() const noexcept -> std::uint64_t {
    return dropped_.load(std::memory_order_relaxed);
  }

private:
  struct SaveTask {
    Task task;
  };
  struct SaveBatch {
    Batch batch;
  };
  struct Purge {
    TimePoint cutoff;
  };
  using Write = std::variant<SaveTask, SaveBatch, Purge>;

  auto submit(Write write) -> void;
  auto push(Write write) -> void;
  auto writer_loop() -> void;
  auto apply(const Write& write) -> void;
  auto apply_all(std::vector<Write>& batch) -> void;

  std::unique_ptr<Persistence> db_;
  BoundedMPSCQueue<Write> queue_{kQueueCapacity};
  std::atomic<bool> running_{false};
  std::thread writer_;
  // Producers hold gate_ shared while pushing; start and stop flip running_
  // under it exclusively, and under inline_mu_, which also serializes inline
  // writes.
  std::shared_mutex gate_;
  std::mutex inline_mu_;

  alignas(kCacheLineSize) std::atomic<std::uint64_t> submitted_{0};
  alignas(kCacheLineSize) std::atomic<std::uint64_t> applied_{0};
  std::atomic<std::uint64_t> dropped_{0};
};

}  // namespace batchq
