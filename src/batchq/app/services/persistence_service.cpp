#include "batchq/app/services/persistence_service.hpp"

#include "batchq/util/log.hpp"

#include <chrono>
#include <mutex>
#include <shared_mutex>
#include <type_traits>
#include <vector>

namespace batchq {

PersistenceService::PersistenceService(std::string_view db_path)
    : db_(std::make_unique<Persistence>(db_path)) {}

PersistenceService::~PersistenceService() {
  stop();
  close();
}

auto PersistenceService::open() -> Result<void> {
  return db_->open();
}

auto PersistenceService::close() -> void {
  if (db_) {
    db_->close();
  }
}

auto PersistenceService::is_open() const -> bool {
  return db_ && db_->is_open();
}

auto PersistenceService::persistence() -> Persistence* {
  return db_.get();
}

auto PersistenceService::start() -> void {
  std::lock_guard inline_lock(inline_mu_);
  {
    std::unique_lock gate(gate_);
    if (running_.exchange(true))
      return;
  }
  writer_ = std::thread([this] { writer_loop(); });
}

auto PersistenceService::stop() -> void {
  // Held until the writer is joined: late submitters queue up behind it and
  // apply inline only after every earlier write has landed.
  std::lock_guard inline_lock(inline_mu_);
  {
    std::unique_lock gate(gate_);
    if (!running_.exchange(false))
      return;
  }
  if (writer_.joinable()) {
    writer_.join();
  }
  if (auto n = dropped(); n > 0) {
    log::warn("Persistence dropped {} write(s) while the queue was full", n);
  }
}

auto PersistenceService::flush() -> void {
  auto target = submitted_.load(std::memory_order_acquire);
  while (running_.load(std::memory_order_acquire) &&
         applied_.load(std::memory_order_acquire) < target) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
}

auto PersistenceService::save_task(const Task& task) -> void {
  submit(SaveTask{task});
}

auto PersistenceService::save_batch(const Batch& batch) -> void {
  submit(SaveBatch{batch});
}

auto PersistenceService::purge_finished_before(TimePoint cutoff) -> void {
  submit(Purge{cutoff});
}

auto PersistenceService::submit(Write write) -> void {
  if (!is_open()) {
    return;
  }
  {
    std::shared_lock gate(gate_);
    if (running_.load(std::memory_order_acquire)) {
      push(std::move(write));
      return;
    }
  }

  // No writer (recovery, tests, shutdown): apply inline. running_ only
  // changes under inline_mu_, so re-check it here.
  std::lock_guard inline_lock(inline_mu_);
  if (running_.load(std::memory_order_acquire)) {
    push(std::move(write));
    return;
  }
  apply(write);
}

auto PersistenceService::push(Write write) -> void {
  if (!queue_.push(std::move(write))) {
    if (dropped_.fetch_add(1, std::memory_order_relaxed) % 1000 == 0) {
      log::warn("Persistence queue full, dropping write");
    }
    return;
  }
  submitted_.fetch_add(1, std::memory_order_release);
}

auto PersistenceService::writer_loop() -> void {
  log::set_thread_label("db-writer");
  std::vector<Write> batch;
  batch.reserve(64);

  while (running_.load(std::memory_order_acquire)) {
    batch.clear();
    if (queue_.drain(batch, 64) == 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
      continue;
    }
    apply_all(batch);
  }

  batch.clear();
  queue_.drain(batch, queue_.capacity());
  apply_all(batch);
}

auto PersistenceService::apply_all(std::vector<Write>& batch) -> void {
  if (batch.empty()) {
    return;
  }
  bool in_tx = batch.size() > 1 && db_->begin_transaction().has_value();
  for (const auto& w : batch) {
    apply(w);
  }
  if (in_tx) {
    if (auto r = db_->commit_transaction(); !r) {
      log::warn("Failed to commit persistence batch: {}", r.error().message());
      if (auto rb = db_->rollback_transaction(); !rb) {
        log::warn("Rollback failed: {}", rb.error().message());
      }
    }
  }
  applied_.fetch_add(batch.size(), std::memory_order_release);
}

auto PersistenceService::apply(const Write& write) -> void {
  std::visit(
      [this](const auto& w) {
        using T = std::decay_t<decltype(w)>;
        if constexpr (std::is_same_v<T, SaveTask>) {
          if (auto r = db_->save_task(w.task); !r) {
            log::warn("Failed to persist task {}: {}", w.task.id,
                      r.error().message());
          }
        } else if constexpr (std::is_same_v<T, SaveBatch>) {
          if (auto r = db_->save_batch(w.batch); !r) {
            log::warn("Failed to persist batch {}: {}", w.batch.id,
                      r.error().message());
          }
        } else {
          if (auto r = db_->purge_finished_before(w.cutoff); !r) {
            log::warn("Failed to purge finished records: {}",
                      r.error().message());
          } else if (*r > 0) {
            log::debug("Purged {} stored task(s)", *r);
          }
        }
      },
      write);
}

}  // namespace batchq
