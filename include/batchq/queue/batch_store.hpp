#pragma once

#include "batchq/queue/batch.hpp"

#include <cstddef>
#include <unordered_map>
#include <vector>

namespace batchq {

// Owns Batch records and derives their status from member outcomes.
// Not synchronized.
class BatchStore {
public:
  auto insert(Batch batch) -> bool;

  [[nodiscard]] auto find(const BatchId& id) -> Batch*;
  [[nodiscard]] auto find(const BatchId& id) const -> const Batch*;

  // Pending -> Processing on the first member dequeue.
  auto mark_processing(const BatchId& id, TimePoint now) -> bool;

  // Counts one terminal member outcome. Returns true when this outcome
  // settled the last member and finalised the batch.
  auto record_outcome(const BatchId& id, TaskStatus outcome, TimePoint now)
      -> bool;

  // Counts an outcome without finalising; paired with finalize().
  auto count_outcome(const BatchId& id, TaskStatus outcome) -> bool;

  // Forces a terminal status. False if the batch was already terminal.
  auto finalize(const BatchId& id, BatchStatus status, TimePoint now) -> bool;

  auto purge_finished(TimePoint cutoff) -> std::vector<BatchId>;

  [[nodiscard]] auto count(BatchStatus status) const -> std::size_t;
  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return batches_.size();
  }

  template <typename Fn>
  auto for_each(Fn&& fn) const -> void {
    for (const auto& [_, batch] : batches_) {
      fn(batch);
    }
  }

private:
  static auto apply_outcome(Batch& batch, TaskStatus outcome) -> bool;

  std::unordered_map<BatchId, Batch> batches_;
};

}  // namespace batchq
