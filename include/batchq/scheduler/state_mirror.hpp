#pragma once

#include "batchq/queue/batch.hpp"
#include "batchq/queue/task.hpp"

namespace batchq {

// Receives a copy of every mutated record. Called with the scheduler lock
// held, so implementations must not block or call back into the scheduler.
class StateMirror {
public:
  virtual ~StateMirror() = default;

  virtual auto save_task(const Task& task) -> void = 0;
  virtual auto save_batch(const Batch& batch) -> void = 0;
  virtual auto purge_finished_before(TimePoint cutoff) -> void = 0;
};

}  // namespace batchq
