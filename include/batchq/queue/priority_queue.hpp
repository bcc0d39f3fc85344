#pragma once

#include "batchq/queue/task.hpp"

#include <array>
#include <cstddef>
#include <list>
#include <optional>
#include <unordered_map>

namespace batchq {

// Strict priority across bands, FIFO within a band. Not synchronized; the
// scheduler holds its mutex around every call.
class PriorityQueue {
public:
  struct Entry {
    TaskId id;
    Priority priority;
  };

  // Appends to the tail of the band. False if `id` is already queued.
  auto push(const TaskId& id, Priority priority) -> bool;

  // Puts a just-popped entry back at the head of its band.
  auto push_front(const TaskId& id, Priority priority) -> bool;

  [[nodiscard]] auto pop() -> std::optional<Entry>;
  [[nodiscard]] auto peek() const -> std::optional<Entry>;

  auto remove(const TaskId& id) -> bool;

  [[nodiscard]] auto contains(const TaskId& id) const -> bool;
  [[nodiscard]] auto size() const noexcept -> std::size_t;
  [[nodiscard]] auto size(Priority priority) const noexcept -> std::size_t;
  [[nodiscard]] auto empty() const noexcept -> bool;

  auto clear() -> void;

private:
  using Band = std::list<TaskId>;

  struct Position {
    Priority priority;
    Band::iterator it;
  };

  [[nodiscard]] static constexpr auto band_index(Priority p) noexcept
      -> std::size_t {
    return static_cast<std::size_t>(p);
  }

  std::array<Band, kPriorityLevels> bands_;
  std::unordered_map<TaskId, Position> index_;
};

}  // namespace batchq
