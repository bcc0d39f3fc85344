#include "batchq/queue/priority_queue.hpp"

namespace batchq {

auto PriorityQueue::push(const TaskId& id, Priority priority) -> bool {
  if (index_.contains(id)) {
    return false;
  }
  auto& band = bands_[band_index(priority)];
  auto it = band.insert(band.end(), id);
  index_.emplace(id, Position{priority, it});
  return true;
}

auto PriorityQueue::push_front(const TaskId& id, Priority priority) -> bool {
  if (index_.contains(id)) {
    return false;
  }
  auto& band = bands_[band_index(priority)];
  auto it = band.insert(band.begin(), id);
  index_.emplace(id, Position{priority, it});
  return true;
}

auto PriorityQueue::pop() -> std::optional<Entry> {
  for (std::size_t i = kPriorityLevels; i-- > 0;) {
    auto& band = bands_[i];
    if (band.empty()) {
      continue;
    }
    Entry entry{std::move(band.front()), static_cast<Priority>(i)};
    band.pop_front();
    index_.erase(entry.id);
    return entry;
  }
  return std::nullopt;
}

auto PriorityQueue::peek() const -> std::optional<Entry> {
  for (std::size_t i = kPriorityLevels; i-- > 0;) {
    if (!bands_[i].empty()) {
      return Entry{bands_[i].front(), static_cast<Priority>(i)};
    }
  }
  return std::nullopt;
}

auto PriorityQueue::remove(const TaskId& id) -> bool {
  auto it = index_.find(id);
  if (it == index_.end()) {
    return false;
  }
  bands_[band_index(it->second.priority)].erase(it->second.it);
  index_.erase(it);
  return true;
}

auto PriorityQueue::contains(const TaskId& id) const -> bool {
  return index_.contains(id);
}

auto PriorityQueue::size() const noexcept -> std::size_t {
  return index_.size();
}

auto PriorityQueue::size(Priority priority) const noexcept -> std::size_t {
  return bands_[band_index(priority)].size();
}

auto PriorityQueue::empty() const noexcept -> bool {
  return index_.empty();
}

auto PriorityQueue::clear() -> void {
  for (auto& band : bands_) {
    band.clear();
  }
  index_.clear();
}

}  // namespace batchq
