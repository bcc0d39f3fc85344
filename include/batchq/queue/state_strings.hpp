#pragma once

#include "batchq/queue/batch.hpp"
#include "batchq/queue/task.hpp"
#include "batchq/queue/worker_registry.hpp"

#include <algorithm>
#include <array>
#include <optional>
#include <ranges>
#include <string_view>
#include <utility>

namespace batchq {

namespace detail {

constexpr std::array<std::string_view, 5> kTaskStatusNames = {
    "queued", "processing", "completed", "failed", "cancelled",
};

constexpr std::array<std::string_view, 5> kBatchStatusNames = {
    "pending", "processing", "completed", "failed", "cancelled",
};

constexpr std::array<std::string_view, 4> kPriorityNames = {
    "low", "normal", "high", "urgent",
};

constexpr std::array<std::string_view, 2> kWorkerStatusNames = {
    "idle", "busy",
};

template <typename E, std::size_t N>
[[nodiscard]] constexpr auto name_of(
    const std::array<std::string_view, N>& names, E value) noexcept
    -> const char* {
  auto idx = std::to_underlying(value);
  return idx < names.size() ? names[idx].data() : "unknown";
}

template <typename E, std::size_t N>
[[nodiscard]] constexpr auto parse_name(
    const std::array<std::string_view, N>& names, std::string_view name) noexcept
    -> std::optional<E> {
  auto it = std::ranges::find(names, name);
  if (it == names.end()) {
    return std::nullopt;
  }
  return static_cast<E>(std::ranges::distance(names.begin(), it));
}

}  // namespace detail

[[nodiscard]] inline auto task_status_name(TaskStatus status) noexcept
    -> const char* {
  return detail::name_of(detail::kTaskStatusNames, status);
}

[[nodiscard]] inline auto parse_task_status(std::string_view name) noexcept
    -> std::optional<TaskStatus> {
  return detail::parse_name<TaskStatus>(detail::kTaskStatusNames, name);
}

[[nodiscard]] inline auto batch_status_name(BatchStatus status) noexcept
    -> const char* {
  return detail::name_of(detail::kBatchStatusNames, status);
}

[[nodiscard]] inline auto parse_batch_status(std::string_view name) noexcept
    -> std::optional<BatchStatus> {
  return detail::parse_name<BatchStatus>(detail::kBatchStatusNames, name);
}

[[nodiscard]] inline auto priority_name(Priority priority) noexcept
    -> const char* {
  return detail::name_of(detail::kPriorityNames, priority);
}

// Accepts names ("high") and numeric levels ("2").
[[nodiscard]] inline auto parse_priority(std::string_view name) noexcept
    -> std::optional<Priority> {
  if (name.size() == 1 && name[0] >= '0' && name[0] <= '3') {
    return static_cast<Priority>(name[0] - '0');
  }
  return detail::parse_name<Priority>(detail::kPriorityNames, name);
}

[[nodiscard]] inline auto worker_status_name(WorkerStatus status) noexcept
    -> const char* {
  return detail::name_of(detail::kWorkerStatusNames, status);
}

}  // namespace batchq
