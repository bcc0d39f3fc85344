#pragma once

#include "batchq/util/id.hpp"
#include "batchq/util/util.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace batchq {

using Parameters = nlohmann::json;

enum class Priority : std::uint8_t {
  Low,
  Normal,
  High,
  Urgent,
};

inline constexpr std::size_t kPriorityLevels = 4;

enum class TaskStatus : std::uint8_t {
  Queued,
  Processing,
  Completed,
  Failed,
  Cancelled,
};

inline constexpr std::size_t kTaskStatusCount = 5;

[[nodiscard]] constexpr auto is_terminal(TaskStatus status) noexcept -> bool {
  return status == TaskStatus::Completed || status == TaskStatus::Failed ||
         status == TaskStatus::Cancelled;
}

struct TaskRequest {
  std::string user_id;
  std::string symbol;
  Parameters parameters = Parameters::object();
  Priority priority{Priority::Normal};
  std::optional<std::chrono::seconds> lease_timeout;
};

struct Task {
  TaskId id;
  std::string user_id;
  std::string symbol;
  Parameters parameters = Parameters::object();
  Priority priority{Priority::Normal};
  TaskStatus status{TaskStatus::Queued};

  std::optional<BatchId> batch_id;
  // Set only while Processing.
  std::optional<WorkerId> worker_id;

  TimePoint created_at{};
  TimePoint enqueued_at{};
  std::optional<TimePoint> started_at;
  std::optional<TimePoint> completed_at;
  std::optional<TimePoint> cancelled_at;
  std::optional<TimePoint> requeued_at;

  int retry_count{0};
  std::optional<std::chrono::seconds> lease_timeout;

  // At most one of these is set, and only once the task is terminal.
  std::optional<nlohmann::json> result;
  std::optional<std::string> error;

  [[nodiscard]] auto terminal() const noexcept -> bool {
    return is_terminal(status);
  }

  // Time the task left the system, for cleanup.
  [[nodiscard]] auto finished_at() const -> std::optional<TimePoint> {
    return status == TaskStatus::Cancelled ? cancelled_at : completed_at;
  }
};

}  // namespace batchq
