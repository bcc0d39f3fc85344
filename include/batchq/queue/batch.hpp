#pragma once

#include "batchq/queue/task.hpp"

#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace batchq {

enum class BatchStatus : std::uint8_t {
  Pending,
  Processing,
  Completed,
  Failed,
  Cancelled,
};

[[nodiscard]] constexpr auto is_terminal(BatchStatus status) noexcept -> bool {
  return status == BatchStatus::Completed || status == BatchStatus::Failed ||
         status == BatchStatus::Cancelled;
}

struct BatchRequest {
  std::string user_id;
  std::vector<std::string> symbols;
  Parameters parameters = Parameters::object();
  Priority priority{Priority::Normal};
};

struct Batch {
  BatchId id;
  std::string user_id;
  std::vector<TaskId> task_ids;
  int total_tasks{0};
  int completed_tasks{0};
  int failed_tasks{0};
  int cancelled_tasks{0};
  BatchStatus status{BatchStatus::Pending};
  Priority priority{Priority::Normal};

  TimePoint created_at{};
  std::optional<TimePoint> started_at;
  std::optional<TimePoint> finished_at;

  [[nodiscard]] auto terminal() const noexcept -> bool {
    return is_terminal(status);
  }

  [[nodiscard]] auto settled() const noexcept -> int {
    return completed_tasks + failed_tasks + cancelled_tasks;
  }

  // Percentage of members that finished with a result or an error.
  [[nodiscard]] auto progress() const noexcept -> int {
    if (total_tasks <= 0) {
      return 0;
    }
    return static_cast<int>(std::lround(
        static_cast<double>(completed_tasks + failed_tasks) * 100.0 /
        static_cast<double>(total_tasks)));
  }
};

}  // namespace batchq
