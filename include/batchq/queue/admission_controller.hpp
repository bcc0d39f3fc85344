#pragma once

#include "batchq/core/error.hpp"
#include "batchq/util/id.hpp"

#include <string>
#include <string_view>
#include <unordered_map>

namespace batchq {

// Per-user and global in-flight ceilings. A task holds at most one slot, so
// release() is idempotent per task. Not synchronized.
class AdmissionController {
public:
  AdmissionController(int user_limit, int global_limit);

  [[nodiscard]] auto can_admit(std::string_view user_id) const -> bool;

  // Takes a slot for `task_id` if both ceilings allow it.
  [[nodiscard]] auto try_admit(std::string_view user_id, const TaskId& task_id)
      -> bool;

  // False if `task_id` held no slot.
  auto release(const TaskId& task_id) -> bool;

  [[nodiscard]] auto holds(const TaskId& task_id) const -> bool;

  [[nodiscard]] auto in_flight() const noexcept -> int { return global_; }
  [[nodiscard]] auto in_flight(std::string_view user_id) const -> int;

  // Slots left for `user_id` under its own ceiling.
  [[nodiscard]] auto available_slots(std::string_view user_id) const -> int;

  [[nodiscard]] auto user_limit() const noexcept -> int { return user_limit_; }
  [[nodiscard]] auto global_limit() const noexcept -> int {
    return global_limit_;
  }

  // Lowering a limit never evicts; it only blocks new admissions.
  auto set_limits(int user_limit, int global_limit) -> void;

private:
  int user_limit_;
  int global_limit_;
  int global_{0};
  std::unordered_map<std::string, int, StringHash, StringEqual> per_user_;
  std::unordered_map<TaskId, std::string> holders_;
};

}  // namespace batchq
