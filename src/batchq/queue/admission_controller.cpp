#include "batchq/queue/admission_controller.hpp"

#include <algorithm>

namespace batchq {

AdmissionController::AdmissionController(int user_limit, int global_limit)
    : user_limit_(user_limit), global_limit_(global_limit) {}

auto AdmissionController::can_admit(std::string_view user_id) const -> bool {
  return global_ < global_limit_ && in_flight(user_id) < user_limit_;
}

auto AdmissionController::try_admit(std::string_view user_id,
                                    const TaskId& task_id) -> bool {
  if (holders_.contains(task_id)) {
    return true;
  }
  if (!can_admit(user_id)) {
    return false;
  }
  ++global_;
  if (auto it = per_user_.find(user_id); it != per_user_.end()) {
    ++it->second;
  } else {
    per_user_.emplace(std::string(user_id), 1);
  }
  holders_.emplace(task_id, std::string(user_id));
  return true;
}

auto AdmissionController::release(const TaskId& task_id) -> bool {
  auto holder = holders_.find(task_id);
  if (holder == holders_.end()) {
    return false;
  }
  --global_;
  if (auto it = per_user_.find(holder->second); it != per_user_.end()) {
    if (--it->second <= 0) {
      per_user_.erase(it);
    }
  }
  holders_.erase(holder);
  return true;
}

auto AdmissionController::holds(const TaskId& task_id) const -> bool {
  return holders_.contains(task_id);
}

auto AdmissionController::in_flight(std::string_view user_id) const -> int {
  auto it = per_user_.find(user_id);
  return it == per_user_.end() ? 0 : it->second;
}

auto AdmissionController::available_slots(std::string_view user_id) const
    -> int {
  return std::max(0, user_limit_ - in_flight(user_id));
}

auto AdmissionController::set_limits(int user_limit, int global_limit) -> void {
  user_limit_ = user_limit;
  global_limit_ = global_limit;
}

}  // namespace batchq
