#include "batchq/app/services/event_service.hpp"

#include "batchq/queue/state_strings.hpp"
#include "batchq/util/log.hpp"
#include "batchq/util/util.hpp"

#include <string>

namespace batchq {

auto EventService::set_sink(Sink sink) -> void {
  std::lock_guard lock(sink_mu_);
  sink_ = std::move(sink);
}

auto EventService::to_json(const SchedulerEvent& event) -> nlohmann::json {
  nlohmann::json j = {{"type", std::string(event_kind_name(event.kind))},
                      {"user_id", event.user_id},
                      {"timestamp", to_unix_ms(event.timestamp)},
                      {"seq", event.sequence}};

  if (!event.task_id.empty()) {
    j["task_id"] = event.task_id.str();
    j["symbol"] = event.symbol;
    j["retry_count"] = event.retry_count;
  }
  if (event.batch_id) {
    j["batch_id"] = event.batch_id->str();
  }
  if (event.task_status) {
    j["status"] = std::string(task_status_name(*event.task_status));
  } else if (event.batch_status) {
    j["status"] = std::string(batch_status_name(*event.batch_status));
    j["progress"] = event.progress;
  }
  if (event.worker_id) {
    j["worker_id"] = event.worker_id->str();
  }
  if (event.error) {
    j["error"] = *event.error;
  }
  return j;
}

auto EventService::on_event(const SchedulerEvent& event) -> void {
  counts_[static_cast<std::size_t>(event.kind)].fetch_add(
      1, std::memory_order_relaxed);

  auto line = to_json(event).dump();
  log::debug("event {}", line);

  std::lock_guard lock(sink_mu_);
  if (sink_) {
    sink_(line);
  }
}

}  // namespace batchq
