#pragma once

#include "batchq/scheduler/events.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string_view>

namespace batchq {

// Turns scheduler lifecycle events into JSON records
class EventService {
public:
  using Sink = std::move_only_function<void(std::string_view line)>;

  EventService() = default;
  ~EventService() = default;

  EventService(const EventService&) = delete;
  auto operator=(const EventService&) -> EventService& = delete;

  auto set_sink(Sink sink) -> void;

  // Safe to call from any thread; sink calls are serialized.
  auto on_event(const SchedulerEvent& event) -> void;

  [[nodiscard]] static auto to_json(const SchedulerEvent& event)
      -> nlohmann::json;

  [[nodiscard]] auto count(EventKind kind) const noexcept -> std::uint64_t {
    return counts_[static_cast<std::size_t>(kind)].load(
        std::memory_order_relaxed);
  }

private:
  std::mutex sink_mu_;
  Sink sink_;
  std::array<std::atomic<std::uint64_t>, 8> counts_{};
};

}  // namespace batchq
