#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace batchq {

struct SchedulerConfig {
  std::string log_level{"info"};
  std::string log_file;
};

struct QueueConfig {
  int user_concurrent_limit{3};
  int global_concurrent_limit{50};
  int visibility_timeout_sec{300};
  int sweep_interval_ms{5000};
  int task_cleanup_age_days{7};
  int cleanup_interval_sec{3600};
  int max_batch_size{100};
  // Unset: lease expiry requeues without bound.
  std::optional<int> max_retries;

  [[nodiscard]] auto visibility_timeout() const -> std::chrono::seconds {
    return std::chrono::seconds(visibility_timeout_sec);
  }
  [[nodiscard]] auto sweep_interval() const -> std::chrono::milliseconds {
    return std::chrono::milliseconds(sweep_interval_ms);
  }
  [[nodiscard]] auto cleanup_interval() const -> std::chrono::seconds {
    return std::chrono::seconds(cleanup_interval_sec);
  }
  [[nodiscard]] auto cleanup_age() const -> std::chrono::hours {
    return std::chrono::hours(24 * task_cleanup_age_days);
  }
};

struct StorageConfig {
  bool enabled{false};
  std::string db_file{"batchq.db"};
};

struct WorkerConfig {
  int count{4};
  std::string engine{"noop"};
  std::string type{"analysis"};
  int poll_interval_ms{200};
  int heartbeat_interval_ms{1000};
};

struct SystemConfig {
  SchedulerConfig scheduler;
  QueueConfig queue;
  StorageConfig storage;
  WorkerConfig workers;
};

}  // namespace batchq
