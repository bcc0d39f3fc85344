#pragma once

#include "batchq/config/system_config.hpp"
#include "batchq/queue/task.hpp"
#include "batchq/util/id.hpp"

#include <chrono>
#include <cstring>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <thread>

#include <unistd.h>

namespace batchq::test {

[[nodiscard]] inline auto task_id(std::string_view s) -> TaskId {
  return TaskId{std::string{s}};
}

[[nodiscard]] inline auto batch_id(std::string_view s) -> BatchId {
  return BatchId{std::string{s}};
}

[[nodiscard]] inline auto worker_id(std::string_view s) -> WorkerId {
  return WorkerId{std::string{s}};
}

[[nodiscard]] inline auto request(std::string_view user, std::string_view symbol,
                                  Priority priority = Priority::Normal)
    -> TaskRequest {
  return TaskRequest{.user_id = std::string{user},
                     .symbol = std::string{symbol},
                     .priority = priority};
}

// Limits high enough that admission never interferes unless a test lowers
// them; the sweeper interval is long so tests drive sweeps by hand.
[[nodiscard]] inline auto queue_config(int user_limit = 10,
                                       int global_limit = 100) -> QueueConfig {
  QueueConfig config;
  config.user_concurrent_limit = user_limit;
  config.global_concurrent_limit = global_limit;
  config.visibility_timeout_sec = 300;
  config.sweep_interval_ms = 60'000;
  return config;
}

// Polls `pred` until it holds or `timeout` elapses.
inline auto wait_until(const std::function<bool()>& pred,
                       std::chrono::milliseconds timeout =
                           std::chrono::milliseconds(5000)) -> bool {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return pred();
}

inline void sleep_ms(std::chrono::milliseconds ms) {
  std::this_thread::sleep_for(ms);
}

// Unique path under /tmp, removed (with WAL side files) on destruction.
class TempDbPath {
public:
  TempDbPath() {
    std::string pattern = "/tmp/batchq_test_XXXXXX";
    int fd = ::mkstemp(pattern.data());
    if (fd >= 0) {
      ::close(fd);
      path_ = pattern + ".db";
      std::filesystem::rename(pattern, path_);
    }
  }

  ~TempDbPath() {
    if (path_.empty()) {
      return;
    }
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    std::filesystem::remove(path_ + "-wal", ec);
    std::filesystem::remove(path_ + "-shm", ec);
  }

  TempDbPath(const TempDbPath&) = delete;
  auto operator=(const TempDbPath&) -> TempDbPath& = delete;

  [[nodiscard]] auto str() const -> const std::string& { return path_; }
  [[nodiscard]] auto valid() const -> bool { return !path_.empty(); }

private:
  std::string path_;
};

}  // namespace batchq::test
