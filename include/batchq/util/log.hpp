#pragma once

#include "batchq/core/lockfree_queue.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <functional>
#include <iterator>
#include <mutex>
#include <optional>
#include <print>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace batchq::log {

enum class Level : std::uint8_t {
  Trace,
  Debug,
  Info,
  Warn,
  Error
};

[[nodiscard]] constexpr auto level_name(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view names[] = {"trace", "debug", "info", "warn",
                                        "error"};
  return names[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto level_color(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view colors[] = {
      "\033[90m",  // trace: gray
      "\033[36m",  // debug: cyan
      "\033[32m",  // info: green
      "\033[33m",  // warn: yellow
      "\033[31m"   // error: red
  };
  return colors[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto parse_level(std::string_view name) noexcept
    -> std::optional<Level> {
  constexpr Level levels[] = {Level::Trace, Level::Debug, Level::Info,
                              Level::Warn, Level::Error};
  for (auto level : levels) {
    if (level_name(level) == name) {
      return level;
    }
  }
  return std::nullopt;
}

// Per-thread render buffer and the label printed in each line.
struct alignas(64) ThreadState {
  std::string buffer;
  std::string label;
  ThreadState() { buffer.reserve(4096); }
};

inline thread_local ThreadState t_state;

// Async logger draining a BoundedMPSCQueue on a writer thread.
class Logger {
  static constexpr std::size_t QUEUE_CAPACITY = 8192;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> accepting_{false};
  std::atomic<std::uint64_t> overflowed_{0};
  BoundedMPSCQueue<std::string> queue_{QUEUE_CAPACITY};
  std::jthread writer_;

  // Guards out_; only touched by set_output_file and write().
  std::mutex out_mu_;
  std::FILE* out_{stdout};
  bool colored_{true};

  auto write(std::string_view msg) -> void {
    std::lock_guard lock(out_mu_);
    std::print(out_, "{}", msg);
  }

  auto flush() -> void {
    std::lock_guard lock(out_mu_);
    std::fflush(out_);
  }

  auto writer_loop(std::stop_token stop) -> void {
    std::vector<std::string> pending;
    pending.reserve(64);

    while (!stop.stop_requested()) {
      pending.clear();
      queue_.drain(pending, 64);

      for (const auto& msg : pending) {
        write(msg);
      }
      if (pending.empty()) {
        flush();
        std::this_thread::sleep_for(std::chrono::microseconds(200));
      }
    }

    // accepting_ is already false, nothing new can be pushed
    while (auto msg = queue_.try_pop()) {
      write(*msg);
    }
    flush();
  }

  template <typename... Args>
  auto render(std::string& buf, Level level, std::format_string<Args...> fmt,
              Args&&... args) -> void {
    auto time = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    const auto& label = t_state.label;
    std::string_view color = colored_ ? level_color(level) : "";
    std::string_view reset = colored_ ? "\033[0m" : "";
    std::format_to(std::back_inserter(buf), "[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] ",
                   time, color, level_name(level), reset);
    if (label.empty()) {
      std::format_to(std::back_inserter(buf), "[{}] ",
                     std::hash<std::thread::id>{}(std::this_thread::get_id()) %
                         1000000);
    } else {
      std::format_to(std::back_inserter(buf), "[{}] ", label);
    }
    std::format_to(std::back_inserter(buf), fmt, std::forward<Args>(args)...);
    buf.push_back('\n');
  }

public:
  Logger() = default;
  ~Logger() {
    stop();
    if (out_ != stdout) {
      std::fclose(out_);
    }
  }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  auto start() -> void {
    if (writer_.joinable())
      return;
    accepting_.store(true, std::memory_order_release);
    writer_ = std::jthread([this](std::stop_token st) { writer_loop(st); });
  }

  auto stop() -> void {
    accepting_.store(false, std::memory_order_release);
    std::atomic_thread_fence(std::memory_order_seq_cst);

    if (writer_.joinable()) {
      writer_.request_stop();
      writer_.join();
    }
  }

  // Lines that found the queue full and were written synchronously.
  [[nodiscard]] auto overflowed() const noexcept -> std::uint64_t {
    return overflowed_.load(std::memory_order_relaxed);
  }

  // Appends to `path`; plain text without color codes.
  [[nodiscard]] auto set_output_file(const std::string& path) -> bool {
    std::FILE* f = std::fopen(path.c_str(), "a");
    if (f == nullptr) {
      return false;
    }
    std::lock_guard lock(out_mu_);
    if (out_ != stdout) {
      std::fclose(out_);
    }
    out_ = f;
    colored_ = false;
    return true;
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args&&... args)
      -> void {
    if (level < level_.load(std::memory_order_acquire))
      return;

    if (!accepting_.load(std::memory_order_acquire)) {
      // Synchronous while the writer is not running
      std::string line;
      render(line, level, fmt, std::forward<Args>(args)...);
      write(line);
      return;
    }

    auto& buf = t_state.buffer;
    buf.clear();
    render(buf, level, fmt, std::forward<Args>(args)...);

    if (!queue_.push(std::string(buf))) {
      overflowed_.fetch_add(1, std::memory_order_relaxed);
      write(buf);
    }
  }
};

inline Logger& logger() {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

// False (and the level unchanged) for an unknown name.
inline auto set_level(std::string_view name) noexcept -> bool {
  auto level = parse_level(name);
  if (!level) {
    return false;
  }
  logger().set_level(*level);
  return true;
}

// Printed instead of the numeric thread id, e.g. "sweeper" or "analysis-2".
inline auto set_thread_label(std::string label) -> void {
  t_state.label = std::move(label);
}

[[nodiscard]] inline auto set_output_file(const std::string& path) -> bool {
  return logger().set_output_file(path);
}

inline auto start() -> void {
  logger().start();
}
inline auto stop() -> void {
  logger().stop();
}

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

}  // namespace batchq::log
