#pragma once

#include "batchq/core/error.hpp"

#include <filesystem>

namespace batchq {

// Detaches from the terminal (double fork, setsid). stdio is pointed at
// /dev/null, so the log must already go to a file.
[[nodiscard]] auto daemonize() -> bool;

// SIGINT and SIGTERM request shutdown; SIGPIPE is ignored.
auto install_shutdown_handlers() -> void;

// Same effect as a signal. `signo` 0 means a programmatic request.
auto request_shutdown(int signo = 0) noexcept -> void;
[[nodiscard]] auto shutdown_requested() noexcept -> bool;
// Clears a previous request; only meaningful before handlers are installed.
auto reset_shutdown() noexcept -> void;

// Blocks until shutdown is requested. Returns the signal that caused it.
auto wait_for_shutdown() -> int;

// Holds `<path>` containing our pid for the lifetime of the object.
class PidFile {
public:
  [[nodiscard]] static auto create(std::filesystem::path path)
      -> Result<PidFile>;

  PidFile(PidFile&& other) noexcept;
  auto operator=(PidFile&& other) noexcept -> PidFile&;
  PidFile(const PidFile&) = delete;
  auto operator=(const PidFile&) -> PidFile& = delete;
  ~PidFile();

  [[nodiscard]] auto path() const -> const std::filesystem::path& {
    return path_;
  }

private:
  explicit PidFile(std::filesystem::path path) : path_(std::move(path)) {}

  std::filesystem::path path_;
};

}  // namespace batchq
