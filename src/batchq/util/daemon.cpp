#include "batchq/util/daemon.hpp"

#include "batchq/util/log.hpp"

#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <system_error>

#include <unistd.h>

namespace batchq {

namespace {

// -1 while running; otherwise the signal number (0 for a direct request).
std::atomic<int> g_shutdown_signal{-1};

void on_shutdown_signal(int signo) {
  request_shutdown(signo);
}

}  // namespace

auto daemonize() -> bool {
  pid_t pid = fork();
  if (pid < 0) return false;
  if (pid > 0) std::_Exit(0);

  if (setsid() < 0) return false;

  pid = fork();
  if (pid < 0) return false;
  if (pid > 0) std::_Exit(0);

  if (std::freopen("/dev/null", "r", stdin) == nullptr) return false;
  if (std::freopen("/dev/null", "w", stdout) == nullptr) return false;
  if (std::freopen("/dev/null", "w", stderr) == nullptr) return false;
  return true;
}

auto install_shutdown_handlers() -> void {
  struct sigaction sa{};
  sa.sa_handler = on_shutdown_signal;
  sigemptyset(&sa.sa_mask);
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);

  struct sigaction ignore{};
  ignore.sa_handler = SIG_IGN;
  sigemptyset(&ignore.sa_mask);
  sigaction(SIGPIPE, &ignore, nullptr);
}

auto request_shutdown(int signo) noexcept -> void {
  int expected = -1;
  if (g_shutdown_signal.compare_exchange_strong(expected, signo,
                                                std::memory_order_acq_rel)) {
    g_shutdown_signal.notify_all();
  }
}

auto shutdown_requested() noexcept -> bool {
  return g_shutdown_signal.load(std::memory_order_acquire) >= 0;
}

auto reset_shutdown() noexcept -> void {
  g_shutdown_signal.store(-1, std::memory_order_release);
}

auto wait_for_shutdown() -> int {
  g_shutdown_signal.wait(-1, std::memory_order_acquire);
  return g_shutdown_signal.load(std::memory_order_acquire);
}

auto PidFile::create(std::filesystem::path path) -> Result<PidFile> {
  std::ofstream out(path, std::ios::trunc);
  if (!out) {
    log::error("Cannot write pid file {}", path.string());
    return fail(Error::FileNotFound);
  }
  out << getpid() << '\n';
  if (!out.flush()) {
    log::error("Cannot write pid file {}", path.string());
    return fail(Error::FileNotFound);
  }
  return PidFile(std::move(path));
}

PidFile::PidFile(PidFile&& other) noexcept : path_(std::move(other.path_)) {
  other.path_.clear();
}

auto PidFile::operator=(PidFile&& other) noexcept -> PidFile& {
  if (this != &other) {
    std::error_code ec;
    if (!path_.empty()) {
      std::filesystem::remove(path_, ec);
    }
    path_ = std::move(other.path_);
    other.path_.clear();
  }
  return *this;
}

PidFile::~PidFile() {
  if (path_.empty()) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  if (ec) {
    log::warn("Failed to remove pid file {}: {}", path_.string(), ec.message());
  }
}

}  // namespace batchq
