#include "batchq/app/application.hpp"
#include "batchq/cli/commands.hpp"
#include "batchq/config/config.hpp"
#include "batchq/util/daemon.hpp"
#include "batchq/util/log.hpp"

#include <optional>
#include <print>

namespace batchq::cli {

auto cmd_serve(const ServeOptions& opts) -> int {
  auto result = ConfigLoader::load_from_file(opts.config_file);
  if (!result) {
    std::println(stderr, "Error: {}", result.error().message());
    return 1;
  }
  auto config = std::move(*result);

  const auto log_file = opts.log_file.value_or(config.scheduler.log_file);
  if (opts.daemon && log_file.empty()) {
    std::println(
        stderr,
        "Error: --daemon requires log_file (set in config or --log-file)");
    return 1;
  }
  if (!log_file.empty() && !log::set_output_file(log_file)) {
    std::println(stderr, "Error: Failed to open log file: {}", log_file);
    return 1;
  }

  if (opts.daemon && !daemonize()) {
    std::println(stderr, "Error: Failed to daemonize");
    return 1;
  }

  log::set_level(config.scheduler.log_level);
  log::start();

  std::optional<PidFile> pid_file;
  if (opts.pid_file) {
    auto created = PidFile::create(*opts.pid_file);
    if (!created) {
      log::stop();
      return 1;
    }
    pid_file.emplace(std::move(*created));
  }

  Application app(std::move(config));

  if (auto r = app.init(); !r.has_value()) {
    log::error("Initialization failed: {}", r.error().message());
    log::stop();
    return 1;
  }

  install_shutdown_handlers();

  if (auto r = app.recover_from_crash(); !r.has_value()) {
    log::warn("Recovery failed: {}", r.error().message());
  } else if (r->batches_restored > 0 || r->tasks_restored > 0) {
    log::info("Recovered {} batch(es), {} task(s) ({} requeued)",
              r->batches_restored, r->tasks_restored, r->tasks_queued);
  }

  const auto& cfg = app.config();
  log::info("batchq starting (user limit {}, global limit {})...",
            cfg.queue.user_concurrent_limit, cfg.queue.global_concurrent_limit);

  if (auto r = app.start(); !r.has_value()) {
    log::error("Failed to start: {}", r.error().message());
    log::stop();
    return 1;
  }

  auto signo = wait_for_shutdown();
  log::info("Shutdown requested (signal {})", signo);
  app.stop();

  log::info("batchq stopped.");
  log::stop();
  return 0;
}

}  // namespace batchq::cli
