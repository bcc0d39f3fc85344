#include "batchq/app/application.hpp"
#include "batchq/cli/commands.hpp"
#include "batchq/config/config.hpp"
#include "batchq/queue/state_strings.hpp"
#include "batchq/scheduler/scheduler.hpp"
#include "batchq/util/log.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <print>

namespace batchq::cli {

namespace {

auto print_batch(const Batch& batch, const std::vector<Task>& tasks) -> void {
  std::println("Batch:    {}", batch.id);
  std::println("Status:   {}", batch_status_name(batch.status));
  std::println("Progress: {}% ({} completed, {} failed, {} cancelled of {})",
               batch.progress(), batch.completed_tasks, batch.failed_tasks,
               batch.cancelled_tasks, batch.total_tasks);
  std::println("");
  std::println("{:<36} {:<10} {:<11} {}", "TASK_ID", "SYMBOL", "STATUS",
               "DETAIL");
  for (const auto& t : tasks) {
    std::string detail;
    if (t.error) {
      detail = *t.error;
    } else if (t.result) {
      detail = t.result->dump();
    }
    std::println("{:<36} {:<10} {:<11} {}", t.id, t.symbol,
                 task_status_name(t.status), detail);
  }
}

}  // namespace

auto cmd_run(const RunOptions& opts) -> int {
  Config config;
  if (!opts.config_file.empty()) {
    auto loaded = ConfigLoader::load_from_file(opts.config_file);
    if (!loaded) {
      std::println(stderr, "Error: {}", loaded.error().message());
      return 1;
    }
    config = std::move(*loaded);
  }

  auto priority = parse_priority(opts.priority);
  if (!priority) {
    std::println(stderr, "Error: Unknown priority '{}'", opts.priority);
    return 1;
  }

  Parameters params = Parameters::object();
  if (!opts.params.empty()) {
    params = nlohmann::json::parse(opts.params, nullptr, false);
    if (params.is_discarded() || !params.is_object()) {
      std::println(stderr, "Error: --params must be a JSON object");
      return 1;
    }
  }

  if (config.workers.count <= 0) {
    config.workers.count = 1;
  }

  log::set_level(config.scheduler.log_level);
  log::start();

  Application app(std::move(config));

  if (auto r = app.init(); !r.has_value()) {
    std::println(stderr, "Error: {}", r.error().message());
    log::stop();
    return 1;
  }

  if (auto r = app.start(); !r.has_value()) {
    std::println(stderr, "Error: {}", r.error().message());
    log::stop();
    return 1;
  }

  auto batch_id = app.submit_batch(BatchRequest{
      .user_id = opts.user_id,
      .symbols = opts.symbols,
      .parameters = std::move(params),
      .priority = *priority,
  });
  if (!batch_id) {
    auto code = to_error(batch_id.error());
    std::println(stderr, "Error: {} batch: {} [{}]",
                 is_request_error(code) ? "Rejected" : "Failed to create",
                 batch_id.error().message(), error_name(code));
    app.stop();
    log::stop();
    return 1;
  }

  log::info("Batch {} created with {} task(s)", *batch_id, opts.symbols.size());

  auto batch =
      app.wait_for_batch(*batch_id, std::chrono::seconds(opts.timeout_sec));
  int rc = 0;
  if (!batch) {
    std::println(stderr, "Error: {}", batch.error().message());
    rc = 1;
  } else {
    auto tasks = app.scheduler().list_batch_tasks(*batch_id);
    print_batch(*batch, tasks.value_or(std::vector<Task>{}));
    if (!batch->terminal()) {
      std::println(stderr, "Error: batch did not finish within {}s",
                   opts.timeout_sec);
      rc = 1;
    } else if (batch->status != BatchStatus::Completed) {
      rc = 2;
    }
  }

  app.stop();
  log::stop();
  return rc;
}

}  // namespace batchq::cli
