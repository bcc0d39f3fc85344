#include "batchq/cli/commands.hpp"
#include "batchq/queue/state_strings.hpp"
#include "batchq/storage/persistence.hpp"

#include <format>
#include <print>

namespace batchq::cli {

namespace {

auto time_str(const std::optional<TimePoint>& tp) -> std::string {
  if (!tp) {
    return "-";
  }
  return std::format("{:%Y-%m-%d %H:%M:%S}",
                     std::chrono::floor<std::chrono::seconds>(*tp));
}

auto print_task(const Task& t) -> void {
  std::println("Task:      {}", t.id);
  std::println("User:      {}", t.user_id);
  std::println("Symbol:    {}", t.symbol);
  std::println("Priority:  {}", priority_name(t.priority));
  std::println("Status:    {}", task_status_name(t.status));
  if (t.batch_id) {
    std::println("Batch:     {}", *t.batch_id);
  }
  std::println("Retries:   {}", t.retry_count);
  std::println("Created:   {}", time_str(t.created_at));
  std::println("Started:   {}", time_str(t.started_at));
  std::println("Finished:  {}", time_str(t.finished_at()));
  if (t.result) {
    std::println("Result:    {}", t.result->dump());
  }
  if (t.error) {
    std::println("Error:     {}", *t.error);
  }
}

auto print_batch(const Batch& b) -> void {
  std::println("Batch:     {}", b.id);
  std::println("User:      {}", b.user_id);
  std::println("Status:    {}", batch_status_name(b.status));
  std::println("Progress:  {}% ({}/{} completed, {} failed, {} cancelled)",
               b.progress(), b.completed_tasks, b.total_tasks, b.failed_tasks,
               b.cancelled_tasks);
  std::println("Created:   {}", time_str(b.created_at));
  std::println("Started:   {}", time_str(b.started_at));
  std::println("Finished:  {}", time_str(b.finished_at));
}

}  // namespace

auto cmd_status(const StatusOptions& opts) -> int {
  Persistence db(opts.db_file);

  if (auto r = db.open(); !r.has_value()) {
    std::println(stderr, "Error: Failed to open database: {}",
                 r.error().message());
    return 1;
  }

  if (!opts.task_id.empty()) {
    auto task = db.load_task(TaskId{opts.task_id});
    if (!task) {
      std::println(stderr, "Error: Task not found: {}", opts.task_id);
      return 1;
    }
    print_task(*task);
    return 0;
  }

  if (!opts.batch_id.empty()) {
    auto batch = db.load_batch(BatchId{opts.batch_id});
    if (!batch) {
      std::println(stderr, "Error: Batch not found: {}", opts.batch_id);
      return 1;
    }
    print_batch(*batch);

    auto tasks = db.query_tasks(TaskFilter{.batch_id = batch->id});
    if (!tasks) {
      std::println(stderr, "Error: {}", tasks.error().message());
      return 1;
    }
    std::println("");
    std::println("{:<36} {:<10} {:<11} {:<7}", "TASK_ID", "SYMBOL", "STATUS",
                 "RETRIES");
    for (const auto& t : *tasks) {
      std::println("{:<36} {:<10} {:<11} {:<7}", t.id, t.symbol,
                   task_status_name(t.status), t.retry_count);
    }
    return 0;
  }

  BatchFilter filter{.limit = 20};
  if (!opts.user_id.empty()) {
    filter.user_id = opts.user_id;
  }
  auto batches = db.query_batches(filter);
  if (!batches) {
    std::println(stderr, "Error: {}", batches.error().message());
    return 1;
  }
  if (batches->empty()) {
    std::println("No batches found.");
    return 0;
  }

  std::println("{:<36} {:<16} {:<11} {:>8} {:<20}", "BATCH_ID", "USER",
               "STATUS", "PROGRESS", "CREATED");
  for (const auto& b : *batches) {
    std::println("{:<36} {:<16} {:<11} {:>7}% {:<20}", b.id, b.user_id,
                 batch_status_name(b.status), b.progress(),
                 time_str(b.created_at));
  }
  return 0;
}

}  // namespace batchq::cli
