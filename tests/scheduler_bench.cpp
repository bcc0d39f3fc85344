#include "batchq/scheduler/scheduler.hpp"

#include <benchmark/benchmark.h>

#include <atomic>
#include <format>
#include <thread>
#include <vector>

using namespace batchq;

namespace {

auto bench_config() -> QueueConfig {
  QueueConfig config;
  config.user_concurrent_limit = 1'000'000;
  config.global_concurrent_limit = 1'000'000;
  config.sweep_interval_ms = 60'000;
  return config;
}

auto make_request(int user, int i) -> TaskRequest {
  return TaskRequest{.user_id = std::format("user-{}", user),
                     .symbol = std::format("S{}", i),
                     .priority = static_cast<Priority>(i % 4)};
}

}  // namespace

static void BM_SchedulerEnqueue(benchmark::State& state) {
  const int tasks = state.range(0);

  for (auto _ : state) {
    state.PauseTiming();
    Scheduler scheduler(bench_config());
    state.ResumeTiming();

    for (int i = 0; i < tasks; ++i) {
      benchmark::DoNotOptimize(scheduler.enqueue(make_request(i % 16, i)));
    }
  }

  state.SetItemsProcessed(tasks * state.iterations());
}

static void BM_SchedulerDequeueAck(benchmark::State& state) {
  const int tasks = state.range(0);
  const WorkerId worker{std::string{"bench"}};

  for (auto _ : state) {
    state.PauseTiming();
    Scheduler scheduler(bench_config());
    for (int i = 0; i < tasks; ++i) {
      benchmark::DoNotOptimize(scheduler.enqueue(make_request(i % 16, i)));
    }
    state.ResumeTiming();

    while (auto task = scheduler.dequeue(worker)) {
      scheduler.ack(task->id, worker, true);
    }
  }

  state.SetItemsProcessed(tasks * state.iterations());
}

static void BM_SchedulerBatchFanOut(benchmark::State& state) {
  const int symbols = state.range(0);
  BatchRequest request{.user_id = "bench"};
  for (int i = 0; i < symbols; ++i) {
    request.symbols.push_back(std::format("S{}", i));
  }

  Scheduler scheduler(bench_config());
  for (auto _ : state) {
    auto id = scheduler.create_batch(request);
    benchmark::DoNotOptimize(id);
  }

  state.SetItemsProcessed(symbols * state.iterations());
}

static void BM_SchedulerConcurrentWorkers(benchmark::State& state) {
  const int tasks = state.range(0);
  const int workers = state.range(1);

  for (auto _ : state) {
    state.PauseTiming();
    Scheduler scheduler(bench_config());
    for (int i = 0; i < tasks; ++i) {
      benchmark::DoNotOptimize(scheduler.enqueue(make_request(i % 16, i)));
    }
    std::atomic<int> acked{0};
    state.ResumeTiming();

    std::vector<std::thread> threads;
    threads.reserve(static_cast<std::size_t>(workers));
    for (int w = 0; w < workers; ++w) {
      threads.emplace_back([&, w] {
        const WorkerId id{std::format("w{}", w)};
        while (acked.load(std::memory_order_relaxed) < tasks) {
          if (auto task = scheduler.dequeue(id)) {
            if (scheduler.ack(task->id, id, true)) {
              acked.fetch_add(1, std::memory_order_relaxed);
            }
          }
        }
      });
    }
    for (auto& t : threads) {
      t.join();
    }
  }

  state.SetItemsProcessed(tasks * state.iterations());
}

BENCHMARK(BM_SchedulerEnqueue)->Arg(1000)->Arg(10000);

BENCHMARK(BM_SchedulerDequeueAck)->Arg(1000)->Arg(10000);

BENCHMARK(BM_SchedulerBatchFanOut)->Arg(10)->Arg(100);

BENCHMARK(BM_SchedulerConcurrentWorkers)
    ->Args({10000, 2})
    ->Args({10000, 4})
    ->Args({10000, 8})
    ->UseRealTime();

BENCHMARK_MAIN();
