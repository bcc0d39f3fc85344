#include "batchq/app/application.hpp"

#include "batchq/app/services/event_service.hpp"
#include "batchq/app/services/persistence_service.hpp"
#include "batchq/scheduler/scheduler.hpp"
#include "batchq/util/log.hpp"
#include "batchq/worker/analysis_engine.hpp"
#include "batchq/worker/worker.hpp"

#include <format>
#include <thread>

namespace batchq {

Application::Application(Config config)
    : config_(std::move(config)),
      events_(std::make_unique<EventService>()) {
}

Application::~Application() {
  stop();
  if (persistence_) {
    persistence_->close();
  }
}

auto Application::init() -> Result<void> {
  if (initialized_) {
    return ok();
  }
  if (auto r = ConfigLoader::validate(config_); !r) {
    return r;
  }

  auto engine = create_engine(config_.workers.engine);
  if (!engine) {
    return fail(engine.error());
  }
  engine_ = std::move(*engine);

  if (config_.storage.enabled) {
    persistence_ = std::make_unique<PersistenceService>(config_.storage.db_file);
    if (auto r = persistence_->open(); !r) {
      log::error("Failed to open database: {}", r.error().message());
      persistence_.reset();
      return r;
    }
  }

  scheduler_ = std::make_unique<Scheduler>(config_.queue);
  scheduler_->set_event_listener(
      [this](const SchedulerEvent& e) { events_->on_event(e); });
  if (persistence_) {
    scheduler_->set_state_mirror(persistence_.get());
  }

  initialized_ = true;
  return ok();
}

auto Application::recover_from_crash() -> Result<RecoveryResult> {
  if (!initialized_) {
    return fail(Error::InvalidState);
  }
  if (!persistence_) {
    return RecoveryResult{};
  }
  Recovery recovery(*persistence_->persistence());
  return recovery.recover(*scheduler_);
}

auto Application::start() -> Result<void> {
  if (!initialized_) {
    return fail(Error::InvalidState);
  }
  if (running_.exchange(true))
    return ok();

  if (persistence_) {
    persistence_->start();
  }
  scheduler_->start();

  const auto& wc = config_.workers;
  workers_.reserve(static_cast<std::size_t>(wc.count));
  for (int i = 0; i < wc.count; ++i) {
    auto worker = std::make_unique<Worker>(
        *scheduler_, *engine_,
        WorkerOptions{
            .id = WorkerId{std::format("{}-{}", wc.type, i + 1)},
            .type = wc.type,
            .poll_interval = std::chrono::milliseconds(wc.poll_interval_ms),
            .heartbeat_interval =
                std::chrono::milliseconds(wc.heartbeat_interval_ms),
        });
    worker->start();
    workers_.push_back(std::move(worker));
  }

  log::info("batchq started with {} worker(s), engine {} {}", workers_.size(),
            engine_->name(), engine_->version());
  return ok();
}

auto Application::stop() -> void {
  if (!running_.exchange(false))
    return;

  log::info("Stopping batchq...");

  for (auto& w : workers_) {
    w->stop();
  }
  workers_.clear();

  scheduler_->stop();

  if (persistence_) {
    persistence_->stop();
  }

  log::info("batchq stopped");
}

auto Application::is_running() const noexcept -> bool {
  return running_.load();
}

auto Application::submit_batch(BatchRequest request) -> Result<BatchId> {
  if (!initialized_) {
    return fail(Error::InvalidState);
  }
  auto id = scheduler_->create_batch(std::move(request));
  if (id) {
    notify_workers();
  }
  return id;
}

auto Application::wait_for_batch(const BatchId& batch_id,
                                 std::chrono::milliseconds timeout)
    -> Result<Batch> {
  if (!initialized_) {
    return fail(Error::InvalidState);
  }
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    auto batch = scheduler_->get_batch_status(batch_id);
    if (!batch || batch->terminal() ||
        std::chrono::steady_clock::now() >= deadline) {
      return batch;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
}

auto Application::scheduler() -> Scheduler& {
  return *scheduler_;
}

auto Application::events() -> EventService& {
  return *events_;
}

auto Application::persistence() -> PersistenceService* {
  return persistence_.get();
}

auto Application::notify_workers() -> void {
  for (auto& w : workers_) {
    w->notify();
  }
}

}  // namespace batchq
