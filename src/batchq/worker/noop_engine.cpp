#include "batchq/worker/analysis_engine.hpp"

#include "batchq/util/log.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

namespace batchq {

namespace {

// Returns a fixed "hold" decision. Parameters:
//   simulate_delay_ms  sleep before answering (stop-aware)
//   simulate_failure   true to fail, or a string used as the error
class NoopEngine : public IAnalysisEngine {
public:
  [[nodiscard]] auto name() const -> std::string_view override {
    return "noop";
  }
  [[nodiscard]] auto version() const -> std::string_view override {
    return "1.0.0";
  }
  [[nodiscard]] auto is_available() const -> bool override { return true; }

  [[nodiscard]] auto analyze(const AnalysisRequest& req, std::stop_token stop)
      -> AnalysisResult override {
    const auto& params = req.parameters;
    auto delay_ms = params.is_object() ? params.value("simulate_delay_ms", 0) : 0;

    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(std::max(0, delay_ms));
    while (std::chrono::steady_clock::now() < deadline) {
      if (stop.stop_requested()) {
        return AnalysisResult{.interrupted = true};
      }
      std::this_thread::sleep_for(std::min<std::chrono::nanoseconds>(
          std::chrono::milliseconds(10),
          deadline - std::chrono::steady_clock::now()));
    }

    if (params.is_object() && params.contains("simulate_failure")) {
      const auto& f = params["simulate_failure"];
      if (f.is_string()) {
        return AnalysisResult{.error = f.get<std::string>()};
      }
      if (f.is_boolean() && f.get<bool>()) {
        return AnalysisResult{.error = "simulated failure"};
      }
    }

    log::trace("noop analysis of {} for task {}", req.symbol, req.task_id);
    return AnalysisResult{
        .success = true,
        .result = {{"symbol", req.symbol},
                   {"engine", std::string(name())},
                   {"version", std::string(version())},
                   {"decision", "hold"}},
    };
  }
};

}  // namespace

auto create_noop_engine() -> std::unique_ptr<IAnalysisEngine> {
  return std::make_unique<NoopEngine>();
}

auto create_engine(std::string_view name)
    -> Result<std::unique_ptr<IAnalysisEngine>> {
  if (name == "noop") {
    return create_noop_engine();
  }
  log::error("Unknown analysis engine: {}", name);
  return fail(Error::InvalidInput);
}

}  // namespace batchq
