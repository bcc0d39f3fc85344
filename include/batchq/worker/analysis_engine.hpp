#pragma once

#include "batchq/core/error.hpp"
#include "batchq/queue/task.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <stop_token>
#include <string>
#include <string_view>

namespace batchq {

struct AnalysisRequest {
  TaskId task_id;
  std::string user_id;
  std::string symbol;
  Parameters parameters;
  int attempt{0};
};

struct AnalysisResult {
  bool success{false};
  nlohmann::json result;
  std::string error;
  // Stopped before finishing; the task must not be acked.
  bool interrupted{false};
};

// Computes the analysis for one symbol. Implementations are shared by every
// worker thread and must be thread-safe.
class IAnalysisEngine {
public:
  virtual ~IAnalysisEngine() = default;

  [[nodiscard]] virtual auto name() const -> std::string_view = 0;
  [[nodiscard]] virtual auto version() const -> std::string_view = 0;
  [[nodiscard]] virtual auto is_available() const -> bool = 0;

  // May throw; the worker turns exceptions into a failed ack.
  [[nodiscard]] virtual auto analyze(const AnalysisRequest& request,
                                     std::stop_token stop) -> AnalysisResult = 0;
};

// Returns InvalidInput for an unknown engine name.
[[nodiscard]] auto create_engine(std::string_view name)
    -> Result<std::unique_ptr<IAnalysisEngine>>;

[[nodiscard]] auto create_noop_engine() -> std::unique_ptr<IAnalysisEngine>;

}  // namespace batchq
