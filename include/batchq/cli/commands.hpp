#pragma once

#include <optional>
#include <string>
#include <vector>

namespace batchq::cli {

struct ServeOptions {
  std::string config_file;
  bool daemon{false};
  std::optional<std::string> log_file;
  std::optional<std::string> pid_file;
};

struct RunOptions {
  std::string config_file;
  std::string user_id;
  std::vector<std::string> symbols;
  std::string priority{"normal"};
  std::string params;
  int timeout_sec{300};
};

struct StatusOptions {
  std::string db_file{"batchq.db"};
  std::string batch_id;
  std::string task_id;
  std::string user_id;
};

struct ValidateOptions {
  std::string config_file;
};

[[nodiscard]] auto cmd_serve(const ServeOptions& opts) -> int;
[[nodiscard]] auto cmd_run(const RunOptions& opts) -> int;
[[nodiscard]] auto cmd_status(const StatusOptions& opts) -> int;
[[nodiscard]] auto cmd_validate(const ValidateOptions& opts) -> int;

}  // namespace batchq::cli
