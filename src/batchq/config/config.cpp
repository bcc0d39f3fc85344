#include "batchq/config/config.hpp"

#include "batchq/config/yaml_utils.hpp"
#include "batchq/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace YAML {

template <>
struct convert<batchq::SchedulerConfig> {
  static bool decode(const Node& node, batchq::SchedulerConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    s.log_level = batchq::yaml_get_or<std::string>(node, "log_level", "info");
    s.log_file = batchq::yaml_get_or<std::string>(node, "log_file", "");
    return true;
  }
};

template <>
struct convert<batchq::QueueConfig> {
  static bool decode(const Node& node, batchq::QueueConfig& q) {
    if (!node.IsMap()) {
      return false;
    }
    q.user_concurrent_limit =
        batchq::yaml_get_or(node, "user_concurrent_limit", 3);
    q.global_concurrent_limit =
        batchq::yaml_get_or(node, "global_concurrent_limit", 50);
    q.visibility_timeout_sec =
        batchq::yaml_get_or(node, "visibility_timeout_sec", 300);
    q.sweep_interval_ms = batchq::yaml_get_or(node, "sweep_interval_ms", 5000);
    q.task_cleanup_age_days =
        batchq::yaml_get_or(node, "task_cleanup_age_days", 7);
    q.cleanup_interval_sec =
        batchq::yaml_get_or(node, "cleanup_interval_sec", 3600);
    q.max_batch_size = batchq::yaml_get_or(node, "max_batch_size", 100);
    q.max_retries = batchq::yaml_get_optional<int>(node, "max_retries");
    return true;
  }
};

template <>
struct convert<batchq::StorageConfig> {
  static bool decode(const Node& node, batchq::StorageConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    s.enabled = batchq::yaml_get_or(node, "enabled", false);
    s.db_file = batchq::yaml_get_or<std::string>(node, "db_file", "batchq.db");
    return true;
  }
};

template <>
struct convert<batchq::WorkerConfig> {
  static bool decode(const Node& node, batchq::WorkerConfig& w) {
    if (!node.IsMap()) {
      return false;
    }
    w.count = batchq::yaml_get_or(node, "count", 4);
    w.engine = batchq::yaml_get_or<std::string>(node, "engine", "noop");
    w.type = batchq::yaml_get_or<std::string>(node, "type", "analysis");
    w.poll_interval_ms = batchq::yaml_get_or(node, "poll_interval_ms", 200);
    w.heartbeat_interval_ms =
        batchq::yaml_get_or(node, "heartbeat_interval_ms", 1000);
    return true;
  }
};

template <>
struct convert<batchq::SystemConfig> {
  static bool decode(const Node& node, batchq::SystemConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto scheduler = node["scheduler"]) {
      c.scheduler = scheduler.as<batchq::SchedulerConfig>();
    }
    if (auto queue = node["queue"]) {
      c.queue = queue.as<batchq::QueueConfig>();
    }
    if (auto storage = node["storage"]) {
      c.storage = storage.as<batchq::StorageConfig>();
    }
    if (auto workers = node["workers"]) {
      c.workers = workers.as<batchq::WorkerConfig>();
    }
    return true;
  }
};

}  // namespace YAML

namespace batchq {

namespace {

void to_yaml(YAML::Emitter& out, const SchedulerConfig& s) {
  out << YAML::BeginMap;
  yaml_emit(out, "log_level", s.log_level);
  yaml_emit_if_not_empty(out, "log_file", s.log_file);
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const QueueConfig& q) {
  out << YAML::BeginMap;
  yaml_emit(out, "user_concurrent_limit", q.user_concurrent_limit);
  yaml_emit(out, "global_concurrent_limit", q.global_concurrent_limit);
  yaml_emit(out, "visibility_timeout_sec", q.visibility_timeout_sec);
  yaml_emit(out, "sweep_interval_ms", q.sweep_interval_ms);
  yaml_emit(out, "task_cleanup_age_days", q.task_cleanup_age_days);
  yaml_emit(out, "cleanup_interval_sec", q.cleanup_interval_sec);
  yaml_emit(out, "max_batch_size", q.max_batch_size);
  yaml_emit_optional(out, "max_retries", q.max_retries);
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const StorageConfig& s) {
  out << YAML::BeginMap;
  yaml_emit(out, "enabled", s.enabled);
  yaml_emit(out, "db_file", s.db_file);
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const WorkerConfig& w) {
  out << YAML::BeginMap;
  yaml_emit(out, "count", w.count);
  yaml_emit(out, "engine", w.engine);
  yaml_emit(out, "type", w.type);
  yaml_emit(out, "poll_interval_ms", w.poll_interval_ms);
  yaml_emit(out, "heartbeat_interval_ms", w.heartbeat_interval_ms);
  out << YAML::EndMap;
}

auto require_positive(std::string_view key, int value) -> Result<void> {
  if (value <= 0) {
    log::error("Invalid config: {} must be positive (got {})", key, value);
    return fail(Error::InvalidInput);
  }
  return ok();
}

}  // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<SystemConfig> {
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      log::error("Failed to parse YAML: empty or invalid content");
      return fail(Error::ParseError);
    }
    SystemConfig config = root.as<SystemConfig>();
    return ok(std::move(config));
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto ConfigLoader::validate(const SystemConfig& config) -> Result<void> {
  if (!log::parse_level(config.scheduler.log_level)) {
    log::error("Invalid config: unknown scheduler.log_level '{}'",
               config.scheduler.log_level);
    return fail(Error::InvalidInput);
  }
  const auto& q = config.queue;
  const std::pair<std::string_view, int> checks[] = {
      {"queue.user_concurrent_limit", q.user_concurrent_limit},
      {"queue.global_concurrent_limit", q.global_concurrent_limit},
      {"queue.visibility_timeout_sec", q.visibility_timeout_sec},
      {"queue.sweep_interval_ms", q.sweep_interval_ms},
      {"queue.task_cleanup_age_days", q.task_cleanup_age_days},
      {"queue.cleanup_interval_sec", q.cleanup_interval_sec},
      {"queue.max_batch_size", q.max_batch_size},
      {"workers.poll_interval_ms", config.workers.poll_interval_ms},
      {"workers.heartbeat_interval_ms", config.workers.heartbeat_interval_ms},
  };
  for (const auto& [key, value] : checks) {
    if (auto r = require_positive(key, value); !r) {
      return r;
    }
  }
  if (q.max_retries && *q.max_retries < 0) {
    log::error("Invalid config: queue.max_retries must not be negative");
    return fail(Error::InvalidInput);
  }
  if (config.workers.count < 0) {
    log::error("Invalid config: workers.count must not be negative");
    return fail(Error::InvalidInput);
  }
  if (config.storage.enabled && config.storage.db_file.empty()) {
    log::error("Invalid config: storage.db_file is required when enabled");
    return fail(Error::InvalidInput);
  }
  return ok();
}

auto ConfigLoader::to_string(const SystemConfig& config) -> std::string {
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "scheduler" << YAML::Value;
  to_yaml(out, config.scheduler);
  out << YAML::Key << "queue" << YAML::Value;
  to_yaml(out, config.queue);
  out << YAML::Key << "storage" << YAML::Value;
  to_yaml(out, config.storage);
  out << YAML::Key << "workers" << YAML::Value;
  to_yaml(out, config.workers);
  out << YAML::EndMap;
  return out.c_str();
}

}  // namespace batchq
