#pragma once

#include <yaml-cpp/yaml.h>

#include <optional>
#include <string>
#include <string_view>

namespace batchq {

// Missing keys and explicit nulls both read as absent. A present value of the
// wrong type throws YAML::BadConversion, which the loader reports.
[[nodiscard]] inline auto yaml_present(const YAML::Node& node,
                                       std::string_view key) -> YAML::Node {
  auto field = node[std::string(key)];
  if (!field || field.IsNull()) {
    return YAML::Node(YAML::NodeType::Undefined);
  }
  return field;
}

template <typename T>
[[nodiscard]] auto yaml_get_or(const YAML::Node& node, std::string_view key,
                               T default_val) -> T {
  auto field = yaml_present(node, key);
  return field.IsDefined() ? field.as<T>() : default_val;
}

template <typename T>
[[nodiscard]] auto yaml_get_optional(const YAML::Node& node,
                                     std::string_view key) -> std::optional<T> {
  auto field = yaml_present(node, key);
  if (!field.IsDefined()) {
    return std::nullopt;
  }
  return field.as<T>();
}

inline void yaml_emit(YAML::Emitter& out, std::string_view key,
                      const auto& value) {
  out << YAML::Key << std::string(key) << YAML::Value << value;
}

template <typename T>
void yaml_emit_optional(YAML::Emitter& out, std::string_view key,
                        const std::optional<T>& value) {
  if (value) {
    yaml_emit(out, key, *value);
  }
}

inline void yaml_emit_if_not_empty(YAML::Emitter& out, std::string_view key,
                                   const std::string& value) {
  if (!value.empty()) {
    yaml_emit(out, key, value);
  }
}

}  // namespace batchq
