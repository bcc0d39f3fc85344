#pragma once

#include "batchq/config/system_config.hpp"
#include "batchq/core/error.hpp"

#include <string>
#include <string_view>

namespace batchq {

using Config = SystemConfig;

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<SystemConfig>;

  // Checks limits and intervals; logs the first offending key.
  [[nodiscard]] static auto validate(const SystemConfig& config) -> Result<void>;

  [[nodiscard]] static auto to_string(const SystemConfig& config)
      -> std::string;
};

}  // namespace batchq
