#include "batchq/cli/commands.hpp"
#include "batchq/config/config.hpp"
#include "batchq/worker/analysis_engine.hpp"

#include <print>

namespace batchq::cli {

auto cmd_validate(const ValidateOptions& opts) -> int {
  auto result = ConfigLoader::load_from_file(opts.config_file);
  if (!result) {
    std::println(stderr, "Error: {}", result.error().message());
    return 1;
  }
  const auto& config = *result;

  if (auto r = ConfigLoader::validate(config); !r) {
    std::println("✗ {} - {}", opts.config_file, r.error().message());
    return 1;
  }

  auto engine = create_engine(config.workers.engine);
  if (!engine) {
    std::println("✗ {} - unknown engine '{}'", opts.config_file,
                 config.workers.engine);
    return 1;
  }

  std::println("✓ {}", opts.config_file);
  std::println("");
  std::print("{}", ConfigLoader::to_string(config));
  std::println("");
  return 0;
}

}  // namespace batchq::cli
