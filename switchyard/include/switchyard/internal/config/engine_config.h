#pragma once

#include <filesystem>
#include <string_view>
#include <vector>

#include "switchyard/internal/breaker/circuit_breaker.h"
#include "switchyard/internal/cache/result_cache.h"
#include "switchyard/internal/dispatch/dispatch_config.h"
#include "switchyard/internal/execution/execution_config.h"
#include "switchyard/internal/registry/descriptor_loader.h"
#include "switchyard/internal/router/router_config.h"

namespace switchyard::internal::config {

/**
 * @brief Configuration of every engine component.
 *
 * Each section defaults to its component's own defaults, so an empty YAML
 * document yields a working configuration with no descriptor sources.
 */
struct EngineConfig {
  router::RouterConfig router;
  cache::ResultCacheConfig cache;
  breaker::CircuitBreakerConfig breaker;
  dispatch::DispatchConfig dispatch;
  execution::ExecutionConfig execution;
  /// Descriptor sources for HandlerRegistry::load.
  std::vector<registry::DescriptorSource> sources;
};

/**
 * @brief Parse an engine configuration document.
 *
 * Relative source paths are resolved against `base_dir`. Durations are
 * written in milliseconds under keys ending in `_ms`.
 *
 * @throws SwitchyardException ConfigInvalid on YAML syntax errors, unknown
 *         keys, wrong value types or out-of-range values.
 */
EngineConfig parseEngineConfig(std::string_view yaml, std::string_view origin,
                               const std::filesystem::path &base_dir = {});

/**
 * @brief Read and parse `path`; relative sources resolve against its directory.
 *
 * @throws SwitchyardException ConfigInvalid, including when the file cannot be read.
 */
EngineConfig loadEngineConfig(const std::filesystem::path &path);

} // namespace switchyard::internal::config
