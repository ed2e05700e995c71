#pragma once

#include <string>

#include "switchyard/internal/dispatch/dispatch_config.h"
#include "switchyard/internal/handler/handler_table.h"

namespace switchyard::internal::dispatch {

/// Environment variable that turns the fast path off when set to a non-empty value other than "0".
inline constexpr const char *kDisableFastPathEnv = "SWITCHYARD_DISABLE_FAST_PATH";

/**
 * @brief What this process can do, decided once at startup.
 */
struct Capabilities {
  bool fast_path{false};
  /// Human-readable reason for the decision.
  std::string detail;
};

/**
 * @brief Detect capabilities from configuration, environment and the handler table.
 */
Capabilities detectCapabilities(const DispatchConfig &config,
                                const handler::HandlerTable &table);

} // namespace switchyard::internal::dispatch
