#include "switchyard/internal/dispatch/capability.h"

#include <cstdlib>
#include <string_view>

#include "switchyard/internal/diagnostics/log/log.h"

namespace switchyard::internal::dispatch {

namespace {

bool envDisablesFastPath() {
  const char *value = std::getenv(kDisableFastPathEnv);
  if (value == nullptr) {
    return false;
  }
  const std::string_view text(value);
  return !text.empty() && text != "0";
}

} // namespace

Capabilities detectCapabilities(const DispatchConfig &config,
                                const handler::HandlerTable &table) {
  Capabilities caps;
  if (!config.fast_path_enabled) {
    caps.detail = "fast path disabled by configuration";
  } else if (envDisablesFastPath()) {
    caps.detail = std::string("fast path disabled by ") + kDisableFastPathEnv;
  } else if (!table.hasAnyFastPath()) {
    caps.detail = "no fast implementations registered";
  } else {
    caps.fast_path = true;
    caps.detail = "fast path available";
  }
  SWITCHYARD_LOG_INFO(Dispatch, "capabilities: " + caps.detail);
  return caps;
}

} // namespace switchyard::internal::dispatch
