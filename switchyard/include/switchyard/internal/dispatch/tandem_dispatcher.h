#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "switchyard/internal/base/cancellation.h"
#include "switchyard/internal/base/clock.h"
#include "switchyard/internal/diagnostics/error/error.h"
#include "switchyard/internal/dispatch/capability.h"
#include "switchyard/internal/dispatch/dispatch_config.h"
#include "switchyard/internal/dispatch/fast_path_health.h"
#include "switchyard/internal/handler/handler_call.h"
#include "switchyard/internal/handler/handler_descriptor.h"
#include "switchyard/internal/handler/handler_table.h"

namespace switchyard::internal::dispatch {

enum class ExecutionPath : std::uint8_t {
  None,     ///< No implementation was called
  Fast,     ///< Answered by the fast implementation
  Fallback, ///< Answered (or finally failed) on the fallback path
};

constexpr std::string_view toString(ExecutionPath path) {
  switch (path) {
  case ExecutionPath::Fast:
    return "fast";
  case ExecutionPath::Fallback:
    return "fallback";
  case ExecutionPath::None:
  default:
    return "none";
  }
}

/**
 * @brief Result of one TandemDispatcher::invoke call.
 */
struct DispatchOutcome {
  ExecutionPath path{ExecutionPath::None};
  /// Calls made on `path`. A failed fast try is not counted here, so a
  /// fallback outcome never reports more than DispatchConfig::max_attempts.
  std::uint32_t attempts{0};
  /// The fast implementation was called.
  bool fast_tried{false};
  std::chrono::microseconds latency{0};
  bool success{false};
  /// The fast path was tried and failed, so the fallback answered.
  bool degraded{false};
  std::string value;
  std::optional<diagnostics::error::SwitchyardError> error;

  [[nodiscard]] diagnostics::error::SwitchyardErrc errorKind() const noexcept {
    return error ? error->errc() : diagnostics::error::SwitchyardErrc::Success;
  }
};

/// True for failures worth retrying (TransientFailure, TimedOut).
bool isRetryable(diagnostics::error::SwitchyardErrc errc) noexcept;

/**
 * @brief Chooses between a handler's fast and fallback implementations.
 *
 * The fast path is used only when the process capability allows it, the
 * handler has a fast implementation, its execution mode permits it and its
 * recent fast-path history is healthy. A fast-path failure falls through to
 * the fallback path within the same call. The fallback path retries
 * retryable failures with exponential backoff; backoff waits end early when
 * the cancellation token fires.
 */
class TandemDispatcher {
public:
  TandemDispatcher(std::shared_ptr<const handler::HandlerTable> table,
                   Capabilities capabilities, DispatchConfig config = {},
                   base::ClockFn clock = base::steadyClock());

  TandemDispatcher(const TandemDispatcher &) = delete;
  TandemDispatcher &operator=(const TandemDispatcher &) = delete;

  /// Never throws for handler failures; they are reported in the outcome.
  DispatchOutcome invoke(std::string_view handler, const handler::HandlerPayload &payload,
                         base::CancellationToken cancel = {},
                         handler::ExecutionMode mode = handler::ExecutionMode::Intelligent);

  /// Backoff before fallback attempt `attempt + 1` (attempt counts from 0).
  [[nodiscard]] std::chrono::milliseconds backoffFor(std::uint32_t attempt) const noexcept;

  [[nodiscard]] const Capabilities &capabilities() const noexcept { return capabilities_; }
  [[nodiscard]] const DispatchConfig &config() const noexcept { return config_; }
  [[nodiscard]] const handler::HandlerTable &table() const noexcept { return *table_; }
  [[nodiscard]] FastPathHealth &health() noexcept { return health_; }

private:
  handler::HandlerOutput callOnce(const handler::HandlerFn &fn, std::string_view handler,
                                  const handler::HandlerPayload &payload,
                                  const base::CancellationToken &cancel,
                                  std::uint32_t attempt) const;

  std::shared_ptr<const handler::HandlerTable> table_;
  Capabilities capabilities_;
  DispatchConfig config_;
  base::ClockFn clock_;
  FastPathHealth health_;
};

} // namespace switchyard::internal::dispatch
