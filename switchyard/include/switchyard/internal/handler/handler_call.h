#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "switchyard/internal/base/cancellation.h"
#include "switchyard/internal/diagnostics/error/error.h"

namespace switchyard::internal::handler {

/**
 * @brief Payload handed to every handler selected for a request.
 */
struct HandlerPayload {
  std::string input;
  std::string normalized_input;
  std::vector<std::string> matched_keywords;
  std::string workflow;
};

/**
 * @brief Arguments of one handler invocation.
 *
 * `cancel` fires when the request deadline passes; long-running handlers are
 * expected to poll it at their own I/O boundaries.
 */
struct HandlerCall {
  std::string_view handler_name;
  const HandlerPayload &payload;
  base::CancellationToken cancel;
  std::uint32_t attempt{0};
};

/**
 * @brief Handler result.
 *
 * Failures should carry TransientFailure or TimedOut when a retry may help,
 * and HandlerFatal or MalformedPayload when it cannot.
 */
using HandlerOutput = diagnostics::error::SwitchyardResult<std::string>;

using HandlerFn = std::function<HandlerOutput(const HandlerCall &)>;

} // namespace switchyard::internal::handler
