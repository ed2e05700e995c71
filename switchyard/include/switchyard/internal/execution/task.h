#pragma once

#include <memory>
#include <string>

#include "switchyard/internal/base/clock.h"
#include "switchyard/internal/base/strong_id.h"
#include "switchyard/internal/handler/handler_call.h"
#include "switchyard/internal/handler/handler_descriptor.h"

namespace switchyard::internal::execution {

/**
 * @brief One scheduled handler invocation.
 *
 * Tasks of the same request share one payload.
 */
struct Task {
  base::TaskId id{};
  std::string handler_name;
  std::shared_ptr<const handler::HandlerPayload> payload;
  int priority{handler::kDefaultPriority};
  base::TimePoint submitted_at{};
};

} // namespace switchyard::internal::execution
