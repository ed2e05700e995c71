#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "switchyard/internal/base/strong_id.h"
#include "switchyard/internal/diagnostics/error/error.h"
#include "switchyard/internal/dispatch/tandem_dispatcher.h"
#include "switchyard/internal/handler/category.h"
#include "switchyard/internal/router/match_result.h"

namespace switchyard::internal::execution {

enum class OutcomeStatus : std::uint8_t {
  Success,     ///< Handler ran and succeeded
  Cached,      ///< Value served from ResultCache
  CircuitOpen, ///< Skipped; the handler's circuit is open
  TimedOut,    ///< Did not finish before the call deadline
  Error,       ///< Handler failed; see error_kind and message
};

constexpr std::string_view toString(OutcomeStatus status) {
  switch (status) {
  case OutcomeStatus::Success:
    return "success";
  case OutcomeStatus::Cached:
    return "cached";
  case OutcomeStatus::CircuitOpen:
    return "circuit_open";
  case OutcomeStatus::TimedOut:
    return "timed_out";
  case OutcomeStatus::Error:
  default:
    return "error";
  }
}

/**
 * @brief Result of one candidate handler within a request.
 */
struct HandlerOutcome {
  std::string handler;
  OutcomeStatus status{OutcomeStatus::Error};
  std::string value;
  diagnostics::error::SwitchyardErrc error_kind{diagnostics::error::SwitchyardErrc::Success};
  std::string message;
  dispatch::ExecutionPath path{dispatch::ExecutionPath::None};
  std::uint32_t attempts{0};
  std::chrono::microseconds latency{0};
  bool degraded{false};

  [[nodiscard]] bool ok() const noexcept {
    return status == OutcomeStatus::Success || status == OutcomeStatus::Cached;
  }
};

/**
 * @brief Everything ExecutionEngine::process reports for one request.
 *
 * `outcomes` has one entry per dispatched handler, in ranking order.
 */
struct AggregatedResponse {
  base::RequestId request_id{};
  std::uint64_t generation{0};
  std::vector<std::string> matched_keywords;
  std::vector<router::Candidate> candidates;
  std::vector<handler::Category> categories;
  std::vector<HandlerOutcome> outcomes;
  std::chrono::microseconds elapsed{0};
  bool suggests_parallel{false};
  std::optional<std::string> workflow;
  bool coordinator_added{false};

  [[nodiscard]] const HandlerOutcome *outcomeFor(std::string_view handler) const {
    for (const auto &outcome : outcomes) {
      if (outcome.handler == handler) {
        return &outcome;
      }
    }
    return nullptr;
  }
};

} // namespace switchyard::internal::execution
