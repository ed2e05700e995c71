#include "switchyard/internal/dispatch/tandem_dispatcher.h"

#include <algorithm>
#include <utility>

#include "switchyard/internal/diagnostics/error/error_macros.h"
#include "switchyard/internal/diagnostics/log/log.h"

namespace switchyard::internal::dispatch {

namespace errs = ::switchyard::internal::diagnostics::error;

namespace {

std::chrono::microseconds elapsedSince(const base::ClockFn &clock, base::TimePoint start) {
  return std::chrono::duration_cast<std::chrono::microseconds>(clock() - start);
}

DispatchOutcome cancelledOutcome(DispatchOutcome outcome, std::string_view handler) {
  outcome.success = false;
  outcome.value.clear();
  outcome.error = errs::makeError(errs::SwitchyardErrc::Cancelled,
                                  "call to '" + std::string(handler) + "' was cancelled");
  return outcome;
}

} // namespace

bool isRetryable(errs::SwitchyardErrc errc) noexcept {
  return errc == errs::SwitchyardErrc::TransientFailure ||
         errc == errs::SwitchyardErrc::TimedOut;
}

TandemDispatcher::TandemDispatcher(std::shared_ptr<const handler::HandlerTable> table,
                                   Capabilities capabilities, DispatchConfig config,
                                   base::ClockFn clock)
    : table_(std::move(table)), capabilities_(std::move(capabilities)), config_(config),
      clock_(std::move(clock)), health_(config_, clock_) {
  SWITCHYARD_THROW_IF(table_ == nullptr, InvalidArgument,
                      "TandemDispatcher requires a handler table");
  if (config_.max_attempts == 0) {
    config_.max_attempts = 1;
  }
}

std::chrono::milliseconds TandemDispatcher::backoffFor(std::uint32_t attempt) const noexcept {
  std::chrono::milliseconds delay = config_.base_backoff;
  for (std::uint32_t i = 0; i < attempt && delay < config_.max_backoff; ++i) {
    delay *= 2;
  }
  return std::min(delay, config_.max_backoff);
}

handler::HandlerOutput TandemDispatcher::callOnce(const handler::HandlerFn &fn,
                                                  std::string_view handler,
                                                  const handler::HandlerPayload &payload,
                                                  const base::CancellationToken &cancel,
                                                  std::uint32_t attempt) const {
  auto captured = errs::captureResult([&] {
    const handler::HandlerCall call{handler, payload, cancel, attempt};
    return fn(call);
  });
  if (!captured.has_value()) {
    return handler::HandlerOutput::failure(captured.error());
  }
  return std::move(captured).value();
}

DispatchOutcome TandemDispatcher::invoke(std::string_view handler,
                                         const handler::HandlerPayload &payload,
                                         base::CancellationToken cancel,
                                         handler::ExecutionMode mode) {
  const base::TimePoint start = clock_();
  DispatchOutcome outcome;

  const handler::HandlerImplementation *impl = table_->find(handler);
  if (impl == nullptr) {
    outcome.error = errs::makeError(errs::SwitchyardErrc::HandlerNotFound,
                                    "no implementation registered for '" +
                                        std::string(handler) + "'");
    return outcome;
  }
  if (cancel.cancelled()) {
    return cancelledOutcome(std::move(outcome), handler);
  }

  const bool try_fast = capabilities_.fast_path && impl->hasFastPath() &&
                        mode != handler::ExecutionMode::FallbackOnly &&
                        health_.healthy(handler);
  if (try_fast) {
    const base::TimePoint fast_start = clock_();
    handler::HandlerOutput result = callOnce(impl->fast, handler, payload, cancel, 0);
    outcome.fast_tried = true;
    health_.record(handler, result.has_value(), elapsedSince(clock_, fast_start));
    if (result.has_value()) {
      outcome.path = ExecutionPath::Fast;
      outcome.attempts = 1;
      outcome.success = true;
      outcome.value = std::move(result).value();
      outcome.latency = elapsedSince(clock_, start);
      return outcome;
    }
    outcome.degraded = true;
    SWITCHYARD_LOG_WARN(Dispatch, "fast path for '" + std::string(handler) +
                                      "' failed, degrading to fallback: " +
                                      result.error().describe());
    if (cancel.cancelled()) {
      outcome.latency = elapsedSince(clock_, start);
      return cancelledOutcome(std::move(outcome), handler);
    }
  }

  outcome.path = ExecutionPath::Fallback;
  for (std::uint32_t attempt = 0; attempt < config_.max_attempts; ++attempt) {
    handler::HandlerOutput result = callOnce(impl->fallback, handler, payload, cancel, attempt);
    ++outcome.attempts;
    if (result.has_value()) {
      outcome.success = true;
      outcome.value = std::move(result).value();
      outcome.latency = elapsedSince(clock_, start);
      return outcome;
    }

    errs::SwitchyardError error = result.error();
    if (cancel.cancelled() || error.errc() == errs::SwitchyardErrc::Cancelled) {
      outcome.latency = elapsedSince(clock_, start);
      return cancelledOutcome(std::move(outcome), handler);
    }
    if (!isRetryable(error.errc())) {
      outcome.error = std::move(error);
      outcome.latency = elapsedSince(clock_, start);
      return outcome;
    }
    if (attempt + 1 == config_.max_attempts) {
      outcome.error = errs::makeError(
          errs::SwitchyardErrc::RetryExhausted,
          "'" + std::string(handler) + "' failed after " +
              std::to_string(config_.max_attempts) + " attempts: " + error.describe());
      outcome.latency = elapsedSince(clock_, start);
      return outcome;
    }

    const std::chrono::milliseconds delay = backoffFor(attempt);
    SWITCHYARD_LOG_DEBUG(Dispatch, "retrying '" + std::string(handler) + "' in " +
                                       std::to_string(delay.count()) +
                                       "ms: " + error.describe());
    if (!cancel.waitFor(delay)) {
      outcome.latency = elapsedSince(clock_, start);
      return cancelledOutcome(std::move(outcome), handler);
    }
  }

  outcome.latency = elapsedSince(clock_, start);
  return outcome;
}

} // namespace switchyard::internal::dispatch
