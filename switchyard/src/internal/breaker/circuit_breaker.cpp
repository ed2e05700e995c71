#include "switchyard/internal/breaker/circuit_breaker.h"

#include <algorithm>
#include <utility>

#include "switchyard/internal/diagnostics/log/log.h"

namespace switchyard::internal::breaker {

CircuitBreaker::CircuitBreaker(CircuitBreakerConfig config, base::ClockFn clock)
    : config_(config), clock_(std::move(clock)) {
  if (config_.failure_threshold == 0) {
    config_.failure_threshold = 1;
  }
  if (config_.max_cool_down < config_.cool_down) {
    config_.max_cool_down = config_.cool_down;
  }
}

CircuitBreaker::~CircuitBreaker() = default;

CircuitBreaker::State &CircuitBreaker::stateFor(std::string_view handler) {
  {
    std::shared_lock<std::shared_mutex> read(states_mutex_);
    const auto it = states_.find(handler);
    if (it != states_.end()) {
      return *it->second;
    }
  }
  std::unique_lock<std::shared_mutex> write(states_mutex_);
  auto [it, inserted] = states_.try_emplace(std::string(handler), nullptr);
  if (inserted) {
    it->second = std::make_unique<State>();
    it->second->cool_down = config_.cool_down;
  }
  return *it->second;
}

const CircuitBreaker::State *CircuitBreaker::findState(std::string_view handler) const {
  std::shared_lock<std::shared_mutex> read(states_mutex_);
  const auto it = states_.find(handler);
  return it == states_.end() ? nullptr : it->second.get();
}

void CircuitBreaker::pruneFailures(State &state, base::TimePoint now) const {
  if (config_.failure_window.count() <= 0) {
    return;
  }
  while (!state.failures.empty() && now - state.failures.front() > config_.failure_window) {
    state.failures.pop_front();
  }
}

void CircuitBreaker::open(State &state, base::TimePoint now, std::string_view handler) {
  state.status = CircuitStatus::Open;
  state.opened_at = now;
  state.trial_in_flight = false;
  SWITCHYARD_LOG_WARN(Dispatch, "circuit for '" + std::string(handler) + "' opened for " +
                                    std::to_string(state.cool_down.count()) + "ms");
}

Admission CircuitBreaker::acquire(std::string_view handler) {
  State &state = stateFor(handler);
  const base::TimePoint now = clock_();
  std::lock_guard<std::mutex> lock(state.mutex);

  switch (state.status) {
  case CircuitStatus::Closed:
    return Admission::Allowed;
  case CircuitStatus::Open:
    if (now - state.opened_at <= state.cool_down) {
      return Admission::Rejected;
    }
    state.status = CircuitStatus::HalfOpen;
    state.trial_in_flight = true;
    SWITCHYARD_LOG_INFO(Dispatch, "circuit for '" + std::string(handler) +
                                      "' half-open, admitting trial");
    return Admission::Trial;
  case CircuitStatus::HalfOpen:
    if (state.trial_in_flight) {
      return Admission::Rejected;
    }
    state.trial_in_flight = true;
    return Admission::Trial;
  }
  return Admission::Rejected;
}

void CircuitBreaker::recordSuccess(std::string_view handler) {
  State &state = stateFor(handler);
  std::lock_guard<std::mutex> lock(state.mutex);

  switch (state.status) {
  case CircuitStatus::Closed:
    state.failures.clear();
    break;
  case CircuitStatus::HalfOpen:
    state.status = CircuitStatus::Closed;
    state.failures.clear();
    state.reopen_count = 0;
    state.cool_down = config_.cool_down;
    state.trial_in_flight = false;
    SWITCHYARD_LOG_INFO(Dispatch, "circuit for '" + std::string(handler) + "' closed");
    break;
  case CircuitStatus::Open:
    // Result of a call admitted before the circuit opened.
    break;
  }
}

void CircuitBreaker::recordFailure(std::string_view handler) {
  State &state = stateFor(handler);
  const base::TimePoint now = clock_();
  std::lock_guard<std::mutex> lock(state.mutex);

  switch (state.status) {
  case CircuitStatus::Closed:
    state.failures.push_back(now);
    pruneFailures(state, now);
    if (state.failures.size() >= config_.failure_threshold) {
      state.cool_down = config_.cool_down;
      open(state, now, handler);
    }
    break;
  case CircuitStatus::HalfOpen: {
    ++state.reopen_count;
    const auto grown = std::chrono::duration_cast<std::chrono::milliseconds>(
        state.cool_down * config_.backoff_multiplier);
    state.cool_down = std::min(std::max(grown, config_.cool_down), config_.max_cool_down);
    open(state, now, handler);
    break;
  }
  case CircuitStatus::Open:
    break;
  }
}

void CircuitBreaker::releaseTrial(std::string_view handler) {
  State &state = stateFor(handler);
  std::lock_guard<std::mutex> lock(state.mutex);
  if (state.status == CircuitStatus::HalfOpen) {
    state.trial_in_flight = false;
  }
}

CircuitSnapshot CircuitBreaker::snapshotLocked(std::string_view handler,
                                               const State &state) const {
  CircuitSnapshot snapshot;
  snapshot.handler = std::string(handler);
  snapshot.status = state.status;
  snapshot.consecutive_failures = static_cast<std::uint32_t>(state.failures.size());
  snapshot.reopen_count = state.reopen_count;
  if (state.status != CircuitStatus::Closed) {
    snapshot.opened_at = state.opened_at;
  }
  snapshot.cool_down = state.cool_down;
  return snapshot;
}

CircuitSnapshot CircuitBreaker::inspect(std::string_view handler) const {
  const State *state = findState(handler);
  if (state == nullptr) {
    CircuitSnapshot snapshot;
    snapshot.handler = std::string(handler);
    snapshot.cool_down = config_.cool_down;
    return snapshot;
  }
  std::lock_guard<std::mutex> lock(state->mutex);
  return snapshotLocked(handler, *state);
}

std::vector<CircuitSnapshot> CircuitBreaker::inspectAll() const {
  std::shared_lock<std::shared_mutex> read(states_mutex_);
  std::vector<CircuitSnapshot> out;
  out.reserve(states_.size());
  for (const auto &[name, state] : states_) {
    std::lock_guard<std::mutex> lock(state->mutex);
    out.push_back(snapshotLocked(name, *state));
  }
  return out;
}

void CircuitBreaker::reset(std::string_view handler) {
  State &state = stateFor(handler);
  std::lock_guard<std::mutex> lock(state.mutex);
  state.status = CircuitStatus::Closed;
  state.failures.clear();
  state.reopen_count = 0;
  state.cool_down = config_.cool_down;
  state.trial_in_flight = false;
}

} // namespace switchyard::internal::breaker
