#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "switchyard/internal/base/clock.h"

namespace switchyard::internal::breaker {

enum class CircuitStatus : std::uint8_t {
  Closed,   ///< Calls pass; failures are counted
  Open,     ///< Calls fail fast until the cool-down elapses
  HalfOpen, ///< One trial call decides between Closed and Open
};

constexpr std::string_view toString(CircuitStatus status) {
  switch (status) {
  case CircuitStatus::Open:
    return "OPEN";
  case CircuitStatus::HalfOpen:
    return "HALF_OPEN";
  case CircuitStatus::Closed:
  default:
    return "CLOSED";
  }
}

/**
 * @brief Configuration for CircuitBreaker.
 */
struct CircuitBreakerConfig {
  /// Consecutive failures (inside failure_window) that open the circuit.
  std::uint32_t failure_threshold{5};

  /// Failures older than this no longer count; zero keeps every failure.
  std::chrono::milliseconds failure_window{std::chrono::seconds(60)};

  /// Time spent OPEN before a trial is admitted.
  std::chrono::milliseconds cool_down{std::chrono::seconds(30)};

  /// Cool-down growth factor each time a trial fails.
  double backoff_multiplier{2.0};

  /// Upper bound for the grown cool-down.
  std::chrono::milliseconds max_cool_down{std::chrono::minutes(5)};
};

/**
 * @brief Result of CircuitBreaker::acquire.
 */
enum class Admission : std::uint8_t {
  Allowed,  ///< Circuit closed; call normally
  Trial,    ///< Half-open trial; the caller must report the outcome
  Rejected, ///< Circuit open (or trial already running); do not call
};

/**
 * @brief Point-in-time view of one handler's circuit.
 */
struct CircuitSnapshot {
  std::string handler;
  CircuitStatus status{CircuitStatus::Closed};
  std::uint32_t consecutive_failures{0};
  std::uint32_t reopen_count{0};
  std::optional<base::TimePoint> opened_at;
  std::chrono::milliseconds cool_down{0};
};

/**
 * @brief Per-handler failure isolation.
 *
 * Each handler gets its own state and mutex, created on first use. The map of
 * handlers is guarded by a shared_mutex: lookups of existing handlers take the
 * shared lock and creation takes the exclusive lock. acquire() never waits
 * for the cool-down; it answers from the current state immediately.
 */
class CircuitBreaker {
public:
  explicit CircuitBreaker(CircuitBreakerConfig config = {},
                          base::ClockFn clock = base::steadyClock());
  ~CircuitBreaker();

  CircuitBreaker(const CircuitBreaker &) = delete;
  CircuitBreaker &operator=(const CircuitBreaker &) = delete;

  /// Decide whether `handler` may be called now.
  [[nodiscard]] Admission acquire(std::string_view handler);

  void recordSuccess(std::string_view handler);

  void recordFailure(std::string_view handler);

  /**
   * @brief Give back a trial slot that was admitted but never used.
   *
   * Used when a trial call was answered from cache or cancelled before it ran.
   */
  void releaseTrial(std::string_view handler);

  [[nodiscard]] CircuitSnapshot inspect(std::string_view handler) const;

  /// Snapshots of every handler seen so far, ordered by name.
  [[nodiscard]] std::vector<CircuitSnapshot> inspectAll() const;

  /// Forget all state for `handler`.
  void reset(std::string_view handler);

  [[nodiscard]] const CircuitBreakerConfig &config() const noexcept { return config_; }

private:
  struct State {
    mutable std::mutex mutex;
    CircuitStatus status{CircuitStatus::Closed};
    std::deque<base::TimePoint> failures;
    std::uint32_t reopen_count{0};
    base::TimePoint opened_at{};
    std::chrono::milliseconds cool_down{0};
    bool trial_in_flight{false};
  };

  State &stateFor(std::string_view handler);
  const State *findState(std::string_view handler) const;
  void pruneFailures(State &state, base::TimePoint now) const;
  void open(State &state, base::TimePoint now, std::string_view handler);
  CircuitSnapshot snapshotLocked(std::string_view handler, const State &state) const;

  CircuitBreakerConfig config_;
  base::ClockFn clock_;
  mutable std::shared_mutex states_mutex_;
  std::map<std::string, std::unique_ptr<State>, std::less<>> states_;
};

} // namespace switchyard::internal::breaker
