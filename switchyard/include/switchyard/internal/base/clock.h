#pragma once

#include <chrono>
#include <functional>

namespace switchyard::internal::base {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = Clock::duration;

/**
 * @brief Time source injected into time-dependent components.
 *
 * The cache, the circuit breaker and the dispatcher health window read time
 * only through a ClockFn so tests can drive them with a manual clock.
 */
using ClockFn = std::function<TimePoint()>;

inline ClockFn steadyClock() {
  return [] { return Clock::now(); };
}

template <typename Rep, typename Period>
constexpr std::chrono::milliseconds toMillis(std::chrono::duration<Rep, Period> d) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(d);
}

} // namespace switchyard::internal::base
