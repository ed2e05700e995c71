#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>

#include "switchyard/internal/base/clock.h"
#include "switchyard/internal/dispatch/dispatch_config.h"

namespace switchyard::internal::dispatch {

struct HealthSnapshot {
  std::size_t samples{0};
  std::size_t failures{0};
  double failure_rate{0.0};
  std::chrono::microseconds mean_latency{0};
  bool healthy{true};
};

/**
 * @brief Sliding window of recent fast-path results per handler.
 *
 * A handler whose window shows too many failures (or too much latency) is
 * unhealthy. After health_probe_interval its window is cleared so the next
 * call probes the fast path again.
 */
class FastPathHealth {
public:
  explicit FastPathHealth(DispatchConfig config, base::ClockFn clock = base::steadyClock());

  FastPathHealth(const FastPathHealth &) = delete;
  FastPathHealth &operator=(const FastPathHealth &) = delete;

  [[nodiscard]] bool healthy(std::string_view handler);

  void record(std::string_view handler, bool success, std::chrono::microseconds latency);

  [[nodiscard]] HealthSnapshot inspect(std::string_view handler) const;

private:
  struct Sample {
    bool success{false};
    std::chrono::microseconds latency{0};
  };

  struct Window {
    mutable std::mutex mutex;
    std::deque<Sample> samples;
    std::optional<base::TimePoint> unhealthy_since;
  };

  Window &windowFor(std::string_view handler);
  HealthSnapshot evaluateLocked(const Window &window) const;

  DispatchConfig config_;
  base::ClockFn clock_;
  mutable std::shared_mutex windows_mutex_;
  std::map<std::string, std::unique_ptr<Window>, std::less<>> windows_;
};

} // namespace switchyard::internal::dispatch
