#include "switchyard/internal/dispatch/fast_path_health.h"

#include <utility>

#include "switchyard/internal/diagnostics/log/log.h"

namespace switchyard::internal::dispatch {

FastPathHealth::FastPathHealth(DispatchConfig config, base::ClockFn clock)
    : config_(config), clock_(std::move(clock)) {
  if (config_.health_window == 0) {
    config_.health_window = 1;
  }
}

FastPathHealth::Window &FastPathHealth::windowFor(std::string_view handler) {
  {
    std::shared_lock<std::shared_mutex> read(windows_mutex_);
    const auto it = windows_.find(handler);
    if (it != windows_.end()) {
      return *it->second;
    }
  }
  std::unique_lock<std::shared_mutex> write(windows_mutex_);
  auto [it, inserted] = windows_.try_emplace(std::string(handler), nullptr);
  if (inserted) {
    it->second = std::make_unique<Window>();
  }
  return *it->second;
}

HealthSnapshot FastPathHealth::evaluateLocked(const Window &window) const {
  HealthSnapshot snapshot;
  snapshot.samples = window.samples.size();
  std::chrono::microseconds total{0};
  for (const Sample &sample : window.samples) {
    if (!sample.success) {
      ++snapshot.failures;
    }
    total += sample.latency;
  }
  if (snapshot.samples == 0) {
    return snapshot;
  }
  snapshot.failure_rate =
      static_cast<double>(snapshot.failures) / static_cast<double>(snapshot.samples);
  snapshot.mean_latency = total / static_cast<long long>(snapshot.samples);

  if (snapshot.samples < config_.health_min_samples) {
    return snapshot;
  }
  if (snapshot.failure_rate >= config_.max_failure_rate) {
    snapshot.healthy = false;
  }
  if (config_.max_fast_latency.count() > 0 &&
      snapshot.mean_latency > config_.max_fast_latency) {
    snapshot.healthy = false;
  }
  return snapshot;
}

bool FastPathHealth::healthy(std::string_view handler) {
  Window &window = windowFor(handler);
  const base::TimePoint now = clock_();
  std::lock_guard<std::mutex> lock(window.mutex);

  if (evaluateLocked(window).healthy) {
    window.unhealthy_since.reset();
    return true;
  }
  if (!window.unhealthy_since) {
    window.unhealthy_since = now;
    SWITCHYARD_LOG_WARN(Dispatch, "fast path for '" + std::string(handler) +
                                      "' marked unhealthy");
    return false;
  }
  if (now - *window.unhealthy_since >= config_.health_probe_interval) {
    window.samples.clear();
    window.unhealthy_since.reset();
    SWITCHYARD_LOG_INFO(Dispatch, "probing fast path for '" + std::string(handler) + "'");
    return true;
  }
  return false;
}

void FastPathHealth::record(std::string_view handler, bool success,
                            std::chrono::microseconds latency) {
  Window &window = windowFor(handler);
  std::lock_guard<std::mutex> lock(window.mutex);
  window.samples.push_back(Sample{success, latency});
  while (window.samples.size() > config_.health_window) {
    window.samples.pop_front();
  }
}

HealthSnapshot FastPathHealth::inspect(std::string_view handler) const {
  std::shared_lock<std::shared_mutex> read(windows_mutex_);
  const auto it = windows_.find(handler);
  if (it == windows_.end()) {
    return HealthSnapshot{};
  }
  std::lock_guard<std::mutex> lock(it->second->mutex);
  return evaluateLocked(*it->second);
}

} // namespace switchyard::internal::dispatch
