#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>

namespace switchyard::internal::execution {

struct LatencySummary {
  std::size_t samples{0};
  std::chrono::microseconds p50{0};
  std::chrono::microseconds p95{0};
  std::chrono::microseconds p99{0};
  std::uint64_t successes{0};
  std::uint64_t errors{0};
};

/**
 * @brief Latency percentiles over the most recent invocations.
 *
 * Percentiles use the nearest-rank method over the window; the success and
 * error counters cover the whole lifetime.
 */
class LatencyProfiler {
public:
  explicit LatencyProfiler(std::size_t window = 1024);

  void record(std::chrono::microseconds latency, bool success);

  [[nodiscard]] LatencySummary summary() const;

  void reset();

private:
  std::size_t window_;
  mutable std::mutex mutex_;
  std::deque<std::chrono::microseconds> samples_;
  std::uint64_t successes_{0};
  std::uint64_t errors_{0};
};

} // namespace switchyard::internal::execution
