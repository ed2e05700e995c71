#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace switchyard::internal::dispatch {

/**
 * @brief Configuration for TandemDispatcher and its fast-path health window.
 */
struct DispatchConfig {
  /// Master switch for the fast path; false forces fallback everywhere.
  bool fast_path_enabled{true};

  /// Fallback attempts per invocation, including the first one.
  std::uint32_t max_attempts{3};

  /// Delay before the second fallback attempt; doubles per retry.
  std::chrono::milliseconds base_backoff{50};

  /// Upper bound for a single backoff delay.
  std::chrono::milliseconds max_backoff{1000};

  /// Number of recent fast-path samples kept per handler.
  std::size_t health_window{20};

  /// Samples required before the failure rate is trusted.
  std::size_t health_min_samples{5};

  /// Fast path is skipped while its failure rate is at or above this value.
  double max_failure_rate{0.5};

  /// Fast path is skipped while its mean latency exceeds this; zero disables the check.
  std::chrono::milliseconds max_fast_latency{0};

  /// How long an unhealthy fast path is skipped before its window is reset.
  std::chrono::milliseconds health_probe_interval{std::chrono::seconds(10)};
};

} // namespace switchyard::internal::dispatch
