#pragma once

#include <chrono>
#include <cstddef>

namespace switchyard::internal::execution {

/**
 * @brief Configuration for ExecutionEngine and its worker pool.
 */
struct ExecutionConfig {
  /// Concurrency slots; 0 means std::thread::hardware_concurrency().
  std::size_t worker_count{0};

  /// Candidates dispatched per request, highest ranked first.
  std::size_t max_fan_out{5};

  /// Deadline for one process() call.
  std::chrono::milliseconds call_timeout{std::chrono::seconds(30)};

  /// Invocations kept for latency percentiles.
  std::size_t latency_window{1024};
};

} // namespace switchyard::internal::execution
