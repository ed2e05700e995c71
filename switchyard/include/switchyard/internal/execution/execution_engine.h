#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "switchyard/internal/base/clock.h"
#include "switchyard/internal/breaker/circuit_breaker.h"
#include "switchyard/internal/cache/result_cache.h"
#include "switchyard/internal/dispatch/tandem_dispatcher.h"
#include "switchyard/internal/execution/aggregated_response.h"
#include "switchyard/internal/execution/execution_config.h"
#include "switchyard/internal/execution/latency_profiler.h"
#include "switchyard/internal/execution/task.h"
#include "switchyard/internal/execution/worker_pool.h"
#include "switchyard/internal/registry/handler_registry.h"

namespace switchyard::internal::execution {

/**
 * @brief Operational view returned by ExecutionEngine::getStatus.
 */
struct EngineStatus {
  std::uint64_t generation{0};
  std::size_t handler_count{0};
  bool fast_path_available{false};
  std::string fast_path_detail;
  cache::CacheStats cache;
  std::vector<breaker::CircuitSnapshot> circuits;
  WorkerPoolStats pool;
  LatencySummary latency;
  std::uint64_t requests{0};
};

/**
 * @brief Routes a request and runs its candidate handlers.
 *
 * The engine owns its worker pool and latency profile; the registry, cache,
 * breaker and dispatcher are injected and must outlive it. process() may be
 * called from many threads at once.
 */
class ExecutionEngine {
public:
  ExecutionEngine(registry::HandlerRegistry &registry, cache::ResultCache &cache,
                  breaker::CircuitBreaker &breaker, dispatch::TandemDispatcher &dispatcher,
                  ExecutionConfig config = {});
  ~ExecutionEngine();

  ExecutionEngine(const ExecutionEngine &) = delete;
  ExecutionEngine &operator=(const ExecutionEngine &) = delete;

  /**
   * @brief Match `input` and dispatch the top candidates.
   *
   * `hints` name handlers to run regardless of matching; they are ranked
   * first. Per-handler failures are reported in the response.
   *
   * @throws SwitchyardException InputTooLarge for oversized input and
   *         RegistryNotLoaded before the registry has been loaded.
   */
  AggregatedResponse process(std::string_view input,
                             const std::vector<std::string> &hints = {});

  [[nodiscard]] EngineStatus getStatus() const;

  [[nodiscard]] const ExecutionConfig &config() const noexcept { return config_; }

private:
  HandlerOutcome runTask(const Task &task, handler::ExecutionMode mode,
                         const base::CancellationToken &cancel);

  registry::HandlerRegistry &registry_;
  cache::ResultCache &cache_;
  breaker::CircuitBreaker &breaker_;
  dispatch::TandemDispatcher &dispatcher_;
  ExecutionConfig config_;

  LatencyProfiler profiler_;
  std::atomic<std::uint64_t> next_request_id_{1};
  std::atomic<std::uint64_t> next_task_id_{1};
  std::atomic<std::uint64_t> requests_{0};

  // Declared last so its workers are joined before anything they use is destroyed.
  WorkerPool pool_;
};

} // namespace switchyard::internal::execution
