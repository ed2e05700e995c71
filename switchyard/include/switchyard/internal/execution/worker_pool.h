#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "switchyard/internal/base/cancellation.h"
#include "switchyard/internal/execution/task.h"
#include "switchyard/internal/execution/task_queue.h"

namespace switchyard::internal::execution {

struct WorkerPoolStats {
  std::size_t slots{0};
  std::size_t queued{0};
  std::size_t running{0};
  std::size_t peak_running{0};
  std::uint64_t completed{0};
  /// Tasks dropped from the queue because they were cancelled before starting.
  std::uint64_t skipped{0};
  /// Slots released by cancellation while the task was still running.
  std::uint64_t reclaimed{0};
  /// Worker threads not yet joined; exceeds `slots` while a reclaimed task is still running.
  std::size_t threads{0};
};

/**
 * @brief Fixed number of concurrency slots fed from a priority queue.
 *
 * At most `slots` tasks hold a slot at any time. When a running task's
 * cancellation token fires, its slot is released immediately and a
 * replacement thread is started, so a handler that ignores cancellation
 * cannot starve the pool. The stuck thread exits once its task returns.
 * Tasks still queued at shutdown are dropped without running.
 */
class WorkerPool {
public:
  /// @param slots Concurrency bound; 0 means hardware_concurrency (at least 1).
  explicit WorkerPool(std::size_t slots = 0);
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  /**
   * @brief Queue `task`; `run` is called on a worker once a slot is free.
   *
   * @throws SwitchyardException InvalidState after shutdown().
   */
  void submit(Task task, base::CancellationToken cancel, TaskFn run);

  /// Stop accepting work, drop queued tasks and join every worker.
  void shutdown();

  [[nodiscard]] std::size_t slots() const noexcept { return slots_; }

  [[nodiscard]] std::size_t queueDepth() const;

  [[nodiscard]] WorkerPoolStats stats() const;

private:
  struct SlotTicket {
    bool released{false};
  };

  void workerLoop();
  void spawnWorkerLocked();
  void reapFinishedLocked();
  void reclaimSlot(const std::shared_ptr<SlotTicket> &ticket);

  std::size_t slots_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  PriorityTaskQueue queue_;
  bool stopping_{false};

  std::list<std::thread> threads_;
  std::vector<std::thread::id> finished_;

  std::size_t running_{0};
  std::size_t peak_running_{0};
  std::uint64_t completed_{0};
  std::uint64_t skipped_{0};
  std::uint64_t reclaimed_{0};
};

} // namespace switchyard::internal::execution
