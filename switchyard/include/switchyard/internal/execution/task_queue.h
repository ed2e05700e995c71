#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

#include "switchyard/internal/base/cancellation.h"
#include "switchyard/internal/execution/task.h"

namespace switchyard::internal::execution {

using TaskFn = std::function<void(const Task &, const base::CancellationToken &)>;

/**
 * @brief A task waiting for a worker slot.
 */
struct QueuedTask {
  Task task;
  base::CancellationToken cancel;
  TaskFn run;
  /// Submission order, assigned by PriorityTaskQueue::push.
  std::uint64_t sequence{0};
};

/**
 * @brief Priority queue of tasks: lower priority value first, FIFO among equals.
 *
 * Not thread-safe; WorkerPool guards it with its own mutex.
 */
class PriorityTaskQueue {
public:
  PriorityTaskQueue() = default;

  PriorityTaskQueue(const PriorityTaskQueue &) = delete;
  PriorityTaskQueue &operator=(const PriorityTaskQueue &) = delete;
  PriorityTaskQueue(PriorityTaskQueue &&) noexcept = default;
  PriorityTaskQueue &operator=(PriorityTaskQueue &&) noexcept = default;

  void push(QueuedTask entry) {
    entry.sequence = next_sequence_++;
    heap_.push_back(std::move(entry));
    std::push_heap(heap_.begin(), heap_.end(), Later{});
  }

  /// Remove and return the next task. The queue must not be empty.
  QueuedTask pop() {
    std::pop_heap(heap_.begin(), heap_.end(), Later{});
    QueuedTask top = std::move(heap_.back());
    heap_.pop_back();
    return top;
  }

  [[nodiscard]] bool empty() const noexcept { return heap_.empty(); }
  [[nodiscard]] std::size_t size() const noexcept { return heap_.size(); }

  /// Drop every queued task.
  void clear() { heap_.clear(); }

private:
  struct Later {
    bool operator()(const QueuedTask &lhs, const QueuedTask &rhs) const noexcept {
      if (lhs.task.priority != rhs.task.priority) {
        return lhs.task.priority > rhs.task.priority;
      }
      return lhs.sequence > rhs.sequence;
    }
  };

  std::vector<QueuedTask> heap_;
  std::uint64_t next_sequence_{0};
};

} // namespace switchyard::internal::execution
