#include "switchyard/internal/execution/worker_pool.h"

#include <algorithm>
#include <stop_token>
#include <utility>

#include "switchyard/internal/diagnostics/error/error.h"
#include "switchyard/internal/diagnostics/error/error_macros.h"
#include "switchyard/internal/diagnostics/log/log.h"

namespace switchyard::internal::execution {

namespace errs = ::switchyard::internal::diagnostics::error;

namespace {

std::size_t resolveSlots(std::size_t requested) {
  if (requested != 0) {
    return requested;
  }
  return std::max<std::size_t>(1, std::thread::hardware_concurrency());
}

} // namespace

WorkerPool::WorkerPool(std::size_t slots) : slots_(resolveSlots(slots)) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (std::size_t i = 0; i < slots_; ++i) {
    spawnWorkerLocked();
  }
  SWITCHYARD_LOG_DEBUG(Engine, "worker pool started with " + std::to_string(slots_) + " slots");
}

WorkerPool::~WorkerPool() { shutdown(); }

void WorkerPool::spawnWorkerLocked() {
  threads_.emplace_back([this] { workerLoop(); });
}

void WorkerPool::reapFinishedLocked() {
  for (const std::thread::id id : finished_) {
    const auto it = std::find_if(threads_.begin(), threads_.end(),
                                 [id](const std::thread &t) { return t.get_id() == id; });
    if (it != threads_.end()) {
      it->join();
      threads_.erase(it);
    }
  }
  finished_.clear();
}

void WorkerPool::submit(Task task, base::CancellationToken cancel, TaskFn run) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    SWITCHYARD_THROW_IF(stopping_, InvalidState, "worker pool is shut down");
    reapFinishedLocked();
    queue_.push(QueuedTask{std::move(task), std::move(cancel), std::move(run), 0});
  }
  cv_.notify_one();
}

void WorkerPool::reclaimSlot(const std::shared_ptr<SlotTicket> &ticket) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (ticket->released) {
    return;
  }
  ticket->released = true;
  SWITCHYARD_ASSERT(running_ > 0, "worker pool slot released twice");
  --running_;
  ++reclaimed_;
  if (!stopping_) {
    reapFinishedLocked();
    spawnWorkerLocked();
  }
  cv_.notify_one();
}

void WorkerPool::workerLoop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (true) {
    cv_.wait(lock, [this] {
      return stopping_ || !finished_.empty() || (!queue_.empty() && running_ < slots_);
    });
    if (stopping_) {
      return;
    }
    reapFinishedLocked();
    if (queue_.empty() || running_ >= slots_) {
      continue;
    }

    QueuedTask job = queue_.pop();
    if (job.cancel.cancelled()) {
      ++skipped_;
      continue;
    }
    auto ticket = std::make_shared<SlotTicket>();
    ++running_;
    peak_running_ = std::max(peak_running_, running_);
    lock.unlock();

    {
      std::stop_callback on_cancel(job.cancel.stopToken(),
                                   [this, ticket] { reclaimSlot(ticket); });
      auto result = errs::captureResult([&] { job.run(job.task, job.cancel); });
      if (result.has_error()) {
        SWITCHYARD_LOG_ERROR(Engine, "task for '" + job.task.handler_name +
                                         "' raised: " + result.error().describe());
      }
    }

    lock.lock();
    ++completed_;
    if (ticket->released) {
      // A replacement worker already owns this slot.
      if (!stopping_) {
        // A live worker joins this thread once it has exited.
        finished_.push_back(std::this_thread::get_id());
        cv_.notify_one();
      }
      return;
    }
    ticket->released = true;
    SWITCHYARD_ASSERT(running_ > 0, "worker pool slot released twice");
    --running_;
    cv_.notify_one();
  }
}

void WorkerPool::shutdown() {
  std::list<std::thread> threads;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_ && threads_.empty()) {
      return;
    }
    stopping_ = true;
    skipped_ += queue_.size();
    queue_.clear();
    threads.swap(threads_);
    finished_.clear();
  }
  cv_.notify_all();
  for (std::thread &thread : threads) {
    if (thread.joinable()) {
      thread.join();
    }
  }
}

std::size_t WorkerPool::queueDepth() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

WorkerPoolStats WorkerPool::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  WorkerPoolStats out;
  out.slots = slots_;
  out.queued = queue_.size();
  out.running = running_;
  out.peak_running = peak_running_;
  out.completed = completed_;
  out.skipped = skipped_;
  out.reclaimed = reclaimed_;
  out.threads = threads_.size();
  return out;
}

} // namespace switchyard::internal::execution
