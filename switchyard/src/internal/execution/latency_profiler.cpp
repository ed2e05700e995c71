#include "switchyard/internal/execution/latency_profiler.h"

#include <algorithm>
#include <vector>

namespace switchyard::internal::execution {

namespace {

std::chrono::microseconds nearestRank(const std::vector<std::chrono::microseconds> &sorted,
                                      std::size_t percentile) {
  const std::size_t rank = (percentile * sorted.size() + 99) / 100;
  const std::size_t index = rank == 0 ? 0 : rank - 1;
  return sorted[std::min(index, sorted.size() - 1)];
}

} // namespace

LatencyProfiler::LatencyProfiler(std::size_t window) : window_(window == 0 ? 1 : window) {}

void LatencyProfiler::record(std::chrono::microseconds latency, bool success) {
  std::lock_guard<std::mutex> lock(mutex_);
  samples_.push_back(latency);
  while (samples_.size() > window_) {
    samples_.pop_front();
  }
  if (success) {
    ++successes_;
  } else {
    ++errors_;
  }
}

LatencySummary LatencyProfiler::summary() const {
  std::vector<std::chrono::microseconds> sorted;
  LatencySummary out;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sorted.assign(samples_.begin(), samples_.end());
    out.successes = successes_;
    out.errors = errors_;
  }
  out.samples = sorted.size();
  if (sorted.empty()) {
    return out;
  }
  std::sort(sorted.begin(), sorted.end());
  out.p50 = nearestRank(sorted, 50);
  out.p95 = nearestRank(sorted, 95);
  out.p99 = nearestRank(sorted, 99);
  return out;
}

void LatencyProfiler::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  samples_.clear();
  successes_ = 0;
  errors_ = 0;
}

} // namespace switchyard::internal::execution
