#include "switchyard/internal/execution/latency_profiler.h"

#include <gtest/gtest.h>

#include <chrono>

namespace execution = switchyard::internal::execution;
using namespace std::chrono_literals;

TEST(LatencyProfiler, EmptySummary) {
  execution::LatencyProfiler profiler;
  const auto summary = profiler.summary();
  EXPECT_EQ(summary.samples, 0u);
  EXPECT_EQ(summary.p50, 0us);
  EXPECT_EQ(summary.p99, 0us);
}

TEST(LatencyProfiler, NearestRankPercentiles) {
  execution::LatencyProfiler profiler;
  // Recorded out of order; summary() sorts.
  for (int i = 100; i >= 1; --i) {
    profiler.record(std::chrono::microseconds(i), i % 10 != 0);
  }
  const auto summary = profiler.summary();
  EXPECT_EQ(summary.samples, 100u);
  EXPECT_EQ(summary.p50, 50us);
  EXPECT_EQ(summary.p95, 95us);
  EXPECT_EQ(summary.p99, 99us);
  EXPECT_EQ(summary.successes, 90u);
  EXPECT_EQ(summary.errors, 10u);
}

TEST(LatencyProfiler, SingleSample) {
  execution::LatencyProfiler profiler;
  profiler.record(7us, true);
  const auto summary = profiler.summary();
  EXPECT_EQ(summary.p50, 7us);
  EXPECT_EQ(summary.p95, 7us);
  EXPECT_EQ(summary.p99, 7us);
}

TEST(LatencyProfiler, WindowKeepsMostRecent) {
  execution::LatencyProfiler profiler(4);
  profiler.record(1000us, true);
  profiler.record(1000us, true);
  for (int i = 0; i < 4; ++i) {
    profiler.record(10us, false);
  }
  const auto summary = profiler.summary();
  EXPECT_EQ(summary.samples, 4u);
  EXPECT_EQ(summary.p99, 10us);
  EXPECT_EQ(summary.successes, 2u);
  EXPECT_EQ(summary.errors, 4u);
}

TEST(LatencyProfiler, ResetClearsEverything) {
  execution::LatencyProfiler profiler;
  profiler.record(5us, true);
  profiler.reset();
  const auto summary = profiler.summary();
  EXPECT_EQ(summary.samples, 0u);
  EXPECT_EQ(summary.successes, 0u);
}
