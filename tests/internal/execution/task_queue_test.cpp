#include "switchyard/internal/execution/task_queue.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace execution = switchyard::internal::execution;

namespace {

execution::QueuedTask makeEntry(std::string handler, int priority) {
  execution::QueuedTask entry;
  entry.task.handler_name = std::move(handler);
  entry.task.priority = priority;
  return entry;
}

std::vector<std::string> drain(execution::PriorityTaskQueue &queue) {
  std::vector<std::string> order;
  while (!queue.empty()) {
    order.push_back(queue.pop().task.handler_name);
  }
  return order;
}

} // namespace

TEST(PriorityTaskQueue, StartsEmpty) {
  execution::PriorityTaskQueue queue;
  EXPECT_TRUE(queue.empty());
  EXPECT_EQ(queue.size(), 0u);
}

TEST(PriorityTaskQueue, LowerPriorityValueFirst) {
  execution::PriorityTaskQueue queue;
  queue.push(makeEntry("LOW", 70));
  queue.push(makeEntry("CRITICAL", 10));
  queue.push(makeEntry("NORMAL", 50));
  queue.push(makeEntry("HIGH", 30));
  EXPECT_EQ(queue.size(), 4u);

  const std::vector<std::string> expected{"CRITICAL", "HIGH", "NORMAL", "LOW"};
  EXPECT_EQ(drain(queue), expected);
}

TEST(PriorityTaskQueue, EqualPrioritiesAreFifo) {
  execution::PriorityTaskQueue queue;
  for (const char *name : {"A", "B", "C", "D", "E", "F"}) {
    queue.push(makeEntry(name, 50));
  }
  queue.push(makeEntry("URGENT", 1));

  const std::vector<std::string> expected{"URGENT", "A", "B", "C", "D", "E", "F"};
  EXPECT_EQ(drain(queue), expected);
}

TEST(PriorityTaskQueue, PushAssignsIncreasingSequence) {
  execution::PriorityTaskQueue queue;
  auto entry = makeEntry("A", 50);
  entry.sequence = 99;
  queue.push(std::move(entry));
  queue.push(makeEntry("B", 50));
  EXPECT_EQ(queue.pop().sequence, 0u);
  EXPECT_EQ(queue.pop().sequence, 1u);
}

TEST(PriorityTaskQueue, ClearDropsEverything) {
  execution::PriorityTaskQueue queue;
  queue.push(makeEntry("A", 1));
  queue.push(makeEntry("B", 2));
  queue.clear();
  EXPECT_TRUE(queue.empty());
}
