#include "airkit/utils/task_manager.h"

#include <atomic>
#include <stdexcept>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace airkit {
namespace {

TEST(TaskManager, ParallelForVisitsEveryIndexOnce) {
  TaskManager task_manager = TaskManager::CreateInstanceForTesting(4);
  EXPECT_EQ(4U, task_manager.GetNumThreads());
  std::vector<std::atomic<int>> visits(1000);
  task_manager.ParallelFor(
      visits.size(),
      [&visits](const TaskInfo& task_info) {
        for (uint64_t i = task_info.start_idx; i < task_info.end_idx; ++i) {
          visits[i]++;
        }
      },
      7);
  for (const auto& v : visits) {
    EXPECT_EQ(1, v.load());
  }
}

TEST(TaskManager, RespectsMaxChunkSize) {
  TaskManager task_manager = TaskManager::CreateInstanceForTesting(3);
  std::atomic<uint64_t> total(0);
  task_manager.ParallelFor(
      10, 110,
      [&total](const TaskInfo& task_info) {
        EXPECT_LE(task_info.end_idx - task_info.start_idx, 4U);
        total += task_info.end_idx - task_info.start_idx;
      },
      4);
  EXPECT_EQ(100U, total.load());
}

TEST(TaskManager, NestedParallelFor) {
  TaskManager task_manager = TaskManager::CreateInstanceForTesting(4);
  std::atomic<int> counter(0);
  task_manager.ParallelFor(8, [&](const TaskInfo&) {
    task_manager.ParallelFor(8, [&](const TaskInfo&) { counter++; });
  });
  EXPECT_EQ(64, counter.load());
}

TEST(TaskManager, ExceptionIsRethrown) {
  TaskManager task_manager = TaskManager::CreateInstanceForTesting(4);
  EXPECT_THROW(
      task_manager.ParallelFor(
          100,
          [](const TaskInfo& task_info) {
            if (task_info.start_idx == 50) {
              throw std::runtime_error("task failed");
            }
          }),
      std::runtime_error);
}

TEST(TaskManager, SingleThread) {
  TaskManager task_manager = TaskManager::CreateInstanceForTesting(1);
  int sum = 0;
  task_manager.ParallelFor(5, [&sum](const TaskInfo& task_info) {
    sum += static_cast<int>(task_info.start_idx);
    EXPECT_EQ(0U, TaskManager::GetWorkerId());
  });
  EXPECT_EQ(10, sum);
}

}  // namespace
}  // namespace airkit
