#include "airkit/utils/task_manager.h"

#include <algorithm>
#include <exception>
#include <utility>

#include "glog/logging.h"

#include "airkit/math/math.h"

DEFINE_uint32(
    n_threads, 0,
    "Number of threads used for constraint evaluation. 0 means "
    "std::thread::hardware_concurrency().");

namespace airkit {

gsl::owner<TaskManager*> TaskManager::singleton = nullptr;
std::once_flag TaskManager::singleton_flag;
thread_local size_t TaskManager::worker_id = 0;

void TaskManager::CvWithWaitersCount::Wait(std::unique_lock<std::mutex>* lock) {
  ++n_sleeping_threads_;
  cv_.wait(*lock);
  --n_sleeping_threads_;
}

bool TaskManager::CvWithWaitersCount::TryNotify() {
  if (n_sleeping_threads_ == 0) {
    return false;
  }
  cv_.notify_one();
  return true;
}

TaskManager::TaskManager(size_t n_threads) {
  ASSERT_RELEASE(n_threads > 0, "TaskManager requires at least one thread.");
  workers_.reserve(n_threads - 1);
  for (size_t i = 1; i < n_threads; ++i) {
    workers_.emplace_back([this, i]() {
      SetWorkerIdForCurrentThread(i);
      TaskRunner(&new_pending_task_, &continue_running_);
    });
  }
}

TaskManager::~TaskManager() {
  {
    std::unique_lock<std::mutex> lock(mutex_);
    continue_running_ = 0;
    new_pending_task_.NotifyAll();
  }
  for (auto& worker : workers_) {
    worker.join();
  }
}

void TaskManager::InitSingleton() {
  const size_t n_threads =
      FLAGS_n_threads == 0 ? std::max<size_t>(std::thread::hardware_concurrency(), 1)
                           : FLAGS_n_threads;
  VLOG(1) << "Starting TaskManager with " << n_threads << " threads.";
  singleton = new TaskManager(n_threads);
}

TaskManager TaskManager::CreateInstanceForTesting(size_t n_threads) {
  return TaskManager(std::max<size_t>(n_threads, 1));
}

void TaskManager::TaskRunner(CvWithWaitersCount* cv, const size_t* siblings_counter) {
  std::unique_lock<std::mutex> lock(mutex_);
  while (*siblings_counter > 0) {
    if (tasks_.empty()) {
      cv->Wait(&lock);
      continue;
    }
    std::function<void()> task = std::move(tasks_.back());
    tasks_.pop_back();
    lock.unlock();
    task();
    lock.lock();
  }
}

void TaskManager::ParallelFor(
    uint64_t start_idx, uint64_t end_idx, const std::function<void(const TaskInfo&)>& func,
    uint64_t max_chunk_size_for_lambda, uint64_t min_work_chunk) {
  ASSERT_RELEASE(start_idx <= end_idx, "start_idx must not exceed end_idx.");
  ASSERT_RELEASE(max_chunk_size_for_lambda > 0, "max_chunk_size_for_lambda must be positive.");
  const uint64_t n_items = end_idx - start_idx;
  if (n_items == 0) {
    return;
  }

  const auto run_range = [&func, max_chunk_size_for_lambda](uint64_t begin, uint64_t end) {
    for (uint64_t idx = begin; idx < end; idx += max_chunk_size_for_lambda) {
      func({idx, std::min(idx + max_chunk_size_for_lambda, end)});
    }
  };

  if (workers_.empty() || n_items <= min_work_chunk) {
    run_range(start_idx, end_idx);
    return;
  }

  const uint64_t task_size = std::max<uint64_t>(
      std::max<uint64_t>(min_work_chunk, 1),
      DivCeil(n_items, kTaskRedundancyFactor * GetNumThreads()));
  const uint64_t n_tasks = DivCeil(n_items, task_size);

  size_t pending_tasks = n_tasks;
  std::exception_ptr first_exception = nullptr;

  {
    std::unique_lock<std::mutex> lock(mutex_);
    for (uint64_t task_idx = 0; task_idx < n_tasks; ++task_idx) {
      const uint64_t begin = start_idx + task_idx * task_size;
      const uint64_t end = std::min(begin + task_size, end_idx);
      tasks_.emplace_back([this, begin, end, &run_range, &pending_tasks, &first_exception]() {
        std::exception_ptr task_exception = nullptr;
        try {
          run_range(begin, end);
        } catch (...) {
          task_exception = std::current_exception();
        }
        std::unique_lock<std::mutex> task_lock(mutex_);
        if (task_exception != nullptr && first_exception == nullptr) {
          first_exception = task_exception;
        }
        if (--pending_tasks == 0) {
          task_group_finished_.NotifyAll();
        }
      });
      if (!new_pending_task_.TryNotify()) {
        task_group_finished_.TryNotify();
      }
    }
  }

  TaskRunner(&task_group_finished_, &pending_tasks);

  if (first_exception != nullptr) {
    std::rethrow_exception(first_exception);
  }
}

}  // namespace airkit
