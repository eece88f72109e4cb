#ifndef AIRKIT_UTILS_TASK_MANAGER_H_
#define AIRKIT_UTILS_TASK_MANAGER_H_

#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "gflags/gflags.h"
#include "gsl/gsl-lite.hpp"

#include "airkit/error_handling/error_handling.h"

DECLARE_uint32(n_threads);

namespace airkit {

struct TaskInfo {
  uint64_t start_idx;
  uint64_t end_idx;
};

/*
  Runs tasks on a pool of (n_threads - 1) worker threads.

  ParallelFor() splits a range into tasks, pushes them to a shared queue, and the calling thread
  joins the pool until all of its tasks are completed. Tasks may call ParallelFor() themselves.
*/
class TaskManager {
 public:
  TaskManager(const TaskManager&) = delete;
  TaskManager(TaskManager&&) = delete;
  TaskManager& operator=(const TaskManager&) = delete;
  TaskManager& operator=(TaskManager&&) = delete;

  ~TaskManager();

  /*
    Executes func on each item within [start_idx, end_idx), and returns when all tasks are
    completed.

    If func throws, the first exception is re-thrown from the thread that invoked ParallelFor.

    max_chunk_size_for_lambda limits the size of the range passed to a single call of func.
    If the range is smaller than min_work_chunk, it is executed by the calling thread alone.
  */
  void ParallelFor(
      uint64_t start_idx, uint64_t end_idx, const std::function<void(const TaskInfo&)>& func,
      uint64_t max_chunk_size_for_lambda = 1, uint64_t min_work_chunk = 1);

  void ParallelFor(
      uint64_t end_idx, const std::function<void(const TaskInfo&)>& func,
      uint64_t max_chunk_size_for_lambda = 1, uint64_t min_work_chunk = 1) {
    ParallelFor(0U, end_idx, func, max_chunk_size_for_lambda, min_work_chunk);
  }

  static TaskManager& GetInstance() {
    std::call_once(singleton_flag, InitSingleton);
    return *singleton;
  }

  /*
    Returns the number of threads used to execute tasks, including the calling thread.
  */
  size_t GetNumThreads() const { return workers_.size() + 1; }

  /*
    For tests only. Creates an instance with a given number of threads, bypassing the singleton.
  */
  static TaskManager CreateInstanceForTesting(
      size_t n_threads = std::thread::hardware_concurrency());

  /*
    Returns the id of the current thread: 0 for threads outside the pool, 1..n_threads-1 for
    workers.
  */
  static size_t GetWorkerId() { return worker_id; }

 private:
  static void SetWorkerIdForCurrentThread(size_t id) { worker_id = id; }

  /*
    ParallelFor() aims at kTaskRedundancyFactor * GetNumThreads() tasks per call, to balance
    uneven execution speed.
  */
  static constexpr uint64_t kTaskRedundancyFactor = 4;

  explicit TaskManager(size_t n_threads);
  static void InitSingleton();

  /*
    A condition variable that knows whether anyone waits on it, so that a new task wakes an idle
    worker if there is one, and the thread inside ParallelFor() otherwise. All the methods must be
    called with mutex_ held.
  */
  class CvWithWaitersCount {
   public:
    void Wait(std::unique_lock<std::mutex>* lock);

    /*
      Wakes one waiter. Returns false if there was none.
    */
    bool TryNotify();

    void NotifyAll() { cv_.notify_all(); }

   private:
    std::condition_variable cv_;
    size_t n_sleeping_threads_ = 0;
  };

  /*
    Runs tasks from tasks_ until *siblings_counter drops to 0. Workers run it with
    &continue_running_, which is cleared only by the destructor. ParallelFor() runs it with the
    number of tasks it queued that are not finished yet.
  */
  void TaskRunner(CvWithWaitersCount* cv, const size_t* siblings_counter);

  std::mutex mutex_;

  std::vector<std::thread> workers_;
  std::vector<std::function<void()>> tasks_;

  CvWithWaitersCount new_pending_task_;
  CvWithWaitersCount task_group_finished_;

  size_t continue_running_ = 1;

  static gsl::owner<TaskManager*> singleton;
  static std::once_flag singleton_flag;
  static thread_local size_t worker_id;
};

}  // namespace airkit

#endif  // AIRKIT_UTILS_TASK_MANAGER_H_
