#ifndef AIRKIT_UTILS_PROFILING_H_
#define AIRKIT_UTILS_PROFILING_H_

#include <chrono>
#include <string>

namespace airkit {

/*
  Annotates a stage of the computation (building an AIR, evaluating constraints) in the log, and
  measures its duration.
  In order to see the logs, pass the cmd line args: -v=1 --logtostderr.

  Use it in scoped RAII-style:
    {
      ProfilingBlock profiling_block("Evaluate constraints");
      EvaluateConstraints();
    }

  Or close it manually:
    ProfilingBlock profiling_block("Evaluate constraints");
    EvaluateConstraints();
    profiling_block.CloseBlock();
*/
class ProfilingBlock {
 public:
  explicit ProfilingBlock(std::string description);

  ~ProfilingBlock();

  /*
    Closes the block early, in case RAII is inconvenient.
  */
  void CloseBlock();

  /*
    Returns the time between the creation of the block and its closing, or until now if the block
    is still open. Unlike the log, it is measured regardless of the verbosity.
  */
  std::chrono::duration<double> Duration() const;

  ProfilingBlock(const ProfilingBlock&) = delete;
  ProfilingBlock& operator=(const ProfilingBlock&) = delete;
  ProfilingBlock(ProfilingBlock&& other) = delete;
  ProfilingBlock& operator=(ProfilingBlock&& other) = delete;

 private:
  std::chrono::time_point<std::chrono::system_clock> start_time_;
  std::chrono::time_point<std::chrono::system_clock> end_time_;
  const std::string description_;
  bool closed_ = false;
};

}  // namespace airkit

#endif  // AIRKIT_UTILS_PROFILING_H_
