#include "airkit/utils/profiling.h"

#include <sstream>
#include <utility>

#include "glog/logging.h"

#include "airkit/error_handling/error_handling.h"

namespace airkit {

namespace {

// Command line argument -v should be at least 1 to enable profiling.
constexpr int kVlog = 1;

auto program_start = std::chrono::system_clock::now();

template <typename Duration>
void PrintDuration(std::ostream* os, Duration d) {
  std::chrono::duration<double> sec = d;
  *os << sec.count() << " sec";
}

}  // namespace

ProfilingBlock::ProfilingBlock(std::string description)
    : start_time_(std::chrono::system_clock::now()), description_(std::move(description)) {
  if (FLAGS_v < kVlog) {
    return;
  }
  std::stringstream os;
  if (!FLAGS_log_prefix) {
    PrintDuration(&os, std::chrono::system_clock::now() - program_start);
    os << ": ";
  }
  os << description_ << " started";
  VLOG(kVlog) << os.str();
}

ProfilingBlock::~ProfilingBlock() {
  if (!closed_) {
    CloseBlock();
  }
}

void ProfilingBlock::CloseBlock() {
  ASSERT_RELEASE(!closed_, "ProfilingBlock.CloseBlock() called twice.");
  end_time_ = std::chrono::system_clock::now();
  closed_ = true;
  if (FLAGS_v < kVlog) {
    return;
  }

  std::stringstream os;
  if (!FLAGS_log_prefix) {
    PrintDuration(&os, end_time_ - program_start);
    os << ": ";
  }
  os << description_ << " finished in ";
  PrintDuration(&os, Duration());
  VLOG(kVlog) << os.str();
}

std::chrono::duration<double> ProfilingBlock::Duration() const {
  return (closed_ ? end_time_ : std::chrono::system_clock::now()) - start_time_;
}

}  // namespace airkit
