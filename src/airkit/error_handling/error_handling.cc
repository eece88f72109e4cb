#include "airkit/error_handling/error_handling.h"

#include <sstream>
#include <string>

#define BACKWARD_HAS_DW 1  // Use libdw from elfutils to annotate the stack trace.
#include "backward.hpp"

namespace {

/*
  Writes the current stack trace to the given stream.
*/
void PrintStackTrace(std::ostream* s) {
  const size_t max_stack_depth = 64;

  backward::StackTrace st;
  st.load_here(max_stack_depth);
  backward::Printer p;
  p.print(st, *s);
}

}  // namespace

namespace airkit {

void ThrowAirkitException(
    const std::string& message, const char* file, size_t line_num) noexcept(false) {
  std::stringstream s;
  s << file << ":" << line_num << ": " << message << "\n";

  const size_t orig_message_len = s.tellp();
  PrintStackTrace(&s);

  std::string exception_str = s.str();

  // Frames from this file are noise, cut the trace where they begin.
  const size_t first_error_handling_line_pos =
      exception_str.find("src/airkit/error_handling/error_handling.cc\", line ");
  if (first_error_handling_line_pos != std::string::npos) {
    const size_t line_start_pos = exception_str.rfind('\n', first_error_handling_line_pos);
    if (line_start_pos != std::string::npos) {
      exception_str = exception_str.substr(0, line_start_pos);
    }
  }
  throw AirkitException(exception_str, orig_message_len);
}

void ThrowAirkitException(const char* msg, const char* file, size_t line_num) noexcept(false) {
  ThrowAirkitException(std::string(msg), file, line_num);
}

}  // namespace airkit
