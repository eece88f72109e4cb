#ifndef AIRKIT_UTILS_FLAG_VALIDATORS_H_
#define AIRKIT_UTILS_FLAG_VALIDATORS_H_

#include <cstdint>
#include <string>

namespace airkit {

/*
  Returns true if the file file_name is readable, and false otherwise.
*/
bool ValidateInputFile(const char* /*flagname*/, const std::string& file_name);

/*
  Returns true if the file file_name is writable, and false otherwise.
*/
bool ValidateOutputFile(const char* /*flagname*/, const std::string& file_name);

/*
  Returns true if the file file_name is either empty or writable, and
  false otherwise.
*/
bool ValidateOptionalOutputFile(const char* flagname, const std::string& file_name);

/*
  Returns true if trace_length is a valid trace length (see TraceInfo), and logs the reason
  otherwise.
*/
bool ValidateTraceLength(const char* flagname, uint64_t trace_length);

}  // namespace airkit

#endif  // AIRKIT_UTILS_FLAG_VALIDATORS_H_
