#ifndef AIRKIT_AIR_TRACE_H_
#define AIRKIT_AIR_TRACE_H_

#include <utility>
#include <vector>

#include "gsl/gsl-lite.hpp"

#include "airkit/air/trace_info.h"
#include "airkit/algebra/fields/base_field_element.h"
#include "airkit/error_handling/error_handling.h"

namespace airkit {

/*
  An execution trace, stored column by column: GetColumn(i)[j] is the value of register i at
  step j.
*/
class Trace {
 public:
  explicit Trace(std::vector<std::vector<BaseFieldElement>>&& columns) {
    ASSERT_RELEASE(!columns.empty(), "Trace cannot be empty.");
    const size_t length = columns.at(0).size();
    for (auto& column : columns) {
      ASSERT_RELEASE(column.size() == length, "All trace columns must be of the same length.");
      columns_.emplace_back(std::move(column));
    }
  }

  /*
    Returns the length of the trace.
  */
  uint64_t Length() const { return columns_[0].size(); }

  /*
    Returns the number of columns in the trace.
  */
  size_t Width() const { return columns_.size(); }

  /*
    Validates the shape of the trace (see TraceInfo) and returns it.
  */
  TraceInfo GetTraceInfo() const { return TraceInfo(Width(), Length()); }

  gsl::span<const BaseFieldElement> GetColumn(size_t index) const { return columns_.at(index); }

  const BaseFieldElement& At(size_t column, uint64_t step) const {
    return columns_.at(column).at(step);
  }

  /*
    Writes the values of all columns at the given step to row_out.
  */
  void ReadRow(uint64_t step, gsl::span<BaseFieldElement> row_out) const {
    ASSERT_RELEASE(row_out.size() == Width(), "Row size does not match the trace width.");
    for (size_t i = 0; i < columns_.size(); ++i) {
      row_out[i] = columns_[i][step];
    }
  }

  /*
    Consumes the data for the trace and returns it as a vector of columns.
  */
  std::vector<std::vector<BaseFieldElement>> ConsumeAsColumnsVector() && {
    return std::move(columns_);
  }

  /*
    Sets one cell of the trace to the given value. This method should only be used for testing.
  */
  void SetTraceElementForTesting(size_t column, uint64_t step, const BaseFieldElement& value) {
    columns_.at(column).at(step) = value;
  }

 private:
  std::vector<std::vector<BaseFieldElement>> columns_;
};

}  // namespace airkit

#endif  // AIRKIT_AIR_TRACE_H_
