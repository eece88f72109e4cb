#include "airkit/air/air.h"

#include <string>

#include "airkit/error_handling/error_handling.h"
#include "airkit/math/math.h"

namespace airkit {

void Air::Validate() const {
  const std::vector<Assertion> assertions = GetAssertions();
  ASSERT_RELEASE(!assertions.empty(), "A computation must have at least one assertion.");
  ASSERT_RELEASE(
      assertions.size() == context_.NumAssertions(),
      "The context declares " + std::to_string(context_.NumAssertions()) +
          " assertions, but the computation has " + std::to_string(assertions.size()) + ".");
  NormalizeAssertions(assertions, context_.GetTraceInfo());

  const std::vector<std::vector<BaseFieldElement>> periodic_columns = GetPeriodicColumnValues();
  for (size_t i = 0; i < periodic_columns.size(); ++i) {
    const size_t cycle = periodic_columns[i].size();
    ASSERT_RELEASE(
        cycle >= 2 && IsPowerOfTwo(cycle) && cycle <= context_.TraceLength(),
        "Periodic column " + std::to_string(i) + " has " + std::to_string(cycle) +
            " values; the number of values must be a power of 2, at least 2, dividing the trace "
            "length.");
  }
}

}  // namespace airkit
