#ifndef AIRKIT_AIR_TRACE_VALIDATION_H_
#define AIRKIT_AIR_TRACE_VALIDATION_H_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "airkit/air/air.h"
#include "airkit/air/trace.h"

namespace airkit {

enum class ViolationKind { kAssertion, kTransition };

/*
  A constraint that does not hold on a trace. For an assertion violation, index is the index of
  the assertion in GetAssertions() and step is the asserted step. For a transition violation,
  index is the index of the transition constraint, which does not evaluate to zero on the rows
  step and step + 1.
*/
struct TraceViolation {
  ViolationKind kind;
  size_t index;
  uint64_t step;

  std::string ToString() const;
};

/*
  Checks every assertion and every transition constraint of air on trace, and returns the first
  violation: assertions first (in order), then transitions by step and constraint index.
  Transitions are evaluated in parallel using the TaskManager.
*/
template <typename AirT>
std::optional<TraceViolation> FindTraceViolation(const AirT& air, const Trace& trace);

/*
  Same as FindTraceViolation(), but throws an AirkitException describing the first violation.
  Used to check the output of trace generators.
*/
template <typename AirT>
void ValidateTrace(const AirT& air, const Trace& trace);

}  // namespace airkit

#include "airkit/air/trace_validation.inl"

#endif  // AIRKIT_AIR_TRACE_VALIDATION_H_
