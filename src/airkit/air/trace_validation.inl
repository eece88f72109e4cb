#include <algorithm>
#include <mutex>
#include <vector>

#include "airkit/error_handling/error_handling.h"
#include "airkit/utils/task_manager.h"

namespace airkit {

template <typename AirT>
std::optional<TraceViolation> FindTraceViolation(const AirT& air, const Trace& trace) {
  const AirContext& context = air.Context();
  ASSERT_RELEASE(
      trace.GetTraceInfo() == context.GetTraceInfo(),
      "The trace shape " + trace.GetTraceInfo().ToString() + " does not match the AIR shape " +
          context.GetTraceInfo().ToString() + ".");
  const uint64_t trace_length = context.TraceLength();

  const std::vector<Assertion> assertions = air.GetAssertions();
  for (size_t i = 0; i < assertions.size(); ++i) {
    const Assertion& assertion = assertions[i];
    for (const uint64_t step : assertion.Steps(trace_length)) {
      if (trace.At(assertion.Column(), step) != assertion.ValueAtStep(step, trace_length)) {
        return TraceViolation{ViolationKind::kAssertion, i, step};
      }
    }
  }

  const std::vector<std::vector<BaseFieldElement>> periodic_columns =
      air.GetPeriodicColumnValues();
  const size_t width = context.TraceWidth();
  const size_t num_constraints = context.NumTransitionConstraints();

  std::mutex mutex;
  std::optional<TraceViolation> first_violation;
  TaskManager::GetInstance().ParallelFor(
      trace_length - 1,
      [&](const TaskInfo& task_info) {
        std::vector<BaseFieldElement> current = BaseFieldElement::UninitializedVector(width);
        std::vector<BaseFieldElement> next = BaseFieldElement::UninitializedVector(width);
        std::vector<BaseFieldElement> periodic_values =
            BaseFieldElement::UninitializedVector(periodic_columns.size());
        std::vector<BaseFieldElement> result =
            BaseFieldElement::UninitializedVector(num_constraints);
        const EvaluationFrame<BaseFieldElement> frame(current, next);

        for (uint64_t step = task_info.start_idx; step < task_info.end_idx; ++step) {
          trace.ReadRow(step, current);
          trace.ReadRow(step + 1, next);
          for (size_t i = 0; i < periodic_columns.size(); ++i) {
            periodic_values[i] = periodic_columns[i][step % periodic_columns[i].size()];
          }
          std::fill(result.begin(), result.end(), BaseFieldElement::Zero());
          air.EvaluateTransition(
              frame, gsl::span<const BaseFieldElement>(periodic_values),
              gsl::span<BaseFieldElement>(result));

          const auto it = std::find_if(result.begin(), result.end(), [](const auto& value) {
            return value != BaseFieldElement::Zero();
          });
          if (it != result.end()) {
            const TraceViolation violation{ViolationKind::kTransition,
                                           static_cast<size_t>(it - result.begin()), step};
            std::lock_guard<std::mutex> lock(mutex);
            if (!first_violation.has_value() || first_violation->step > step) {
              first_violation = violation;
            }
            // Later steps of this task cannot be the first violation.
            return;
          }
        }
      },
      trace_length - 1, 256);
  return first_violation;
}

template <typename AirT>
void ValidateTrace(const AirT& air, const Trace& trace) {
  const std::optional<TraceViolation> violation = FindTraceViolation(air, trace);
  ASSERT_RELEASE(!violation.has_value(), "Invalid trace: " + violation->ToString());
}

}  // namespace airkit
