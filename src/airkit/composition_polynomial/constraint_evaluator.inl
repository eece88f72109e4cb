#include <algorithm>
#include <string>

#include "airkit/algebra/field_operations.h"
#include "airkit/error_handling/error_handling.h"
#include "airkit/math/math.h"
#include "airkit/utils/task_manager.h"

namespace airkit {

namespace constraint_evaluator {
namespace details {

inline std::vector<PeriodicColumn> MakePeriodicColumns(
    const std::vector<std::vector<BaseFieldElement>>& values, uint64_t trace_length) {
  std::vector<PeriodicColumn> columns;
  columns.reserve(values.size());
  for (const auto& column_values : values) {
    columns.emplace_back(column_values, trace_length);
  }
  return columns;
}

/*
  Pre-allocated space for a single thread of EvalOnCoset().
*/
template <typename FieldElementT>
class WorkerMemory {
 public:
  WorkerMemory(
      size_t width, size_t n_periodic_columns, size_t n_constraints, size_t n_transition_groups,
      size_t n_boundary_groups, uint64_t task_size)
      : current(BaseFieldElement::UninitializedVector(width)),
        next(BaseFieldElement::UninitializedVector(width)),
        current_ext(FieldElementT::UninitializedVector(width)),
        periodic_values(BaseFieldElement::UninitializedVector(n_periodic_columns)),
        evaluations(BaseFieldElement::UninitializedVector(n_constraints)),
        evaluations_ext(FieldElementT::UninitializedVector(n_constraints)),
        points(BaseFieldElement::UninitializedVector(task_size)),
        transition_divisor_inverses(BaseFieldElement::UninitializedVector(task_size)),
        boundary_divisor_inverses(
            n_boundary_groups, BaseFieldElement::UninitializedVector(task_size)),
        transition_adjustment_powers(BaseFieldElement::UninitializedVector(n_transition_groups)),
        boundary_adjustment_powers(BaseFieldElement::UninitializedVector(n_boundary_groups)) {}

  // The current and next rows of the trace.
  std::vector<BaseFieldElement> current;
  std::vector<BaseFieldElement> next;
  std::vector<FieldElementT> current_ext;
  std::vector<BaseFieldElement> periodic_values;
  // Evaluations of the transition constraints.
  std::vector<BaseFieldElement> evaluations;
  std::vector<FieldElementT> evaluations_ext;
  // The points of the task and the inverses of the divisors on them.
  std::vector<BaseFieldElement> points;
  std::vector<BaseFieldElement> transition_divisor_inverses;
  std::vector<std::vector<BaseFieldElement>> boundary_divisor_inverses;
  // x^k for the degree adjustment k of each group, at the current point.
  std::vector<BaseFieldElement> transition_adjustment_powers;
  std::vector<BaseFieldElement> boundary_adjustment_powers;
};

}  // namespace details
}  // namespace constraint_evaluator

template <typename AirT, typename FieldElementT>
ConstraintEvaluator<AirT, FieldElementT>::ConstraintEvaluator(
    const AirT& air, const ConstraintCompositionCoefficients<FieldElementT>& coefficients)
    : air_(air),
      transition_divisor_(air.TransitionDivisor()),
      periodic_columns_(constraint_evaluator::details::MakePeriodicColumns(
          air.GetPeriodicColumnValues(), air.Context().TraceLength())),
      transition_groups_(
          air.template GetTransitionConstraintGroups<FieldElementT>(coefficients.transition)),
      boundary_groups_(
          air.template GetBoundaryConstraintGroups<FieldElementT>(coefficients.boundary)) {}

template <typename AirT, typename FieldElementT>
FieldElementT ConstraintEvaluator<AirT, FieldElementT>::EvalAtPoint(
    const FieldElementT& point, const EvaluationFrame<FieldElementT>& frame) const {
  const AirContext& context = air_.Context();
  ASSERT_RELEASE(
      frame.Width() == context.TraceWidth(), "The frame width does not match the trace width.");

  std::vector<FieldElementT> periodic_values;
  periodic_values.reserve(periodic_columns_.size());
  for (const PeriodicColumn& column : periodic_columns_) {
    periodic_values.push_back(column.EvalAtPoint(point));
  }

  std::vector<FieldElementT> evaluations(
      context.NumTransitionConstraints(), FieldElementT::Zero());
  air_.template EvaluateTransition<FieldElementT>(frame, periodic_values, evaluations);

  FieldElementT transition_sum = FieldElementT::Zero();
  for (const auto& group : transition_groups_) {
    transition_sum += group.MergeEvaluations(evaluations, Pow(point, group.DegreeAdjustment()));
  }
  const FieldElementT transition_divisor_value = transition_divisor_.EvaluateAt(point);
  ASSERT_RELEASE(
      transition_divisor_value != FieldElementT::Zero(),
      "Cannot evaluate the composition polynomial on the trace domain.");
  FieldElementT result = transition_sum / transition_divisor_value;

  for (const auto& group : boundary_groups_) {
    result += group.EvaluateAt(point, frame.Current());
  }
  return result;
}

template <typename AirT, typename FieldElementT>
void ConstraintEvaluator<AirT, FieldElementT>::EvalOnCoset(
    const BaseFieldElement& coset_offset,
    gsl::span<const gsl::span<const BaseFieldElement>> trace_evaluations,
    gsl::span<FieldElementT> out_evaluation, uint64_t task_size) const {
  const AirContext& context = air_.Context();
  const uint64_t trace_length = context.TraceLength();
  const uint64_t coset_size = out_evaluation.size();

  // Input verification.
  ASSERT_RELEASE(task_size > 0, "The task size must be positive.");
  ASSERT_RELEASE(
      IsPowerOfTwo(coset_size) && coset_size >= trace_length,
      "The coset size must be a power of 2 not smaller than the trace length.");
  ASSERT_RELEASE(
      trace_evaluations.size() == context.TraceWidth(),
      "Expected evaluations of " + std::to_string(context.TraceWidth()) + " trace columns, got " +
          std::to_string(trace_evaluations.size()) + ".");
  for (const auto& column : trace_evaluations) {
    ASSERT_RELEASE(
        column.size() == coset_size, "Trace column evaluation size does not match the coset size.");
  }

  // Precompute useful constants.
  const uint64_t next_row_shift = coset_size / trace_length;
  const uint64_t index_mask = coset_size - 1;
  const uint_fast64_t n_tasks = DivCeil(coset_size, task_size);
  const BaseFieldElement coset_generator = GetSubGroupGenerator(coset_size);
  const BaseFieldElement generator_pow_n = Pow(coset_generator, trace_length);
  const BaseFieldElement exclusion_point = transition_divisor_.ExclusionPoint();

  std::vector<BaseFieldElement> boundary_generator_powers;
  boundary_generator_powers.reserve(boundary_groups_.size());
  for (const auto& group : boundary_groups_) {
    boundary_generator_powers.push_back(
        Pow(coset_generator, group.Divisor().NumeratorDegree()));
  }

  // x -> g*x multiplies x^k by g^k.
  std::vector<BaseFieldElement> transition_adjustment_shifts;
  transition_adjustment_shifts.reserve(transition_groups_.size());
  for (const auto& group : transition_groups_) {
    transition_adjustment_shifts.push_back(Pow(coset_generator, group.DegreeAdjustment()));
  }
  std::vector<BaseFieldElement> boundary_adjustment_shifts;
  boundary_adjustment_shifts.reserve(boundary_groups_.size());
  for (const auto& group : boundary_groups_) {
    boundary_adjustment_shifts.push_back(Pow(coset_generator, group.DegreeAdjustment()));
  }

  // Prepare offset for each task.
  std::vector<BaseFieldElement> algebraic_offsets;
  algebraic_offsets.reserve(n_tasks);
  BaseFieldElement point = coset_offset;
  const BaseFieldElement point_multiplier = Pow(coset_generator, task_size);
  for (uint64_t i = 0; i < n_tasks; ++i) {
    algebraic_offsets.push_back(point);
    point *= point_multiplier;
  }

  // Prepare #threads workers.
  using WorkerMemoryT = constraint_evaluator::details::WorkerMemory<FieldElementT>;
  TaskManager& task_manager = TaskManager::GetInstance();
  std::vector<WorkerMemoryT> worker_mem;
  worker_mem.reserve(task_manager.GetNumThreads());
  for (size_t i = 0; i < task_manager.GetNumThreads(); ++i) {
    worker_mem.emplace_back(
        context.TraceWidth(), periodic_columns_.size(), context.NumTransitionConstraints(),
        transition_groups_.size(), boundary_groups_.size(), task_size);
  }

  std::vector<typename PeriodicColumn::CosetEvaluation> periodic_column_cosets;
  periodic_column_cosets.reserve(periodic_columns_.size());
  for (const PeriodicColumn& column : periodic_columns_) {
    periodic_column_cosets.push_back(column.GetCoset(coset_offset, coset_size));
  }

  task_manager.ParallelFor(n_tasks, [&, this](const TaskInfo& task_info) {
    const uint64_t task_idx = task_info.start_idx;
    const uint64_t initial_point_idx = task_size * task_idx;
    const size_t actual_task_size = std::min(task_size, coset_size - initial_point_idx);
    WorkerMemoryT& wm = worker_mem[TaskManager::GetWorkerId()];

    // Points of the task.
    BaseFieldElement x = algebraic_offsets[task_idx];
    for (size_t k = 0; k < actual_task_size; ++k) {
      wm.points[k] = x;
      x *= coset_generator;
    }

    // Inverse of the transition divisor: (x - g^{n-1}) / (x^n - 1).
    const auto transition_inverses =
        gsl::make_span(wm.transition_divisor_inverses).first(actual_task_size);
    BaseFieldElement x_pow_n = Pow(wm.points[0], trace_length);
    for (size_t k = 0; k < actual_task_size; ++k) {
      transition_inverses[k] = x_pow_n - BaseFieldElement::One();
      x_pow_n *= generator_pow_n;
    }
    BatchInverseInPlace(transition_inverses);
    for (size_t k = 0; k < actual_task_size; ++k) {
      transition_inverses[k] *= wm.points[k] - exclusion_point;
    }

    // Inverses of the boundary divisors: 1 / (x^m - c).
    for (size_t j = 0; j < boundary_groups_.size(); ++j) {
      const ConstraintDivisor& divisor = boundary_groups_[j].Divisor();
      const auto boundary_inverses =
          gsl::make_span(wm.boundary_divisor_inverses[j]).first(actual_task_size);
      BaseFieldElement x_pow_m = Pow(wm.points[0], divisor.NumeratorDegree());
      for (size_t k = 0; k < actual_task_size; ++k) {
        boundary_inverses[k] = x_pow_m - divisor.NumeratorOffset();
        x_pow_m *= boundary_generator_powers[j];
      }
      BatchInverseInPlace(boundary_inverses);
    }

    for (size_t i = 0; i < transition_groups_.size(); ++i) {
      wm.transition_adjustment_powers[i] =
          Pow(wm.points[0], transition_groups_[i].DegreeAdjustment());
    }
    for (size_t j = 0; j < boundary_groups_.size(); ++j) {
      wm.boundary_adjustment_powers[j] = Pow(wm.points[0], boundary_groups_[j].DegreeAdjustment());
    }

    for (size_t k = 0; k < actual_task_size; ++k) {
      const uint64_t point_idx = initial_point_idx + k;
      const uint64_t next_point_idx = (point_idx + next_row_shift) & index_mask;
      for (size_t c = 0; c < trace_evaluations.size(); ++c) {
        wm.current[c] = trace_evaluations[c][point_idx];
        wm.next[c] = trace_evaluations[c][next_point_idx];
        wm.current_ext[c] = FieldElementT::FromBaseField(wm.current[c]);
      }
      for (size_t p = 0; p < periodic_column_cosets.size(); ++p) {
        wm.periodic_values[p] = periodic_column_cosets[p][point_idx];
      }

      std::fill(wm.evaluations.begin(), wm.evaluations.end(), BaseFieldElement::Zero());
      air_.template EvaluateTransition<BaseFieldElement>(
          EvaluationFrame<BaseFieldElement>(wm.current, wm.next), wm.periodic_values,
          wm.evaluations);
      for (size_t t = 0; t < wm.evaluations.size(); ++t) {
        wm.evaluations_ext[t] = FieldElementT::FromBaseField(wm.evaluations[t]);
      }

      FieldElementT transition_sum = FieldElementT::Zero();
      for (size_t i = 0; i < transition_groups_.size(); ++i) {
        transition_sum += transition_groups_[i].MergeEvaluations(
            wm.evaluations_ext, FieldElementT::FromBaseField(wm.transition_adjustment_powers[i]));
        wm.transition_adjustment_powers[i] *= transition_adjustment_shifts[i];
      }
      FieldElementT result = transition_sum * transition_inverses[k];

      const FieldElementT point_ext = FieldElementT::FromBaseField(wm.points[k]);
      for (size_t j = 0; j < boundary_groups_.size(); ++j) {
        result += boundary_groups_[j].MergeNumerators(
                      point_ext, wm.current_ext,
                      FieldElementT::FromBaseField(wm.boundary_adjustment_powers[j])) *
                  wm.boundary_divisor_inverses[j][k];
        wm.boundary_adjustment_powers[j] *= boundary_adjustment_shifts[j];
      }

      out_evaluation[point_idx] = result;
    }
  });
}

}  // namespace airkit
