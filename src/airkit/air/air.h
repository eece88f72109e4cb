#ifndef AIRKIT_AIR_AIR_H_
#define AIRKIT_AIR_AIR_H_

#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

#include "gsl/gsl-lite.hpp"

#include "airkit/air/air_context.h"
#include "airkit/air/assertion.h"
#include "airkit/air/boundary_constraints.h"
#include "airkit/air/constraint_divisor.h"
#include "airkit/air/evaluation_frame.h"
#include "airkit/air/transition_constraints.h"
#include "airkit/algebra/fields/base_field_element.h"

namespace airkit {

/*
  The algebraic intermediate representation (AIR) of a computation: the transition constraints
  that every two consecutive rows of a valid trace satisfy, and the assertions that bind the trace
  to the public input.

  An implementation defines:
  * A PublicInputs type, and a constructor
      AirT(const TraceInfo& trace_info, const typename AirT::PublicInputs& public_inputs,
           const ProofParameters& proof_parameters);
    which builds the AirContext with the degrees of its transition constraints and the number of
    its assertions.
  * GetAssertions(), and GetPeriodicColumnValues() if it uses periodic columns.
  * EvaluateTransition (which is omitted here because it cannot be both virtual and template):

      template <typename FieldElementT>
      void EvaluateTransition(
          const EvaluationFrame<FieldElementT>& frame,
          gsl::span<const FieldElementT> periodic_values,
          gsl::span<FieldElementT> result) const;

    Writes the evaluation of the i-th transition constraint to result[i], where periodic_values[j]
    is the value of the j-th periodic column at the current row. For a valid trace, all results
    are zero on every row but the last. The constraints may use only addition, subtraction and
    multiplication, and the degree of the i-th one must match the i-th
    TransitionConstraintDegree of the context. It is called concurrently from several threads, so
    it must not modify the AIR.

  Instances should be created with BuildAir(), which validates the definition.
*/
class Air {
 public:
  virtual ~Air() = default;

  const AirContext& Context() const { return context_; }

  /*
    Returns the assertions on the trace. There must be exactly Context().NumAssertions() of them.
  */
  virtual std::vector<Assertion> GetAssertions() const = 0;

  /*
    Returns the values of the periodic columns over one cycle. The length of each column must be a
    power of 2 dividing the trace length, and at least 2, matching the cycles of
    TransitionConstraintDegree.
  */
  virtual std::vector<std::vector<BaseFieldElement>> GetPeriodicColumnValues() const { return {}; }

  /*
    Returns the validated assertions, without redundant ones (see NormalizeAssertions()).
  */
  std::vector<Assertion> GetNormalizedAssertions() const {
    return NormalizeAssertions(GetAssertions(), context_.GetTraceInfo());
  }

  /*
    The number of boundary constraints, i.e. of boundary coefficient pairs.
  */
  size_t NumBoundaryConstraints() const { return GetNormalizedAssertions().size(); }

  ConstraintDivisor TransitionDivisor() const {
    return ConstraintDivisor::Transition(context_.TraceLength());
  }

  template <typename FieldElementT>
  std::vector<BoundaryConstraintGroup<FieldElementT>> GetBoundaryConstraintGroups(
      gsl::span<const std::pair<FieldElementT, FieldElementT>> coefficients) const {
    return BuildBoundaryConstraintGroups<FieldElementT>(
        GetNormalizedAssertions(), context_, coefficients);
  }

  template <typename FieldElementT>
  std::vector<TransitionConstraintGroup<FieldElementT>> GetTransitionConstraintGroups(
      gsl::span<const std::pair<FieldElementT, FieldElementT>> coefficients) const {
    return BuildTransitionConstraintGroups<FieldElementT>(context_, coefficients);
  }

  /*
    Checks that the assertions and the periodic columns are consistent with the context.
  */
  void Validate() const;

 protected:
  explicit Air(AirContext context) : context_(std::move(context)) {}

 private:
  AirContext context_;
};

/*
  Builds and validates an instance of AirT. Fails on invalid parameters, on a blowup factor too
  small for the constraint degrees, on missing or conflicting assertions and on malformed periodic
  columns.
*/
template <typename AirT>
std::unique_ptr<AirT> BuildAir(
    const TraceInfo& trace_info, const typename AirT::PublicInputs& public_inputs,
    const ProofParameters& proof_parameters) {
  static_assert(std::is_base_of_v<Air, AirT>, "AirT must derive from Air.");
  auto air = std::make_unique<AirT>(trace_info, public_inputs, proof_parameters);
  air->Validate();
  return air;
}

}  // namespace airkit

#endif  // AIRKIT_AIR_AIR_H_
