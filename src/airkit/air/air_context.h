#ifndef AIRKIT_AIR_AIR_CONTEXT_H_
#define AIRKIT_AIR_AIR_CONTEXT_H_

#include <cstddef>
#include <cstdint>
#include <vector>

#include "airkit/air/proof_parameters.h"
#include "airkit/air/trace_info.h"
#include "airkit/air/transition_constraint_degree.h"
#include "airkit/algebra/fields/base_field_element.h"

namespace airkit {

/*
  Holds the shape of a computation and every quantity derived from it: constraint degrees,
  the composition degree and the evaluation domains.

  Notation: n is the trace length and d is MaxConstraintDegree().
  - The constraint evaluation (CE) domain is of size CeBlowupFactor() * n, where
    CeBlowupFactor() is the smallest power of 2 not smaller than d. The composition polynomial is
    of degree exactly CompositionDegree() = CeDomainSize() - 1, and is split into
    NumCompositionColumns() columns of degree < n.
  - The low degree extension (LDE) domain is the coset DomainOffset() * <LdeDomainGenerator()> of
    size BlowupFactor() * n. It must contain the CE domain, so the blowup factor must be at least
    CeBlowupFactor().

  Immutable after construction.
*/
class AirContext {
 public:
  AirContext(
      TraceInfo trace_info, std::vector<TransitionConstraintDegree> transition_constraint_degrees,
      size_t num_assertions, ProofParameters proof_parameters);

  const TraceInfo& GetTraceInfo() const { return trace_info_; }
  size_t TraceWidth() const { return trace_info_.Width(); }
  uint64_t TraceLength() const { return trace_info_.Length(); }
  uint64_t TracePolyDegree() const { return trace_info_.Length() - 1; }

  const std::vector<TransitionConstraintDegree>& TransitionConstraintDegrees() const {
    return transition_constraint_degrees_;
  }
  size_t NumTransitionConstraints() const { return transition_constraint_degrees_.size(); }
  size_t NumAssertions() const { return num_assertions_; }
  const ProofParameters& GetProofParameters() const { return proof_parameters_; }

  size_t MaxConstraintDegree() const { return max_constraint_degree_; }
  uint64_t CeBlowupFactor() const { return ce_blowup_factor_; }
  uint64_t CeDomainSize() const { return ce_blowup_factor_ * TraceLength(); }
  // NextPowerOfTwo(d) * n - 1, independent of BlowupFactor().
  uint64_t CompositionDegree() const { return CeDomainSize() - 1; }
  size_t NumCompositionColumns() const { return ce_blowup_factor_; }

  uint64_t BlowupFactor() const { return proof_parameters_.BlowupFactor(); }
  uint64_t LdeDomainSize() const { return BlowupFactor() * TraceLength(); }

  /*
    Generator of the trace domain, a primitive root of unity of order TraceLength().
  */
  const BaseFieldElement& TraceGenerator() const { return trace_generator_; }
  const BaseFieldElement& LdeDomainGenerator() const { return lde_domain_generator_; }

  /*
    The LDE domain is shifted by this offset so that it is disjoint from the trace domain, where
    the divisors vanish.
  */
  static BaseFieldElement DomainOffset() { return BaseFieldElement::Generator(); }

 private:
  TraceInfo trace_info_;
  std::vector<TransitionConstraintDegree> transition_constraint_degrees_;
  size_t num_assertions_;
  ProofParameters proof_parameters_;
  size_t max_constraint_degree_ = 0;
  uint64_t ce_blowup_factor_ = 0;
  BaseFieldElement trace_generator_;
  BaseFieldElement lde_domain_generator_;
};

}  // namespace airkit

#endif  // AIRKIT_AIR_AIR_CONTEXT_H_
