#include <array>

namespace airkit {

template <typename FieldElementT>
ConstraintCompositionCoefficients<FieldElementT>
CoefficientGenerator::GetConstraintCompositionCoefficients(
    size_t num_transition_constraints, size_t num_boundary_constraints) const {
  const std::array<uint64_t, 3> counts{num_transition_constraints, num_boundary_constraints,
                                       FieldElementT::ExtensionDegree()};
  Prng prng = MakePrng("constraint_composition", counts);
  ConstraintCompositionCoefficients<FieldElementT> res;
  res.transition = DrawPairs<FieldElementT>(&prng, num_transition_constraints);
  res.boundary = DrawPairs<FieldElementT>(&prng, num_boundary_constraints);
  return res;
}

template <typename FieldElementT>
DeepCompositionCoefficients<FieldElementT> CoefficientGenerator::GetDeepCompositionCoefficients(
    size_t num_transition_constraints, size_t num_boundary_constraints, size_t trace_width,
    size_t num_composition_columns) const {
  const std::array<uint64_t, 5> counts{num_transition_constraints, num_boundary_constraints,
                                       trace_width, num_composition_columns,
                                       FieldElementT::ExtensionDegree()};
  Prng prng = MakePrng("deep_composition", counts);
  std::vector<std::pair<FieldElementT, FieldElementT>> trace =
      DrawPairs<FieldElementT>(&prng, trace_width);
  std::vector<std::pair<FieldElementT, FieldElementT>> composition =
      DrawPairs<FieldElementT>(&prng, num_composition_columns);
  std::vector<std::pair<FieldElementT, FieldElementT>> degree =
      DrawPairs<FieldElementT>(&prng, 1);
  return {std::move(trace), std::move(composition), degree[0]};
}

template <typename FieldElementT>
std::vector<std::pair<FieldElementT, FieldElementT>> CoefficientGenerator::DrawPairs(
    Prng* prng, size_t n) {
  std::vector<std::pair<FieldElementT, FieldElementT>> pairs;
  pairs.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    const FieldElementT alpha = FieldElementT::RandomElement(prng);
    const FieldElementT beta = FieldElementT::RandomElement(prng);
    pairs.emplace_back(alpha, beta);
  }
  return pairs;
}

}  // namespace airkit
