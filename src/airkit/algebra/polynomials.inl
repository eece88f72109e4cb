#include "airkit/algebra/fft/fft.h"
#include "airkit/algebra/field_operations.h"

namespace airkit {

template <typename FieldElementPoints, typename FieldElementCoefs>
FieldElementPoints HornerEval(
    const FieldElementPoints& x, gsl::span<const FieldElementCoefs> coefs) {
  FieldElementPoints res = FieldElementPoints::Uninitialized();
  BatchHornerEval<FieldElementPoints, FieldElementCoefs>(
      gsl::make_span(&x, 1), coefs, gsl::make_span(&res, 1));
  return res;
}

template <typename FieldElementPoints, typename FieldElementCoefs>
void BatchHornerEval(
    gsl::span<const FieldElementPoints> points, gsl::span<const FieldElementCoefs> coefs,
    gsl::span<FieldElementPoints> outputs) {
  ASSERT_RELEASE(
      points.size() == outputs.size(),
      "The number of outputs must be the same as the number of points.");
  for (FieldElementPoints& res : outputs) {
    res = FieldElementPoints::Zero();
  }
  for (auto it = coefs.rbegin(); it != coefs.rend(); ++it) {
    for (size_t point_idx = 0; point_idx < points.size(); ++point_idx) {
      outputs[point_idx] = outputs[point_idx] * points[point_idx] + *it;
    }
  }
}

template <typename FieldElementT>
std::vector<FieldElementT> InterpolateOnCoset(
    gsl::span<const FieldElementT> values, const BaseFieldElement& offset) {
  std::vector<FieldElementT> coefs = FieldElementT::UninitializedVector(values.size());
  Ifft<FieldElementT>(values, coefs, GetSubGroupGenerator(values.size()), offset);
  return coefs;
}

template <typename FieldElementT>
std::vector<FieldElementT> EvaluateOnCoset(
    gsl::span<const FieldElementT> coefs, size_t domain_size, const BaseFieldElement& offset) {
  ASSERT_RELEASE(
      coefs.size() <= domain_size,
      "The domain must not be smaller than the number of coefficients.");
  std::vector<FieldElementT> padded(domain_size, FieldElementT::Zero());
  std::copy(coefs.begin(), coefs.end(), padded.begin());
  std::vector<FieldElementT> evaluation = FieldElementT::UninitializedVector(domain_size);
  Fft<FieldElementT>(padded, evaluation, GetSubGroupGenerator(domain_size), offset);
  return evaluation;
}

template <typename FieldElementT>
int64_t PolynomialDegree(gsl::span<const FieldElementT> coefs) {
  for (int64_t i = static_cast<int64_t>(coefs.size()) - 1; i >= 0; --i) {
    if (coefs[i] != FieldElementT::Zero()) {
      return i;
    }
  }
  return -1;
}

}  // namespace airkit
