namespace airkit {

template <typename FieldElementT>
void MimcAir::EvaluateTransition(
    const EvaluationFrame<FieldElementT>& frame, gsl::span<const FieldElementT> periodic_values,
    gsl::span<FieldElementT> result) const {
  const FieldElementT& x = frame.Current()[0];
  result[0] = frame.Next()[0] - (x * x * x + periodic_values[0]);
}

}  // namespace airkit
