namespace airkit {

template <typename FieldElementT>
void PeriodicCounterAir::EvaluateTransition(
    const EvaluationFrame<FieldElementT>& frame, gsl::span<const FieldElementT> periodic_values,
    gsl::span<FieldElementT> result) const {
  const auto current = frame.Current();
  const auto next = frame.Next();
  const FieldElementT& mask = periodic_values[0];
  result[0] = next[0] - (current[0] + FieldElementT::One()) * mask;
  result[1] = next[1] - (current[1] + current[0]);
}

}  // namespace airkit
