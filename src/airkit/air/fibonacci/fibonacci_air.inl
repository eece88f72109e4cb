namespace airkit {

template <typename FieldElementT>
void FibonacciAir::EvaluateTransition(
    const EvaluationFrame<FieldElementT>& frame,
    gsl::span<const FieldElementT> /*periodic_values*/, gsl::span<FieldElementT> result) const {
  const auto current = frame.Current();
  const auto next = frame.Next();
  result[0] = next[0] - (current[0] + current[1]);
  result[1] = next[1] - (current[1] + next[0]);
}

}  // namespace airkit
