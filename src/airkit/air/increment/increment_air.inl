namespace airkit {

template <typename FieldElementT>
void IncrementAir::EvaluateTransition(
    const EvaluationFrame<FieldElementT>& frame,
    gsl::span<const FieldElementT> /*periodic_values*/, gsl::span<FieldElementT> result) const {
  result[0] = frame.Next()[0] - (frame.Current()[0] + FieldElementT::One());
}

}  // namespace airkit
