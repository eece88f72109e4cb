#ifndef AIRKIT_AIR_EVALUATION_FRAME_H_
#define AIRKIT_AIR_EVALUATION_FRAME_H_

#include <cstddef>

#include "gsl/gsl-lite.hpp"

#include "airkit/error_handling/error_handling.h"

namespace airkit {

/*
  A read-only view of two consecutive rows of the trace (or of the trace polynomials evaluated at
  x and at g * x), passed to the transition constraints. The frame does not own the rows, and must
  not outlive them.
*/
template <typename FieldElementT>
class EvaluationFrame {
 public:
  EvaluationFrame(gsl::span<const FieldElementT> current, gsl::span<const FieldElementT> next)
      : current_(current), next_(next) {
    ASSERT_RELEASE(!current_.empty(), "An evaluation frame must have at least one column.");
    ASSERT_RELEASE(
        current_.size() == next_.size(), "The rows of an evaluation frame must have equal width.");
  }

  gsl::span<const FieldElementT> Current() const { return current_; }
  gsl::span<const FieldElementT> Next() const { return next_; }
  size_t Width() const { return current_.size(); }

 private:
  gsl::span<const FieldElementT> current_;
  gsl::span<const FieldElementT> next_;
};

}  // namespace airkit

#endif  // AIRKIT_AIR_EVALUATION_FRAME_H_
