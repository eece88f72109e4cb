#ifndef AIRKIT_COMPOSITION_POLYNOMIAL_PERIODIC_COLUMN_H_
#define AIRKIT_COMPOSITION_POLYNOMIAL_PERIODIC_COLUMN_H_

#include <cstdint>
#include <utility>
#include <vector>

#include "gsl/gsl-lite.hpp"

#include "airkit/algebra/fields/base_field_element.h"
#include "airkit/error_handling/error_handling.h"
#include "airkit/math/math.h"

namespace airkit {

/*
  Represents a polynomial whose evaluation on the trace domain is periodic with a given period.
  This is used for public columns (known both to the prover and the verifier) with a small period,
  such as round constants that repeat every invocation of a hash function.

  With c = values.size() and n the trace length, the column is P(x^{n/c}) where P is the
  polynomial of degree < c interpolating values on the subgroup of size c. Hence
  P((g^i)^{n/c}) = values[i % c] for the trace generator g, and the degree of the column as a
  polynomial in x is (c - 1) * n / c.

  Example usage:
    PeriodicColumn column(values, trace_length);
    auto coset_eval = column.GetCoset(offset, coset_size);
    ParallelFor(..., {
      auto it = coset_eval.begin() + start;
      // Thread-safe use of the iterator.
    }).
*/
class PeriodicColumn {
 public:
  PeriodicColumn(gsl::span<const BaseFieldElement> values, uint64_t trace_length);

  uint64_t Period() const { return period_; }

  /*
    The value of the column at the given step of the trace.
  */
  const BaseFieldElement& ValueAtStep(uint64_t step) const { return values_[step % period_]; }

  /*
    Returns the evaluation of the column at a given point.
  */
  template <typename FieldElementT>
  FieldElementT EvalAtPoint(const FieldElementT& x) const;

  class CosetEvaluation;

  /*
    Returns the evaluation of the column on the coset {offset * h^i}, where h generates the
    subgroup of size coset_size. coset_size must be a power of 2 not smaller than the trace length.
  */
  CosetEvaluation GetCoset(const BaseFieldElement& offset, uint64_t coset_size) const;

 private:
  const std::vector<BaseFieldElement> values_;
  const uint64_t period_;
  const uint64_t trace_length_;

  /*
    Coefficients of P, which should be treated as a polynomial in x^{n/c}.
  */
  const std::vector<BaseFieldElement> coefs_;
};

/*
  The values of a periodic column on a coset. Since the column is a polynomial in x^{n/c}, its
  values on a coset of size N repeat every N * c / n points, and only one period is stored.
  Spawns thin iterators, which are thread-safe.
*/
class PeriodicColumn::CosetEvaluation {
 public:
  explicit CosetEvaluation(std::vector<BaseFieldElement> values)
      : values_(std::move(values)), index_mask_(values_.size() - 1) {
    ASSERT_RELEASE(IsPowerOfTwo(values_.size()), "values must be of size which is a power of two.");
  }

  class Iterator {
   public:
    Iterator(const CosetEvaluation* parent, uint64_t index, const uint64_t index_mask)
        : parent_(parent), index_(index), index_mask_(index_mask) {}

    Iterator& operator++() {
      index_ = (index_ + 1) & index_mask_;
      return *this;
    }

    Iterator operator+(uint64_t offset) const {
      return Iterator(parent_, (index_ + offset) & index_mask_, index_mask_);
    }

    const BaseFieldElement& operator*() const { return parent_->values_[index_]; }

   private:
    const CosetEvaluation* parent_;
    uint64_t index_;
    uint64_t index_mask_;
  };

  Iterator begin() const { return Iterator(this, 0, index_mask_); }  // NOLINT

  /*
    The value at the i-th point of the coset.
  */
  const BaseFieldElement& operator[](uint64_t index) const {
    return values_[index & index_mask_];
  }

 private:
  const std::vector<BaseFieldElement> values_;
  const uint64_t index_mask_;
};

}  // namespace airkit

#include "airkit/composition_polynomial/periodic_column.inl"

#endif  // AIRKIT_COMPOSITION_POLYNOMIAL_PERIODIC_COLUMN_H_
