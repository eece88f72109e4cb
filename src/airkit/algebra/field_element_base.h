#ifndef AIRKIT_ALGEBRA_FIELD_ELEMENT_BASE_H_
#define AIRKIT_ALGEBRA_FIELD_ELEMENT_BASE_H_

#include <cstddef>
#include <ostream>
#include <type_traits>
#include <vector>

#include "airkit/utils/attributes.h"

namespace airkit {

/*
  CRTP base of BaseFieldElement and its extensions. Derived supplies +, -, *, ==, Inverse(),
  Uninitialized() and ToString(); the compound assignments, division and != are defined here in
  terms of them, so that the AIR code is written once for every field:

    class MyFieldElement : public FieldElementBase<MyFieldElement> { ... };
*/
template <typename Derived>
class FieldElementBase {
 public:
  Derived& operator+=(const Derived& other) { return Self() = Self() + other; }
  Derived& operator-=(const Derived& other) { return Self() = Self() - other; }
  ALWAYS_INLINE Derived& operator*=(const Derived& other) { return Self() = Self() * other; }
  Derived operator/(const Derived& other) const { return Self() * other.Inverse(); }
  constexpr bool operator!=(const Derived& other) const { return !(Self() == other); }

  /*
    A vector of size elements whose values are to be overwritten. In debug builds the elements
    are initialized, to make reads of unwritten slots deterministic.
  */
  static std::vector<Derived> UninitializedVector(size_t size) {
#ifdef NDEBUG
    return std::vector<Derived>(size);
#else
    return std::vector<Derived>(size, Derived::Uninitialized());
#endif
  }

 private:
  constexpr const Derived& Self() const { return static_cast<const Derived&>(*this); }
  constexpr Derived& Self() { return static_cast<Derived&>(*this); }
};

template <typename FieldElementT>
constexpr bool kIsFieldElement =
    std::is_base_of<FieldElementBase<FieldElementT>, FieldElementT>::value;

template <typename FieldElementT>
std::enable_if_t<kIsFieldElement<FieldElementT>, std::ostream&> operator<<(
    std::ostream& out, const FieldElementT& element) {
  return out << element.ToString();
}

}  // namespace airkit

#endif  // AIRKIT_ALGEBRA_FIELD_ELEMENT_BASE_H_
