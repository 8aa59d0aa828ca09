#pragma once

#include <clifford/core/precision.hpp>

namespace clifford {

namespace detail {
struct Access;
} // namespace detail

// ========================================================================
// GRADE-0 ELEMENTS
// ========================================================================
// Zero and One carry no data; Scalar is never exactly 0 or 1 because the
// `scalar()` factory routes those values to Zero and One.

/// \brief Additive identity, absorbing for every product.
template <Precision T> struct Zero {
  int dim() const { return 0; }
  int grade() const { return 0; }
  T volume() const { return T(0); }
  T norm() const { return T(0); }
  T value() const { return T(0); }

  friend bool operator==(const Zero &, const Zero &) = default;
};

/// \brief Multiplicative identity.
template <Precision T> struct One {
  int dim() const { return 0; }
  int grade() const { return 0; }
  T volume() const { return T(1); }
  T norm() const { return T(1); }
  T value() const { return T(1); }

  friend bool operator==(const One &, const One &) = default;
};

/// \brief Nonzero, non-unit real number. Infinite values are allowed.
template <Precision T> class Scalar {
public:
  int dim() const { return 0; }
  int grade() const { return 0; }
  T volume() const { return value_; }
  T norm() const { return value_ < T(0) ? -value_ : value_; }
  T value() const { return value_; }

  friend bool operator==(const Scalar &, const Scalar &) = default;

private:
  explicit Scalar(T value) : value_(value) {}

  T value_;

  friend struct detail::Access;
};

} // namespace clifford
