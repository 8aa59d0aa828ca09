#pragma once

#include <clifford/core/linalg.hpp>
#include <clifford/core/precision.hpp>
#include <clifford/data/scalars.hpp>

namespace clifford {

/**
 * \brief Top-grade element `value * e1 ^ ... ^ e_dim`.
 *
 * Only produced by `pseudoscalar()` and by factories that reach full grade;
 * `dim >= 1` and `value != 0` always hold.
 */
template <Precision T> class Pseudoscalar {
public:
  int dim() const { return dim_; }
  int grade() const { return dim_; }
  T volume() const { return value_; }
  T norm() const { return value_ < T(0) ? -value_ : value_; }
  T value() const { return value_; }

  /// \brief Standard basis of the full space, the implied orientation.
  core::MatrixX<T> basis() const { return core::MatrixX<T>::Identity(dim_, dim_); }

  friend bool operator==(const Pseudoscalar &, const Pseudoscalar &) = default;

private:
  Pseudoscalar(int dim, T value) : dim_(dim), value_(value) {}

  int dim_;
  T value_;

  friend struct detail::Access;
};

} // namespace clifford
