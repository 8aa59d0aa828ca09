#pragma once

#include <algorithm>
#include <cmath>
#include <concepts>
#include <limits>
#include <type_traits>

namespace clifford {

/// \brief Floating-point types usable as the numeric field of an element.
template <typename T>
concept Precision = std::floating_point<T>;

/// \brief Precision a raw arithmetic input computes in (integers lift to `double`).
template <typename X>
using real_t = std::conditional_t<std::is_floating_point_v<X>, X, double>;

/**
 * \brief Default absolute tolerance used by the canonicalizing factories.
 * \return `100 * epsilon(T)`.
 */
template <Precision T> constexpr T default_atol() {
  return T(100) * std::numeric_limits<T>::epsilon();
}

/// \brief `sqrt(epsilon(T))`, the containment and relative-comparison scale.
template <Precision T> inline T sqrt_epsilon() {
  return std::sqrt(std::numeric_limits<T>::epsilon());
}

/**
 * \brief Default relative tolerance for comparing values of precisions `A` and `B`.
 * \param atol Absolute tolerance requested by the caller.
 * \return `0` when `atol > 0`, otherwise the looser of the two `sqrt(epsilon)`.
 */
template <Precision A, Precision B>
inline std::common_type_t<A, B> default_rtol(std::common_type_t<A, B> atol) {
  using R = std::common_type_t<A, B>;
  if (atol > R(0)) {
    return R(0);
  }
  return std::max(static_cast<R>(sqrt_epsilon<A>()), static_cast<R>(sqrt_epsilon<B>()));
}

/**
 * \brief Tolerant scalar comparison.
 *
 * `a == b` short-circuits so equal infinities compare equal; any other pair
 * with a non-finite side is never approximately equal.
 */
template <Precision T> inline bool approx_value(T a, T b, T atol, T rtol) {
  if (a == b) {
    return true;
  }
  if (!std::isfinite(a) || !std::isfinite(b)) {
    return false;
  }
  const T bound = std::max(atol, rtol * std::max(std::abs(a), std::abs(b)));
  return std::abs(a - b) <= bound;
}

/// \brief `(-1)^(k(k-1)/2)`, the sign picked up by reversing a grade-`k` blade.
template <Precision T> constexpr T reversion_sign(int k) {
  return (k % 4 < 2) ? T(1) : T(-1);
}

} // namespace clifford
