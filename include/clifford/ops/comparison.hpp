#pragma once

#include <algorithm>
#include <optional>
#include <set>
#include <type_traits>
#include <variant>

#include <clifford/core/linalg.hpp>
#include <clifford/core/precision.hpp>
#include <clifford/data/element.hpp>
#include <clifford/ops/coordinates.hpp>

namespace clifford {

namespace detail {

template <Precision T>
bool isapprox_impl(const Element<T> &x, const Element<T> &y, T atol, T rtol);

/// \brief Grade-by-grade comparison used when either side is a Multivector.
template <Precision T>
bool isapprox_graded(const Element<T> &x, const Element<T> &y, T atol, T rtol) {
  if (dim(x) != dim(y)) {
    return false;
  }
  std::set<int> all;
  for (const int k : grades(x)) {
    all.insert(k);
  }
  for (const int k : grades(y)) {
    all.insert(k);
  }

  for (const int k : all) {
    const std::vector<Element<T>> tx = terms(x, k);
    const std::vector<Element<T>> ty = terms(y, k);
    if (tx.size() == 1 && ty.size() == 1) {
      if (!isapprox_impl(tx.front(), ty.front(), atol, rtol)) {
        return false;
      }
      continue;
    }
    const core::VectorX<T> cx = coordinates_impl(x, k);
    const core::VectorX<T> cy = coordinates_impl(y, k);
    if (!cx.allFinite() || !cy.allFinite()) {
      if (cx.size() != cy.size() || !(cx.array() == cy.array()).all()) {
        return false;
      }
      continue;
    }
    const T bound = std::max(atol, rtol * std::max(cx.norm(), cy.norm()));
    if ((cx - cy).norm() > bound) {
      return false;
    }
  }
  return true;
}

template <Precision T>
bool isapprox_impl(const Element<T> &x, const Element<T> &y, T atol, T rtol) {
  return std::visit(
      [&](const auto &a, const auto &b) -> bool {
        using A = std::remove_cvref_t<decltype(a)>;
        using B = std::remove_cvref_t<decltype(b)>;

        if constexpr (std::is_same_v<A, Zero<T>>) {
          return approx_value(T(0), b.norm(), atol, rtol);
        } else if constexpr (std::is_same_v<B, Zero<T>>) {
          return approx_value(a.norm(), T(0), atol, rtol);
        } else if constexpr (std::is_same_v<A, Multivector<T>> ||
                             std::is_same_v<B, Multivector<T>>) {
          return isapprox_graded(x, y, atol, rtol);
        } else if constexpr (is_scalar_like_v<A> && is_scalar_like_v<B>) {
          return approx_value(a.value(), b.value(), atol, rtol);
        } else if constexpr (is_scalar_like_v<A> || is_scalar_like_v<B>) {
          return false;
        } else {
          if (a.dim() != b.dim() || a.grade() != b.grade()) {
            return false;
          }
          if constexpr (std::is_same_v<A, Blade<T>> && std::is_same_v<B, Blade<T>>) {
            const T d = core::MatrixX<T>(a.basis().transpose() * b.basis()).determinant();
            return approx_value(a.volume() * d, b.volume(), atol, rtol) &&
                   approx_value(b.volume() * d, a.volume(), atol, rtol);
          } else if constexpr (std::is_same_v<A, Pseudoscalar<T>> &&
                               std::is_same_v<B, Pseudoscalar<T>>) {
            return approx_value(a.value(), b.value(), atol, rtol);
          } else {
            return false;
          }
        }
      },
      x, y);
}

} // namespace detail

/**
 * \brief Approximate equality across all variants.
 *
 * Values compare as `|a - b| <= max(atol, rtol * max(|a|, |b|))`. Blades
 * must span the same subspace with matching oriented volume; elements of
 * different dimension or grade are never approximately equal. Raw reals and
 * vectors are lifted first.
 *
 * \param atol Absolute tolerance.
 * \param rtol Relative tolerance; defaults to `sqrt(epsilon)` of the looser
 *             precision when `atol == 0`, and to `0` otherwise.
 */
template <Operand X, Operand Y>
bool isapprox(const X &x, const Y &y, common_precision_t<X, Y> atol = 0,
              std::optional<common_precision_t<X, Y>> rtol = std::nullopt) {
  using P = common_precision_t<X, Y>;
  const P r = rtol ? *rtol : default_rtol<precision_t<X>, precision_t<Y>>(atol);
  return detail::isapprox_impl(lift<P>(x), lift<P>(y), atol, r);
}

/// \brief Structural equality after lifting both operands to the wider precision.
template <Operand X, Operand Y> bool equals(const X &x, const Y &y) {
  using P = common_precision_t<X, Y>;
  return lift<P>(x) == lift<P>(y);
}

} // namespace clifford
