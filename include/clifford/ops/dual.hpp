#pragma once

#include <type_traits>
#include <variant>

#include <fmt/core.h>

#include <clifford/core/config.hpp>
#include <clifford/core/errors.hpp>
#include <clifford/core/linalg.hpp>
#include <clifford/data/element.hpp>
#include <clifford/ops/contraction.hpp>

namespace clifford {

/// \brief Ambient dimension in which to take the dual of a scalar.
struct InDimension {
  int value;
};

namespace detail {

/// \brief `+1` iff `k mod 4 < 2`, the sign convention of dualizing against grade `k`.
template <Precision T> T dual_sign(int k) { return reversion_sign<T>(k); }

template <Precision T> Element<T> dual_in_impl(const Element<T> &x, int n);

template <Precision T> Element<T> dual_impl(const Element<T> &x) {
  return std::visit(
      [](const auto &v) -> Element<T> {
        using V = std::remove_cvref_t<decltype(v)>;
        if constexpr (std::is_same_v<V, Zero<T>>) {
          throw UndefinedOperation("The dual of Zero is not well-defined");
        } else if constexpr (is_scalar_like_v<V>) {
          throw UndefinedOperation(
              "The dual of a scalar is not well-defined if `dim` is not specified");
        } else if constexpr (std::is_same_v<V, Pseudoscalar<T>>) {
          return scalar(v.value());
        } else if constexpr (std::is_same_v<V, Blade<T>>) {
          return contract_into_unit<T>(v.basis(), v.volume(),
                                       core::MatrixX<T>::Identity(v.dim(), v.dim()));
        } else {
          const int n = v.dim();
          return map_terms(v, [n](const Element<T> &t) { return dual_in_impl(t, n); });
        }
      },
      x);
}

template <Precision T> Element<T> dual_in_impl(const Element<T> &x, int n) {
  return std::visit(
      [n](const auto &v) -> Element<T> {
        using V = std::remove_cvref_t<decltype(v)>;
        if constexpr (std::is_same_v<V, Zero<T>>) {
          throw UndefinedOperation("The dual of Zero is not well-defined");
        } else if constexpr (is_scalar_like_v<V>) {
          return pseudoscalar(n, dual_sign<T>(n) * v.value());
        } else {
          assert_dim_equal(v.dim(), n);
          return dual_impl(Element<T>(v));
        }
      },
      x);
}

template <Precision T>
Element<T> dual_relative_impl(const Element<T> &x, const Element<T> &relative_to) {
  return std::visit(
      [](const auto &b, const auto &c) -> Element<T> {
        using B = std::remove_cvref_t<decltype(b)>;
        using C = std::remove_cvref_t<decltype(c)>;

        if constexpr (std::is_same_v<C, Zero<T>>) {
          throw UndefinedOperation("The dual of anything relative to Zero is not well-defined");
        } else if constexpr (std::is_same_v<B, Zero<T>>) {
          throw UndefinedOperation("The dual of Zero is not well-defined");
        } else if constexpr (std::is_same_v<C, Multivector<T>>) {
          throw UndefinedOperation("The dual relative to a Multivector is not supported");
        } else {
          check_dims(b, c);
          if constexpr (std::is_same_v<B, Multivector<T>>) {
            const Element<T> target(c);
            return map_terms(b, [&target](const Element<T> &t) {
              return dual_relative_impl(t, target);
            });
          } else if constexpr (is_scalar_like_v<C>) {
            if constexpr (is_scalar_like_v<B>) {
              return b;
            } else {
              return Zero<T>{};
            }
          } else if constexpr (std::is_same_v<C, Pseudoscalar<T>>) {
            if constexpr (is_scalar_like_v<B>) {
              return pseudoscalar(c.dim(), dual_sign<T>(c.dim()) * b.value());
            } else {
              return dual_impl(Element<T>(b));
            }
          } else if constexpr (is_scalar_like_v<B>) {
            return blade_from_basis<T>(c.basis(), dual_sign<T>(c.grade()) * b.value());
          } else if constexpr (std::is_same_v<B, Pseudoscalar<T>>) {
            return Zero<T>{};
          } else {
            if (b.grade() > c.grade()) {
              return Zero<T>{};
            }
            const T outside = core::rejection_norm<T>(b.basis(), c.basis());
            if (outside > sqrt_epsilon<T>()) {
              core::trace("Dual", "blade leaves the reference subspace by {}", outside);
              throw ContainmentFailure(fmt::format(
                  "The grade {} blade is not contained in the grade {} reference blade "
                  "(rejection norm {})",
                  b.grade(), c.grade(), outside));
            }
            return scale(contract_into_unit<T>(b.basis(), b.volume(), c.basis()),
                         dual_sign<T>(c.grade()));
          }
        }
      },
      x, relative_to);
}

} // namespace detail

/**
 * \brief Orthogonal complement of `x` in the full space.
 *
 * A grade-`k` blade maps to a grade `dim - k` blade of the same norm, with
 * sign `sign(x) * sign det([basis(x) basis(dual)])`, negated when
 * `k mod 4 >= 2`. A pseudoscalar maps to the scalar of its value.
 *
 * \throws UndefinedOperation for Zero and for scalars (no dimension to dualize in).
 */
template <Operand X> Element<precision_t<X>> dual(const X &x) {
  using P = precision_t<X>;
  return detail::dual_impl(lift<P>(x));
}

/**
 * \brief Dual in an explicit `n`-dimensional space.
 *
 * Scalars map to `pseudoscalar(n, +-value)` with `+` iff `n mod 4 < 2`.
 *
 * \throws DimensionMismatch when a dimensioned `x` lives in another space.
 */
template <Operand X> Element<precision_t<X>> dual(const X &x, InDimension n) {
  using P = precision_t<X>;
  return detail::dual_in_impl(lift<P>(x), n.value);
}

/**
 * \brief Dual of `x` relative to the subspace of `relative_to`.
 *
 * The result has grade `grade(relative_to) - grade(x)` and is oriented
 * against the basis of `relative_to`; dualizing twice gives back
 * `(-1)^(g(g-1)/2) x` for `g = grade(relative_to)`. A pseudoscalar
 * reference reproduces `dual(x)`.
 *
 * \throws UndefinedOperation when either side is Zero or `relative_to` is a Multivector.
 * \throws DimensionMismatch for operands of different spaces.
 * \throws ContainmentFailure when `x` does not lie in the reference subspace.
 */
template <Operand X, Operand Y>
Element<common_precision_t<X, Y>> dual(const X &x, const Y &relative_to) {
  using P = common_precision_t<X, Y>;
  return detail::dual_relative_impl(lift<P>(x), lift<P>(relative_to));
}

} // namespace clifford
