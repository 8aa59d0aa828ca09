#pragma once

#include <type_traits>
#include <variant>

#include <clifford/core/linalg.hpp>
#include <clifford/data/element.hpp>
#include <clifford/ops/arithmetic.hpp>
#include <clifford/ops/projection.hpp>

namespace clifford {

/// \brief Which contraction `dot` evaluates.
enum class Side { Left, Right };

namespace detail {

/**
 * \brief `A ⌋ U_C` for a unit blade `U_C` spanned by `c` and `A` inside it.
 *
 * The result spans the complement of `A` in `U_C`, oriented so that
 * `[A result]` agrees with `c`, and carries the reversion sign of `A`.
 *
 * \param a Orthonormal basis of `A`, `k >= 1` columns inside `span(c)`.
 * \param volume Signed volume of `A`.
 * \param c Orthonormal basis of the unit blade, `l >= k` columns.
 */
template <Precision T>
Element<T> contract_into_unit(const core::MatrixX<T> &a, T volume, const core::MatrixX<T> &c) {
  core::RelativeComplement<T> rest = core::relative_complement<T>(a, c);
  const T factor = volume * static_cast<T>(rest.orientation) *
                   reversion_sign<T>(static_cast<int>(a.cols()));
  return blade_from_basis<T>(std::move(rest.basis), factor);
}

template <Precision T> Element<T> contract_left_impl(const Element<T> &x, const Element<T> &y) {
  return std::visit(
      [](const auto &a, const auto &c) -> Element<T> {
        using A = std::remove_cvref_t<decltype(a)>;
        using C = std::remove_cvref_t<decltype(c)>;
        check_dims(a, c);

        if constexpr (std::is_same_v<A, Zero<T>> || std::is_same_v<C, Zero<T>>) {
          return Zero<T>{};
        } else if constexpr (is_scalar_like_v<A>) {
          return scale(Element<T>(c), a.value());
        } else if constexpr (is_scalar_like_v<C>) {
          return Zero<T>{};
        } else if constexpr (std::is_same_v<A, Multivector<T>>) {
          const Element<T> rhs(c);
          return map_terms(a, [&rhs](const Element<T> &t) { return contract_left_impl(t, rhs); });
        } else if constexpr (std::is_same_v<C, Multivector<T>>) {
          const Element<T> lhs(a);
          return map_terms(c, [&lhs](const Element<T> &t) { return contract_left_impl(lhs, t); });
        } else {
          if (a.grade() > c.grade()) {
            return Zero<T>{};
          }
          if constexpr (std::is_same_v<A, Pseudoscalar<T>> && std::is_same_v<C, Pseudoscalar<T>>) {
            return scalar(a.value() * c.value() * reversion_sign<T>(a.dim()));
          } else if constexpr (std::is_same_v<A, Pseudoscalar<T>>) {
            return Zero<T>{};
          } else if constexpr (std::is_same_v<C, Pseudoscalar<T>>) {
            return scale(contract_into_unit<T>(a.basis(), a.volume(), c.basis()), c.value());
          } else {
            const Element<T> inside = project_impl(Element<T>(a), Element<T>(c));
            const auto *p = std::get_if<Blade<T>>(&inside);
            if (p == nullptr) {
              return Zero<T>{};
            }
            return scale(contract_into_unit<T>(p->basis(), p->volume(), c.basis()), c.volume());
          }
        }
      },
      x, y);
}

template <Precision T> Element<T> contract_right_impl(const Element<T> &x, const Element<T> &y) {
  return reverse_impl(contract_left_impl(reverse_impl(y), reverse_impl(x)));
}

} // namespace detail

/**
 * \brief Left contraction `x ⌋ y` (Euclidean metric).
 *
 * Grade `grade(y) - grade(x)`; `Zero` when `x` has the higher grade or is
 * orthogonal to part of `y`. Scalars contract as scalar multiplication.
 *
 * \throws DimensionMismatch for operands of different spaces.
 */
template <Operand X, Operand Y>
Element<common_precision_t<X, Y>> contract_left(const X &x, const Y &y) {
  using P = common_precision_t<X, Y>;
  return detail::contract_left_impl(lift<P>(x), lift<P>(y));
}

/// \brief Right contraction `x ⌊ y = reverse(reverse(y) ⌋ reverse(x))`.
template <Operand X, Operand Y>
Element<common_precision_t<X, Y>> contract_right(const X &x, const Y &y) {
  using P = common_precision_t<X, Y>;
  return detail::contract_right_impl(lift<P>(x), lift<P>(y));
}

template <Operand X, Operand Y>
Element<common_precision_t<X, Y>> dot(const X &x, const Y &y, Side side = Side::Left) {
  if (side == Side::Right) {
    return contract_right(x, y);
  }
  return contract_left(x, y);
}

} // namespace clifford
