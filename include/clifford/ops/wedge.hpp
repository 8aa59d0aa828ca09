#pragma once

#include <type_traits>
#include <variant>

#include <clifford/core/linalg.hpp>
#include <clifford/data/element.hpp>

namespace clifford {

namespace detail {

template <Precision T> Element<T> wedge_impl(const Element<T> &x, const Element<T> &y) {
  return std::visit(
      [](const auto &a, const auto &b) -> Element<T> {
        using A = std::remove_cvref_t<decltype(a)>;
        using B = std::remove_cvref_t<decltype(b)>;
        check_dims(a, b);

        if constexpr (std::is_same_v<A, Zero<T>> || std::is_same_v<B, Zero<T>>) {
          return Zero<T>{};
        } else if constexpr (std::is_same_v<A, One<T>>) {
          return b;
        } else if constexpr (std::is_same_v<B, One<T>>) {
          return a;
        } else if constexpr (std::is_same_v<A, Scalar<T>>) {
          return scale(Element<T>(b), a.value());
        } else if constexpr (std::is_same_v<B, Scalar<T>>) {
          return scale(Element<T>(a), b.value());
        } else if constexpr (std::is_same_v<A, Multivector<T>>) {
          const Element<T> rhs(b);
          return map_terms(a, [&rhs](const Element<T> &t) { return wedge_impl(t, rhs); });
        } else if constexpr (std::is_same_v<B, Multivector<T>>) {
          const Element<T> lhs(a);
          return map_terms(b, [&lhs](const Element<T> &t) { return wedge_impl(lhs, t); });
        } else if constexpr (std::is_same_v<A, Blade<T>> && std::is_same_v<B, Blade<T>>) {
          if (a.grade() + b.grade() > a.dim()) {
            return Zero<T>{};
          }
          core::MatrixX<T> spanning(a.dim(), a.grade() + b.grade());
          spanning.leftCols(a.grade()) = a.basis();
          spanning.rightCols(b.grade()) = b.basis();
          return scale(blade(spanning), a.volume() * b.volume());
        } else if constexpr (!is_scalar_like_v<A> && !is_scalar_like_v<B>) {
          // A pseudoscalar leaves no room for another factor.
          return Zero<T>{};
        } else {
          static_assert(always_false_v<A>, "unhandled wedge operands");
        }
      },
      x, y);
}

} // namespace detail

/**
 * \brief Outer product `x ^ y`.
 *
 * Grades add and volumes multiply; a grade sum above `dim` or linearly
 * dependent factors give `Zero`. Raw vectors wedge as grade-1 blades.
 *
 * \throws DimensionMismatch for operands of different spaces.
 */
template <Operand X, Operand Y>
Element<common_precision_t<X, Y>> wedge(const X &x, const Y &y) {
  using P = common_precision_t<X, Y>;
  return detail::wedge_impl(lift<P>(x), lift<P>(y));
}

template <Operand X, Operand Y>
  requires(Algebraic<X> || Algebraic<Y>)
Element<common_precision_t<X, Y>> operator^(const X &x, const Y &y) {
  return wedge(x, y);
}

} // namespace clifford
