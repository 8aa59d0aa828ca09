#pragma once

#include <type_traits>
#include <variant>

#include <clifford/core/errors.hpp>
#include <clifford/core/linalg.hpp>
#include <clifford/data/element.hpp>

namespace clifford {

namespace detail {

template <Precision T> Element<T> project_impl(const Element<T> &x, const Element<T> &onto) {
  return std::visit(
      [](const auto &a, const auto &c) -> Element<T> {
        using A = std::remove_cvref_t<decltype(a)>;
        using C = std::remove_cvref_t<decltype(c)>;

        if constexpr (std::is_same_v<A, Zero<T>> || std::is_same_v<C, Zero<T>>) {
          return Zero<T>{};
        } else if constexpr (std::is_same_v<C, Multivector<T>>) {
          throw UndefinedOperation("Projection onto a Multivector is not supported");
        } else {
          check_dims(a, c);
          if constexpr (is_scalar_like_v<A>) {
            return a;
          } else if constexpr (std::is_same_v<A, Multivector<T>>) {
            const Element<T> target(c);
            return map_terms(a, [&target](const Element<T> &t) { return project_impl(t, target); });
          } else if constexpr (is_scalar_like_v<C>) {
            return Zero<T>{};
          } else if constexpr (std::is_same_v<C, Pseudoscalar<T>>) {
            return a;
          } else if constexpr (std::is_same_v<A, Pseudoscalar<T>>) {
            return Zero<T>{};
          } else {
            if (a.grade() > c.grade()) {
              return Zero<T>{};
            }
            const core::MatrixX<T> projected = c.basis() * (c.basis().transpose() * a.basis());
            return scale(blade(projected), a.volume());
          }
        }
      },
      x, onto);
}

} // namespace detail

/**
 * \brief Component of `x` lying in the subspace of `onto`.
 *
 * A blade already inside the subspace is returned unchanged; one orthogonal
 * to it, or of higher grade, projects to `Zero`.
 *
 * \throws UndefinedOperation when `onto` is a Multivector.
 * \throws DimensionMismatch for operands of different spaces.
 */
template <Operand X, Operand Y>
Element<common_precision_t<X, Y>> project(const X &x, const Y &onto) {
  using P = common_precision_t<X, Y>;
  return detail::project_impl(lift<P>(x), lift<P>(onto));
}

} // namespace clifford
