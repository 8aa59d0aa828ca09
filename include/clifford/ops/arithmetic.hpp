#pragma once

#include <type_traits>
#include <variant>
#include <vector>

#include <fmt/core.h>

#include <clifford/core/errors.hpp>
#include <clifford/data/element.hpp>

namespace clifford {

namespace detail {

template <Precision T> Element<T> negate_impl(const Element<T> &x) { return scale(x, T(-1)); }

template <Precision T> Element<T> multiply_impl(const Element<T> &x, const Element<T> &y) {
  return std::visit(
      [](const auto &a, const auto &b) -> Element<T> {
        using A = std::remove_cvref_t<decltype(a)>;
        using B = std::remove_cvref_t<decltype(b)>;
        check_dims(a, b);
        if constexpr (is_scalar_like_v<A>) {
          return scale(Element<T>(b), a.value());
        } else if constexpr (is_scalar_like_v<B>) {
          return scale(Element<T>(a), b.value());
        } else {
          throw UndefinedOperation(fmt::format("Multiplication of a {} by a {} is not supported",
                                               kind_name<A>(), kind_name<B>()));
        }
      },
      x, y);
}

template <Precision T> Element<T> reverse_impl(const Element<T> &x) {
  return std::visit(
      [](const auto &v) -> Element<T> {
        using V = std::remove_cvref_t<decltype(v)>;
        if constexpr (is_scalar_like_v<V>) {
          return v;
        } else if constexpr (std::is_same_v<V, Multivector<T>>) {
          return map_terms(v, [](const Element<T> &t) { return reverse_impl(t); });
        } else {
          if (reversion_sign<T>(v.grade()) > T(0)) {
            return v;
          }
          return scale(Element<T>(v), T(-1));
        }
      },
      x);
}

template <Precision T> Element<T> reciprocal_impl(const Element<T> &x) {
  return std::visit(
      [](const auto &v) -> Element<T> {
        using V = std::remove_cvref_t<decltype(v)>;
        if constexpr (std::is_same_v<V, Zero<T>>) {
          throw UndefinedOperation("The reciprocal of Zero is not well-defined");
        } else if constexpr (std::is_same_v<V, One<T>>) {
          return One<T>{};
        } else if constexpr (std::is_same_v<V, Scalar<T>>) {
          return scalar(T(1) / v.value());
        } else if constexpr (std::is_same_v<V, Multivector<T>>) {
          throw UndefinedOperation("The reciprocal of a Multivector is not supported");
        } else {
          return scale(Element<T>(v), reversion_sign<T>(v.grade()) / (v.volume() * v.volume()));
        }
      },
      x);
}

} // namespace detail

// ========================================================================
// PUBLIC ARITHMETIC
// ========================================================================

/**
 * \brief Sum of two operands, reduced like `multivector({x, y})`.
 * \throws DimensionMismatch for operands of different spaces.
 */
template <Operand X, Operand Y>
Element<common_precision_t<X, Y>> add(const X &x, const Y &y) {
  using P = common_precision_t<X, Y>;
  return multivector(std::vector<Element<P>>{lift<P>(x), lift<P>(y)});
}

template <Operand X> Element<precision_t<X>> negate(const X &x) {
  using P = precision_t<X>;
  return detail::negate_impl(lift<P>(x));
}

template <Operand X, Operand Y>
Element<common_precision_t<X, Y>> subtract(const X &x, const Y &y) {
  using P = common_precision_t<X, Y>;
  return multivector(std::vector<Element<P>>{lift<P>(x), detail::negate_impl(lift<P>(y))});
}

/**
 * \brief Scalar multiplication.
 * \throws UndefinedOperation when neither operand is a scalar.
 */
template <Operand X, Operand Y>
Element<common_precision_t<X, Y>> multiply(const X &x, const Y &y) {
  using P = common_precision_t<X, Y>;
  return detail::multiply_impl(lift<P>(x), lift<P>(y));
}

/// \brief Reversion: every grade-`k` term scaled by `(-1)^(k(k-1)/2)`.
template <Operand X> Element<precision_t<X>> reverse(const X &x) {
  using P = precision_t<X>;
  return detail::reverse_impl(lift<P>(x));
}

/**
 * \brief Multiplicative inverse `reverse(x) / norm(x)^2` of a homogeneous element.
 * \throws UndefinedOperation for Zero and for a Multivector.
 */
template <Operand X> Element<precision_t<X>> reciprocal(const X &x) {
  using P = precision_t<X>;
  return detail::reciprocal_impl(lift<P>(x));
}

template <Operand X> Element<precision_t<X>> inverse(const X &x) { return reciprocal(x); }

template <Operand X, Operand Y>
  requires(Algebraic<X> || Algebraic<Y>)
Element<common_precision_t<X, Y>> operator+(const X &x, const Y &y) {
  return add(x, y);
}

template <Operand X, Operand Y>
  requires(Algebraic<X> || Algebraic<Y>)
Element<common_precision_t<X, Y>> operator-(const X &x, const Y &y) {
  return subtract(x, y);
}

template <Algebraic X> Element<precision_t<X>> operator-(const X &x) { return negate(x); }

template <Operand X, Operand Y>
  requires(Algebraic<X> || Algebraic<Y>)
Element<common_precision_t<X, Y>> operator*(const X &x, const Y &y) {
  return multiply(x, y);
}

} // namespace clifford
