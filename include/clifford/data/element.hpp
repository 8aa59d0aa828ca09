#pragma once

#include <cmath>
#include <concepts>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <Eigen/Dense>
#include <fmt/core.h>

#include <clifford/core/config.hpp>
#include <clifford/core/errors.hpp>
#include <clifford/core/linalg.hpp>
#include <clifford/core/precision.hpp>
#include <clifford/data/blade.hpp>
#include <clifford/data/multivector.hpp>
#include <clifford/data/pseudoscalar.hpp>
#include <clifford/data/scalars.hpp>

namespace clifford {

// ========================================================================
// 1. THE CLOSED SUM TYPE
// ========================================================================

/// \brief Any value of the algebra. Default-constructs to `Zero`.
template <Precision T>
using Element = std::variant<Zero<T>, One<T>, Scalar<T>, Blade<T>, Pseudoscalar<T>, Multivector<T>>;

template <typename> inline constexpr bool always_false_v = false;

template <typename X> inline constexpr bool is_scalar_like_v = false;
template <Precision T> inline constexpr bool is_scalar_like_v<Zero<T>> = true;
template <Precision T> inline constexpr bool is_scalar_like_v<One<T>> = true;
template <Precision T> inline constexpr bool is_scalar_like_v<Scalar<T>> = true;

/// \brief Variants that carry the dimension of their space.
template <typename X> inline constexpr bool is_dimensioned_v = false;
template <Precision T> inline constexpr bool is_dimensioned_v<Blade<T>> = true;
template <Precision T> inline constexpr bool is_dimensioned_v<Pseudoscalar<T>> = true;
template <Precision T> inline constexpr bool is_dimensioned_v<Multivector<T>> = true;

template <typename X> inline constexpr bool is_element_v = false;
template <Precision T> inline constexpr bool is_element_v<Element<T>> = true;

template <typename X>
inline constexpr bool is_algebraic_v = is_scalar_like_v<X> || is_dimensioned_v<X> || is_element_v<X>;

/// \brief Variant type or `Element` of the algebra.
template <typename X>
concept Algebraic = is_algebraic_v<std::remove_cvref_t<X>>;

/// \brief Eigen column vector (fixed or dynamic rows), lifted to a grade-1 blade.
template <typename X>
concept EigenVector = requires {
  typename X::Scalar;
  X::ColsAtCompileTime;
} && std::derived_from<X, Eigen::MatrixBase<X>> && (X::ColsAtCompileTime == 1);

template <typename X> struct precision_of {};

template <typename X>
  requires(std::is_arithmetic_v<X> && !std::is_same_v<X, bool>)
struct precision_of<X> {
  using type = real_t<X>;
};

template <typename X>
  requires EigenVector<X>
struct precision_of<X> {
  using type = real_t<typename X::Scalar>;
};

template <Precision T> struct precision_of<Zero<T>> { using type = T; };
template <Precision T> struct precision_of<One<T>> { using type = T; };
template <Precision T> struct precision_of<Scalar<T>> { using type = T; };
template <Precision T> struct precision_of<Blade<T>> { using type = T; };
template <Precision T> struct precision_of<Pseudoscalar<T>> { using type = T; };
template <Precision T> struct precision_of<Multivector<T>> { using type = T; };
template <Precision T> struct precision_of<Element<T>> { using type = T; };

template <typename X> using precision_t = typename precision_of<std::remove_cvref_t<X>>::type;

/// \brief Anything accepted by the operators: algebra values, raw reals, raw vectors.
template <typename X>
concept Operand = requires { typename precision_t<X>; };

/// \brief The wider of two operand precisions.
template <Operand X, Operand Y>
using common_precision_t = std::common_type_t<precision_t<X>, precision_t<Y>>;

/// \brief Variant name used in diagnostics.
template <typename X> constexpr std::string_view kind_name() {
  using V = std::remove_cvref_t<X>;
  if constexpr (std::is_same_v<V, Zero<precision_t<V>>>) {
    return "Zero";
  } else if constexpr (std::is_same_v<V, One<precision_t<V>>>) {
    return "One";
  } else if constexpr (std::is_same_v<V, Scalar<precision_t<V>>>) {
    return "Scalar";
  } else if constexpr (std::is_same_v<V, Blade<precision_t<V>>>) {
    return "Blade";
  } else if constexpr (std::is_same_v<V, Pseudoscalar<precision_t<V>>>) {
    return "Pseudoscalar";
  } else {
    return "Multivector";
  }
}

// ========================================================================
// 2. RAW CONSTRUCTION
// ========================================================================

namespace detail {

struct Access {
  template <Precision T> static Scalar<T> make_scalar(T value) { return Scalar<T>(value); }

  template <Precision T> static Pseudoscalar<T> make_pseudoscalar(int dim, T value) {
    return Pseudoscalar<T>(dim, value);
  }

  template <Precision T>
  static Blade<T> make_blade(std::shared_ptr<core::MatrixX<T>> basis, T volume) {
    return Blade<T>(std::move(basis), volume);
  }

  template <Precision T>
  static std::shared_ptr<core::MatrixX<T>> basis_storage(const Blade<T> &b) {
    return b.basis_;
  }

  template <Precision T>
  static Multivector<T> make_multivector(int dim, typename Multivector<T>::Parts parts, T norm) {
    return Multivector<T>(dim, std::move(parts), norm);
  }
};

} // namespace detail

// ========================================================================
// 3. CANONICALIZING FACTORIES
// ========================================================================

/**
 * \brief Grade-0 element with the given value.
 * \return `Zero` for 0, `One` for 1, otherwise a `Scalar`.
 */
template <Precision T> Element<T> scalar(T value) {
  if (value == T(0)) {
    return Zero<T>{};
  }
  if (value == T(1)) {
    return One<T>{};
  }
  return detail::Access::make_scalar(value);
}

template <std::integral I> Element<double> scalar(I value) {
  return scalar(static_cast<double>(value));
}

/**
 * \brief Top-grade element `value * I` of an `dim`-dimensional space.
 *
 * A 0-dimensional pseudoscalar is a scalar and canonicalizes like `scalar()`.
 *
 * \param dim Dimension of the space, `>= 0`.
 * \param value Signed volume.
 */
template <Precision T> Element<T> pseudoscalar(int dim, T value) {
  if (dim < 0) {
    throw std::invalid_argument(
        fmt::format("pseudoscalar dimension must be non-negative, got {}", dim));
  }
  if (dim == 0) {
    return scalar(value);
  }
  if (value == T(0)) {
    return Zero<T>{};
  }
  return detail::Access::make_pseudoscalar(dim, value);
}

template <std::integral I> Element<double> pseudoscalar(int dim, I value) {
  return pseudoscalar(dim, static_cast<double>(value));
}

namespace detail {

/**
 * \brief Element spanned by an orthonormal basis with a signed volume.
 *
 * No factorization; the basis columns must already be orthonormal.
 */
template <Precision T> Element<T> blade_from_basis(core::MatrixX<T> basis, T volume) {
  if (volume == T(0)) {
    return Zero<T>{};
  }
  const Eigen::Index n = basis.rows();
  const Eigen::Index k = basis.cols();
  if (k == 0) {
    return scalar(volume);
  }
  if (k == n) {
    return pseudoscalar(static_cast<int>(n), volume * core::determinant_sign<T>(basis));
  }
  return Access::make_blade(std::make_shared<core::MatrixX<T>>(std::move(basis)), volume);
}

} // namespace detail

/**
 * \brief Outer product of the columns of `vectors`.
 *
 * Degenerate input never throws: no columns give `One`, more columns than
 * rows, a rank-deficient set or a volume below `atol` give `Zero`, and a
 * full-rank square set gives a `Pseudoscalar`.
 *
 * \param vectors `dim x k` matrix or a single column vector.
 * \param atol Volumes below this collapse to `Zero`.
 */
template <typename Derived>
Element<real_t<typename Derived::Scalar>>
blade(const Eigen::MatrixBase<Derived> &vectors,
      real_t<typename Derived::Scalar> atol = default_atol<real_t<typename Derived::Scalar>>()) {
  using T = real_t<typename Derived::Scalar>;
  const core::MatrixX<T> m = vectors.template cast<T>();
  const Eigen::Index n = m.rows();
  const Eigen::Index k = m.cols();

  if (k == 0) {
    return One<T>{};
  }
  if (k > n) {
    core::trace("Blade", "{} vectors in dimension {} are dependent, collapsing to Zero", k, n);
    return Zero<T>{};
  }

  core::Orthonormalization<T> factor = core::orthonormalize<T>(m);
  if (factor.rank < k) {
    core::trace("Blade", "rank {} spanning set of {} vectors, collapsing to Zero", factor.rank, k);
    return Zero<T>{};
  }
  if (factor.volume < atol) {
    core::trace("Blade", "volume {} below tolerance {}, collapsing to Zero", factor.volume, atol);
    return Zero<T>{};
  }
  return detail::blade_from_basis(std::move(factor.basis), factor.volume);
}

/// \brief Outer product of a list of equally sized vectors.
template <Precision T>
Element<T> blade(const std::vector<core::VectorX<T>> &vectors, T atol = default_atol<T>()) {
  if (vectors.empty()) {
    return One<T>{};
  }
  core::MatrixX<T> m(vectors.front().size(), static_cast<Eigen::Index>(vectors.size()));
  for (size_t i = 0; i < vectors.size(); ++i) {
    if (vectors[i].size() != m.rows()) {
      throw DimensionMismatch(fmt::format("vector {} has length {}, expected {}", i,
                                          vectors[i].size(), m.rows()));
    }
    m.col(static_cast<Eigen::Index>(i)) = vectors[i];
  }
  return blade(m, atol);
}

/**
 * \brief Blade with the subspace and orientation of `source` and a new volume.
 * \param source Blade whose basis is reused.
 * \param volume Signed volume of the result; `0` gives `Zero`.
 * \param ownership `Alias` shares `source`'s basis storage instead of copying it.
 */
template <Precision T>
Element<T> blade(const Blade<T> &source, std::type_identity_t<T> volume = T(1),
                 BasisOwnership ownership = BasisOwnership::Copy) {
  if (volume == T(0)) {
    return Zero<T>{};
  }
  if (ownership == BasisOwnership::Alias) {
    return detail::Access::make_blade(detail::Access::basis_storage(source), volume);
  }
  return detail::Access::make_blade(std::make_shared<core::MatrixX<T>>(source.basis()), volume);
}

/// \brief Like `blade(source, volume)` but sets the norm and keeps `source`'s sign.
template <Precision T>
Element<T> blade_with_norm(const Blade<T> &source, std::type_identity_t<T> norm,
                           BasisOwnership ownership = BasisOwnership::Copy) {
  return blade(source, source.sign() * std::abs(norm), ownership);
}

// ========================================================================
// 4. MULTIVECTOR REDUCTION
// ========================================================================

namespace detail {

template <Precision T> Element<T> to_element(const typename Multivector<T>::Term &term) {
  return std::visit([](const auto &t) -> Element<T> { return t; }, term);
}

template <Precision T> int term_grade(const typename Multivector<T>::Term &term) {
  return std::visit([](const auto &t) { return t.grade(); }, term);
}

template <Precision T> T term_volume(const typename Multivector<T>::Term &term) {
  return std::visit([](const auto &t) { return t.volume(); }, term);
}

template <Precision T> T term_norm(const typename Multivector<T>::Term &term) {
  return std::visit([](const auto &t) { return t.norm(); }, term);
}

/// \brief Merge the terms of one grade; an empty result means they cancelled.
template <Precision T>
std::vector<typename Multivector<T>::Term>
reduce_grade(int k, int dim, const std::vector<typename Multivector<T>::Term> &terms) {
  using Term = typename Multivector<T>::Term;
  if (terms.size() < 2) {
    return terms;
  }

  const T atol = default_atol<T>();
  std::vector<Term> out;

  if (k == 0 || k == dim) {
    T sum = T(0);
    for (const Term &t : terms) {
      sum += term_volume<T>(t);
    }
    if (std::abs(sum) < atol) {
      core::trace("Multivector", "grade {} terms cancel", k);
    } else if (k == dim) {
      out.emplace_back(Access::make_pseudoscalar(dim, sum));
    } else if (sum == T(1)) {
      out.emplace_back(One<T>{});
    } else {
      out.emplace_back(Access::make_scalar(sum));
    }
    return out;
  }

  if (k == 1) {
    core::VectorX<T> sum = core::VectorX<T>::Zero(dim);
    for (const Term &t : terms) {
      const Blade<T> &b = std::get<Blade<T>>(t);
      sum += b.volume() * b.basis().col(0);
    }
    Element<T> reduced = blade(sum);
    if (auto *b = std::get_if<Blade<T>>(&reduced)) {
      out.emplace_back(std::move(*b));
    } else {
      core::trace("Multivector", "grade 1 terms cancel");
    }
    return out;
  }

  // Intermediate grades: only blades spanning the same subspace combine.
  std::vector<Blade<T>> merged;
  for (const Term &t : terms) {
    const Blade<T> &b = std::get<Blade<T>>(t);
    bool absorbed = false;
    for (auto it = merged.begin(); it != merged.end(); ++it) {
      if (core::rejection_norm<T>(b.basis(), it->basis()) > sqrt_epsilon<T>()) {
        continue;
      }
      const core::MatrixX<T> overlap = it->basis().transpose() * b.basis();
      const T combined = it->volume() + b.volume() * core::determinant_sign<T>(overlap);
      if (std::abs(combined) < atol) {
        core::trace("Multivector", "grade {} terms cancel", k);
        merged.erase(it);
      } else {
        *it = Access::make_blade(std::make_shared<core::MatrixX<T>>(it->basis()), combined);
      }
      absorbed = true;
      break;
    }
    if (!absorbed) {
      merged.push_back(b);
    }
  }
  for (Blade<T> &b : merged) {
    out.emplace_back(std::move(b));
  }
  return out;
}

} // namespace detail

/**
 * \brief Sum of elements, reduced to canonical form.
 *
 * Nested multivectors are flattened and Zero terms dropped. Grades 0, 1 and
 * `dim` reduce to a single term each; higher-grade terms combine only when
 * they span the same subspace. A single surviving term is returned directly.
 *
 * \throws DimensionMismatch when dimensioned terms disagree on `dim`.
 */
template <Precision T> Element<T> multivector(const std::vector<Element<T>> &elements) {
  using Term = typename Multivector<T>::Term;

  std::vector<Term> flat;
  std::optional<int> dim;
  const auto note_dim = [&dim](int d) {
    if (!dim) {
      dim = d;
    } else {
      assert_dim_equal(*dim, d);
    }
  };

  for (const Element<T> &e : elements) {
    std::visit(
        [&](const auto &x) {
          using X = std::remove_cvref_t<decltype(x)>;
          if constexpr (std::is_same_v<X, Multivector<T>>) {
            note_dim(x.dim());
            for (const auto &[k, terms] : x.parts()) {
              flat.insert(flat.end(), terms.begin(), terms.end());
            }
          } else if constexpr (!std::is_same_v<X, Zero<T>>) {
            if constexpr (is_dimensioned_v<X>) {
              note_dim(x.dim());
            }
            flat.emplace_back(x);
          }
        },
        e);
  }

  if (!dim) {
    T sum = T(0);
    for (const Term &t : flat) {
      sum += detail::term_volume<T>(t);
    }
    return scalar(sum);
  }

  std::map<int, std::vector<Term>> groups;
  for (Term &t : flat) {
    const int k = detail::term_grade<T>(t);
    groups[k].push_back(std::move(t));
  }

  typename Multivector<T>::Parts parts;
  T norm_sq = T(0);
  size_t count = 0;
  for (const auto &[k, terms] : groups) {
    std::vector<Term> reduced = detail::reduce_grade<T>(k, *dim, terms);
    if (reduced.empty()) {
      continue;
    }
    for (const Term &t : reduced) {
      const T n = detail::term_norm<T>(t);
      norm_sq += n * n;
    }
    count += reduced.size();
    parts.emplace(k, std::move(reduced));
  }

  if (count == 0) {
    return Zero<T>{};
  }
  if (count == 1) {
    return detail::to_element<T>(parts.begin()->second.front());
  }
  return detail::Access::make_multivector(*dim, std::move(parts), std::sqrt(norm_sq));
}

// ========================================================================
// 5. ATTRIBUTES
// ========================================================================

/// \brief Dimension of the ambient space; `0` for scalar-likes.
template <Algebraic X> int dim(const X &x) {
  if constexpr (is_element_v<std::remove_cvref_t<X>>) {
    return std::visit([](const auto &v) { return v.dim(); }, x);
  } else {
    return x.dim();
  }
}

/// \brief Grade of a homogeneous element. \throws UndefinedOperation for a Multivector.
template <Algebraic X> int grade(const X &x) {
  if constexpr (is_element_v<std::remove_cvref_t<X>>) {
    return std::visit([](const auto &v) { return grade(v); }, x);
  } else if constexpr (std::is_same_v<X, Multivector<precision_t<X>>>) {
    throw UndefinedOperation("grade is not defined for a Multivector, use grades()");
  } else {
    return x.grade();
  }
}

/// \brief Grades present in `x`, ascending; empty for Zero.
template <Algebraic X> std::vector<int> grades(const X &x) {
  if constexpr (is_element_v<std::remove_cvref_t<X>>) {
    return std::visit([](const auto &v) { return grades(v); }, x);
  } else if constexpr (std::is_same_v<X, Multivector<precision_t<X>>>) {
    return x.grades();
  } else if constexpr (std::is_same_v<X, Zero<precision_t<X>>>) {
    return {};
  } else {
    return {x.grade()};
  }
}

template <Algebraic X> precision_t<X> norm(const X &x) {
  if constexpr (is_element_v<std::remove_cvref_t<X>>) {
    return std::visit([](const auto &v) { return v.norm(); }, x);
  } else {
    return x.norm();
  }
}

/// \brief Signed volume. \throws UndefinedOperation for a Multivector.
template <Algebraic X> precision_t<X> volume(const X &x) {
  if constexpr (is_element_v<std::remove_cvref_t<X>>) {
    return std::visit([](const auto &v) { return volume(v); }, x);
  } else if constexpr (std::is_same_v<X, Multivector<precision_t<X>>>) {
    throw UndefinedOperation("volume is not defined for a Multivector");
  } else {
    return x.volume();
  }
}

/// \brief `-1`, `0` or `1`. \throws UndefinedOperation for a Multivector.
template <Algebraic X> precision_t<X> sign(const X &x) {
  using T = precision_t<X>;
  const T v = volume(x);
  if (v > T(0)) {
    return T(1);
  }
  return v < T(0) ? T(-1) : T(0);
}

/// \brief Value of a scalar-like or pseudoscalar.
template <Algebraic X> precision_t<X> value(const X &x) {
  if constexpr (is_element_v<std::remove_cvref_t<X>>) {
    return std::visit([](const auto &v) { return value(v); }, x);
  } else if constexpr (is_scalar_like_v<X> || std::is_same_v<X, Pseudoscalar<precision_t<X>>>) {
    return x.value();
  } else {
    throw UndefinedOperation(fmt::format("value is not defined for a {}", kind_name<X>()));
  }
}

/// \brief Orthonormal basis of a Blade, identity for a Pseudoscalar.
template <Algebraic X> core::MatrixX<precision_t<X>> basis(const X &x) {
  if constexpr (is_element_v<std::remove_cvref_t<X>>) {
    return std::visit([](const auto &v) { return basis(v); }, x);
  } else if constexpr (std::is_same_v<X, Blade<precision_t<X>>> ||
                       std::is_same_v<X, Pseudoscalar<precision_t<X>>>) {
    return x.basis();
  } else {
    throw UndefinedOperation(fmt::format("basis is not defined for a {}", kind_name<X>()));
  }
}

/// \brief Terms of `x`: itself for a homogeneous element, none for Zero.
template <Precision T> std::vector<Element<T>> blades(const Element<T> &x) {
  if (const auto *mv = std::get_if<Multivector<T>>(&x)) {
    std::vector<Element<T>> out;
    out.reserve(mv->size());
    for (const auto &[k, terms] : mv->parts()) {
      for (const auto &t : terms) {
        out.push_back(detail::to_element<T>(t));
      }
    }
    return out;
  }
  if (std::holds_alternative<Zero<T>>(x)) {
    return {};
  }
  return {x};
}

/// \brief Terms of grade `k` in `x`.
template <Precision T> std::vector<Element<T>> terms(const Element<T> &x, int k) {
  std::vector<Element<T>> out;
  for (Element<T> &b : blades(x)) {
    if (grade(b) == k) {
      out.push_back(std::move(b));
    }
  }
  return out;
}

template <Operand X> One<precision_t<X>> one(const X &) { return {}; }
template <Operand X> Zero<precision_t<X>> zero(const X &) { return {}; }

// ========================================================================
// 6. PRECISION CONVERSION AND LIFTING
// ========================================================================

/// \brief Re-express `x` in precision `P`, canonicalizing again.
template <Precision P, Precision Q> Element<P> convert(const Element<Q> &x) {
  if constexpr (std::is_same_v<P, Q>) {
    return x;
  } else {
    return std::visit(
        [](const auto &v) -> Element<P> {
          using V = std::remove_cvref_t<decltype(v)>;
          if constexpr (std::is_same_v<V, Zero<Q>>) {
            return Zero<P>{};
          } else if constexpr (std::is_same_v<V, One<Q>>) {
            return One<P>{};
          } else if constexpr (std::is_same_v<V, Scalar<Q>>) {
            return scalar(static_cast<P>(v.value()));
          } else if constexpr (std::is_same_v<V, Pseudoscalar<Q>>) {
            return pseudoscalar(v.dim(), static_cast<P>(v.value()));
          } else if constexpr (std::is_same_v<V, Blade<Q>>) {
            return detail::blade_from_basis<P>(v.basis().template cast<P>(),
                                               static_cast<P>(v.volume()));
          } else {
            std::vector<Element<P>> converted;
            for (const Element<Q> &t : blades(Element<Q>(v))) {
              converted.push_back(convert<P>(t));
            }
            return multivector(converted);
          }
        },
        x);
  }
}

/// \brief Bring any operand into `Element<P>`: reals via `scalar()`, vectors via `blade()`.
template <Precision P, Operand X> Element<P> lift(const X &x) {
  using V = std::remove_cvref_t<X>;
  if constexpr (std::is_arithmetic_v<V>) {
    return scalar(static_cast<P>(x));
  } else if constexpr (EigenVector<V>) {
    return blade(x.template cast<P>());
  } else if constexpr (std::is_same_v<precision_t<V>, P>) {
    return Element<P>(x);
  } else {
    return convert<P>(Element<precision_t<V>>(x));
  }
}

// ========================================================================
// 7. SHARED DISPATCH HELPERS
// ========================================================================

namespace detail {

/// \brief Apply `fn` to every term of `mv` and sum the results.
template <Precision T, typename Fn> Element<T> map_terms(const Multivector<T> &mv, Fn &&fn) {
  std::vector<Element<T>> out;
  out.reserve(mv.size());
  for (const auto &[k, terms] : mv.parts()) {
    for (const auto &t : terms) {
      out.push_back(fn(to_element<T>(t)));
    }
  }
  return multivector(out);
}

/// \brief `factor * x`, canonicalized.
template <Precision T> Element<T> scale(const Element<T> &x, T factor) {
  return std::visit(
      [factor](const auto &v) -> Element<T> {
        using V = std::remove_cvref_t<decltype(v)>;
        if constexpr (std::is_same_v<V, Zero<T>>) {
          return Zero<T>{};
        } else if constexpr (std::is_same_v<V, One<T>> || std::is_same_v<V, Scalar<T>>) {
          return scalar(v.value() * factor);
        } else if constexpr (std::is_same_v<V, Pseudoscalar<T>>) {
          return pseudoscalar(v.dim(), v.value() * factor);
        } else if constexpr (std::is_same_v<V, Blade<T>>) {
          return blade_from_basis<T>(v.basis(), v.volume() * factor);
        } else {
          if (factor == T(0)) {
            return Zero<T>{};
          }
          return map_terms(v, [factor](const Element<T> &t) { return scale(t, factor); });
        }
      },
      x);
}

/// \brief `DimensionMismatch` when both operands carry a dimension and disagree.
template <typename A, typename B> void check_dims(const A &a, const B &b) {
  if constexpr (is_dimensioned_v<A> && is_dimensioned_v<B>) {
    assert_dim_equal(a.dim(), b.dim());
  }
}

} // namespace detail

} // namespace clifford
