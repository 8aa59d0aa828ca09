#pragma once

#include <numeric>
#include <stdexcept>
#include <type_traits>
#include <variant>
#include <vector>

#include <fmt/format.h>

#include <clifford/core/linalg.hpp>
#include <clifford/data/element.hpp>

namespace clifford {

namespace detail {

/**
 * \brief Step a strictly increasing index set to its lexicographic successor.
 * \param indices `k` indices in `[0, n)`, updated in place.
 * \param n Ambient dimension.
 * \return `false` once `indices` was the last set `{n-k, ..., n-1}`.
 */
inline bool next_index_set(std::vector<int> &indices, int n) {
  const int k = static_cast<int>(indices.size());
  for (int i = k - 1; i >= 0; --i) {
    const auto slot = static_cast<size_t>(i);
    if (indices[slot] < n - k + i) {
      ++indices[slot];
      for (size_t j = slot + 1; j < indices.size(); ++j) {
        indices[j] = indices[j - 1] + 1;
      }
      return true;
    }
  }
  return false;
}

/// \brief `std::invalid_argument` unless `indices` is strictly increasing within `[0, n)`.
inline void check_index_set(const std::vector<int> &indices, int n) {
  int prev = -1;
  for (const int i : indices) {
    if (i <= prev || i >= n) {
      throw std::invalid_argument(fmt::format(
          "basis blade indices must be strictly increasing in [0, {}), got {}", n,
          fmt::join(indices, ", ")));
    }
    prev = i;
  }
}

/// \brief Coefficient of one homogeneous term on the basis blade `indices` of its grade.
template <Precision T> T term_coordinate(const Element<T> &term, const std::vector<int> &indices) {
  return std::visit(
      [&indices](const auto &t) -> T {
        using V = std::remove_cvref_t<decltype(t)>;
        if constexpr (std::is_same_v<V, Blade<T>>) {
          const auto k = static_cast<Eigen::Index>(indices.size());
          core::MatrixX<T> selected(k, k);
          for (Eigen::Index r = 0; r < k; ++r) {
            selected.row(r) = t.basis().row(indices[static_cast<size_t>(r)]);
          }
          const T minor_det = selected.determinant();
          return minor_det == T(0) ? T(0) : t.volume() * minor_det;
        } else if constexpr (std::is_same_v<V, Multivector<T>>) {
          return T(0);
        } else {
          return t.value();
        }
      },
      term);
}

template <Precision T> core::VectorX<T> coordinates_impl(const Element<T> &x, int k) {
  const int n = dim(x);
  if (k < 0 || k > n) {
    return core::VectorX<T>(0);
  }
  const std::vector<Element<T>> homogeneous = terms(x, k);

  std::vector<T> values;
  std::vector<int> indices(static_cast<size_t>(k));
  std::iota(indices.begin(), indices.end(), 0);
  do {
    T sum = T(0);
    for (const Element<T> &t : homogeneous) {
      sum += term_coordinate(t, indices);
    }
    values.push_back(sum);
  } while (next_index_set(indices, n));

  return Eigen::Map<const core::VectorX<T>>(values.data(),
                                            static_cast<Eigen::Index>(values.size()));
}

} // namespace detail

/**
 * \brief Coefficients of the grade-`k` part of `x` on the standard basis blades.
 *
 * Entry `i` belongs to the `i`-th index set `{i1 < ... < ik}` in
 * lexicographic order, i.e. to `e_{i1} ^ ... ^ e_{ik}`. A blade contributes
 * `volume * det` of the selected rows of its basis.
 *
 * \return Vector of length `C(dim, k)`; empty when `k` is out of range.
 */
template <Operand X> core::VectorX<precision_t<X>> coordinates(const X &x, int k) {
  using P = precision_t<X>;
  return detail::coordinates_impl(lift<P>(x), k);
}

/**
 * \brief Coefficient of the standard basis blade with the given indices.
 * \throws std::invalid_argument unless `indices` is strictly increasing within `[0, dim(x))`.
 */
template <Operand X>
precision_t<X> coordinate(const X &x, const std::vector<int> &indices) {
  using P = precision_t<X>;
  const Element<P> e = lift<P>(x);
  detail::check_index_set(indices, dim(e));

  P sum = P(0);
  for (const Element<P> &t : terms(e, static_cast<int>(indices.size()))) {
    sum += detail::term_coordinate(t, indices);
  }
  return sum;
}

} // namespace clifford
