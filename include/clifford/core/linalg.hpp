#pragma once

#include <Eigen/Dense>

namespace clifford::core {

template <typename T> using MatrixX = Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic>;
template <typename T> using VectorX = Eigen::Matrix<T, Eigen::Dynamic, 1>;

/// \brief Orthonormal factor of a spanning set together with its signed volume.
template <typename T> struct Orthonormalization {
  /// \brief `n x k` matrix with orthonormal columns, same orientation as the input.
  MatrixX<T> basis;
  /// \brief Non-negative `k`-volume of the spanning set.
  T volume = T(0);
  /// \brief Numerical rank of the spanning set.
  Eigen::Index rank = 0;
};

/// \brief `+1` or `-1` by the sign of the determinant of a non-empty square matrix.
template <typename T> inline int determinant_sign(const MatrixX<T> &m) {
  return m.determinant() < T(0) ? -1 : 1;
}

/**
 * \brief Householder factorization `V = Q R` of a spanning set.
 *
 * A rank-deficient input reports its rank and leaves `basis` empty. Otherwise
 * the sign of `prod(diag R)` is moved into the first column of `Q` so the
 * returned volume is non-negative and `det(V) == det(Q) * volume` when `V` is
 * square.
 *
 * \param vectors `n x k` matrix whose columns span the subspace.
 * \return Orthonormal basis, volume and rank.
 */
template <typename T> Orthonormalization<T> orthonormalize(const MatrixX<T> &vectors) {
  const Eigen::Index n = vectors.rows();
  const Eigen::Index k = vectors.cols();

  Orthonormalization<T> out;
  const Eigen::ColPivHouseholderQR<MatrixX<T>> pivoted(vectors);
  out.rank = pivoted.rank();
  if (out.rank < k) {
    return out;
  }

  const Eigen::HouseholderQR<MatrixX<T>> qr(vectors);
  out.basis = qr.householderQ() * MatrixX<T>::Identity(n, k);
  const MatrixX<T> &r = qr.matrixQR();
  T volume = T(1);
  for (Eigen::Index i = 0; i < k; ++i) {
    volume *= r(i, i);
  }
  if (volume < T(0)) {
    out.basis.col(0) = -out.basis.col(0);
    volume = -volume;
  }
  out.volume = volume;
  return out;
}

/**
 * \brief Orthonormal basis of the complement of `span(basis)` in `R^n`.
 * \param basis `n x k` matrix with orthonormal (or at least independent) columns.
 * \return `n x (n - k)` matrix with orthonormal columns.
 */
template <typename T> MatrixX<T> orthogonal_complement(const MatrixX<T> &basis) {
  const Eigen::Index n = basis.rows();
  const Eigen::Index k = basis.cols();
  if (k == 0) {
    return MatrixX<T>::Identity(n, n);
  }
  if (k >= n) {
    return MatrixX<T>(n, 0);
  }
  const Eigen::HouseholderQR<MatrixX<T>> qr(basis);
  const MatrixX<T> full = qr.householderQ();
  return full.rightCols(n - k);
}

/**
 * \brief Frobenius norm of the part of `span(a)` lying outside `span(c)`.
 * \param a Orthonormal basis of the candidate subspace.
 * \param c Orthonormal basis of the reference subspace.
 */
template <typename T> T rejection_norm(const MatrixX<T> &a, const MatrixX<T> &c) {
  if (c.cols() == 0) {
    return a.norm();
  }
  return (a - c * (c.transpose() * a)).norm();
}

/// \brief Complement of one subspace inside another, with the induced orientation.
template <typename T> struct RelativeComplement {
  /// \brief `n x (l - k)` orthonormal basis of the complement, embedded in `R^n`.
  MatrixX<T> basis;
  /// \brief `sign det(C^T [A D])`, orientation of `[A D]` relative to `C`.
  int orientation = 1;
};

/**
 * \brief Complement of `span(a)` inside `span(c)`.
 * \param a `n x k` orthonormal basis contained in `span(c)`, `k >= 1`.
 * \param c `n x l` orthonormal basis, `l >= k`.
 * \return Complement basis and the orientation of `[a complement]` against `c`.
 */
template <typename T>
RelativeComplement<T> relative_complement(const MatrixX<T> &a, const MatrixX<T> &c) {
  const Eigen::Index k = a.cols();
  const Eigen::Index l = c.cols();
  const MatrixX<T> coords = c.transpose() * a;
  const MatrixX<T> rest = orthogonal_complement<T>(coords);

  MatrixX<T> frame(l, l);
  frame.leftCols(k) = coords;
  frame.rightCols(l - k) = rest;

  RelativeComplement<T> out;
  out.basis = c * rest;
  out.orientation = determinant_sign<T>(frame);
  return out;
}

} // namespace clifford::core
