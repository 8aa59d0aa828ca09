#pragma once

#include <initializer_list>
#include <random>

#include <Eigen/Dense>

#include <clifford/clifford.hpp>

namespace clifford::test_support {

inline Eigen::VectorXd unit_vector(int n, int i) {
  Eigen::VectorXd v = Eigen::VectorXd::Zero(n);
  v(i) = 1.0;
  return v;
}

/// Standard basis vector `e_{i+1}` of `R^n` as a blade.
inline Element<double> e(int n, int i) { return blade(unit_vector(n, i)); }

inline Eigen::MatrixXd columns(std::initializer_list<Eigen::VectorXd> vectors) {
  const auto first = *vectors.begin();
  Eigen::MatrixXd m(first.size(), static_cast<Eigen::Index>(vectors.size()));
  Eigen::Index j = 0;
  for (const auto &v : vectors) {
    m.col(j++) = v;
  }
  return m;
}

inline Eigen::MatrixXd random_matrix(int rows, int cols, unsigned seed) {
  std::mt19937 gen(seed);
  std::normal_distribution<double> dist(0.0, 1.0);
  Eigen::MatrixXd m(rows, cols);
  for (int j = 0; j < cols; ++j) {
    for (int i = 0; i < rows; ++i) {
      m(i, j) = dist(gen);
    }
  }
  return m;
}

/// Random grade-`k` blade of `R^n`; Gaussian columns are independent with probability one.
inline Blade<double> random_blade(int n, int k, unsigned seed) {
  return std::get<Blade<double>>(blade(random_matrix(n, k, seed)));
}

} // namespace clifford::test_support
