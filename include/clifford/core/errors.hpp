#pragma once

#include <stdexcept>
#include <string>

#include <fmt/core.h>

namespace clifford {

/// \brief Two dimensioned operands live in spaces of different dimension.
class DimensionMismatch : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

/// \brief A relative dual was requested for a blade outside the reference subspace.
class ContainmentFailure : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

/// \brief The requested operation has no defined result for these operands.
class UndefinedOperation : public std::domain_error {
public:
  using std::domain_error::domain_error;
};

/**
 * \brief Throw `DimensionMismatch` unless both dimensions agree.
 * \param lhs Dimension of the left operand.
 * \param rhs Dimension of the right operand.
 */
inline void assert_dim_equal(int lhs, int rhs) {
  if (lhs != rhs) {
    throw DimensionMismatch(
        fmt::format("Dimension mismatch: left operand has dim {}, right operand has dim {}",
                    lhs, rhs));
  }
}

} // namespace clifford
