#pragma once

#include <memory>
#include <utility>

#include <clifford/core/linalg.hpp>
#include <clifford/core/precision.hpp>
#include <clifford/data/scalars.hpp>

namespace clifford {

/// \brief Whether a blade built from another blade gets its own basis storage.
enum class BasisOwnership { Copy, Alias };

/**
 * \brief Oriented `grade`-dimensional subspace of `R^dim` with a signed volume.
 *
 * The basis is a `dim x grade` matrix with orthonormal columns whose order
 * fixes the orientation; `1 <= grade < dim`. Copies are deep. Two blades
 * share basis storage only when one was created from the other with
 * `BasisOwnership::Alias`.
 */
template <Precision T> class Blade {
public:
  using Matrix = core::MatrixX<T>;

  Blade(const Blade &other)
      : basis_(std::make_shared<Matrix>(*other.basis_)), volume_(other.volume_) {}

  Blade &operator=(const Blade &other) {
    if (this != &other) {
      basis_ = std::make_shared<Matrix>(*other.basis_);
      volume_ = other.volume_;
    }
    return *this;
  }

  Blade(Blade &&) noexcept = default;
  Blade &operator=(Blade &&) noexcept = default;

  int dim() const { return static_cast<int>(basis_->rows()); }
  int grade() const { return static_cast<int>(basis_->cols()); }
  T volume() const { return volume_; }
  T norm() const { return volume_ < T(0) ? -volume_ : volume_; }
  T sign() const { return volume_ < T(0) ? T(-1) : T(1); }

  const Matrix &basis() const { return *basis_; }

  /**
   * \brief Writable access to the basis storage.
   *
   * Writes are visible through every blade aliasing this storage and bypass
   * orthonormality; callers own that invariant.
   */
  Matrix &mutable_basis() { return *basis_; }

  /// \brief `true` when both blades read the same basis storage.
  bool shares_basis_with(const Blade &other) const { return basis_ == other.basis_; }

  friend bool operator==(const Blade &a, const Blade &b) {
    if (a.volume_ != b.volume_ || a.basis_->rows() != b.basis_->rows() ||
        a.basis_->cols() != b.basis_->cols()) {
      return false;
    }
    return *a.basis_ == *b.basis_;
  }

private:
  Blade(std::shared_ptr<Matrix> basis, T volume) : basis_(std::move(basis)), volume_(volume) {}

  std::shared_ptr<Matrix> basis_;
  T volume_;

  friend struct detail::Access;
};

} // namespace clifford
