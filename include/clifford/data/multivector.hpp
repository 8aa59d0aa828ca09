#pragma once

#include <cstddef>
#include <map>
#include <utility>
#include <variant>
#include <vector>

#include <clifford/core/precision.hpp>
#include <clifford/data/blade.hpp>
#include <clifford/data/pseudoscalar.hpp>
#include <clifford/data/scalars.hpp>

namespace clifford {

/**
 * \brief Sum of blades of one space, grouped by grade.
 *
 * Built only by `multivector()`, which guarantees at least two terms, no
 * Zero terms, and at most one term in each of grades 0, 1 and `dim`.
 */
template <Precision T> class Multivector {
public:
  using Term = std::variant<One<T>, Scalar<T>, Blade<T>, Pseudoscalar<T>>;
  using Parts = std::map<int, std::vector<Term>>;

  int dim() const { return dim_; }

  /// \brief `sqrt` of the sum of squared term norms, fixed at construction.
  T norm() const { return norm_; }

  /// \brief Grades present, ascending.
  std::vector<int> grades() const {
    std::vector<int> out;
    out.reserve(parts_.size());
    for (const auto &[k, terms] : parts_) {
      out.push_back(k);
    }
    return out;
  }

  const Parts &parts() const { return parts_; }

  /// \brief Terms of grade `k`; empty when the grade is absent.
  std::vector<Term> terms(int k) const {
    const auto it = parts_.find(k);
    if (it == parts_.end()) {
      return {};
    }
    return it->second;
  }

  size_t size() const {
    size_t count = 0;
    for (const auto &[k, terms] : parts_) {
      count += terms.size();
    }
    return count;
  }

  friend bool operator==(const Multivector &a, const Multivector &b) {
    return a.dim_ == b.dim_ && a.parts_ == b.parts_;
  }

private:
  Multivector(int dim, Parts parts, T norm) : dim_(dim), parts_(std::move(parts)), norm_(norm) {}

  int dim_;
  Parts parts_;
  T norm_;

  friend struct detail::Access;
};

} // namespace clifford
