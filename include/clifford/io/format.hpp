#pragma once

#include <ostream>
#include <string_view>
#include <variant>

#include <fmt/format.h>

#include <clifford/data/element.hpp>

// Text form of every variant, e.g. `Blade(dim=3, grade=1, volume=5)`.

namespace fmt {

template <clifford::Precision T>
struct formatter<clifford::Zero<T>> : formatter<string_view> {
  template <typename FormatContext>
  auto format(const clifford::Zero<T> &, FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "Zero");
  }
};

template <clifford::Precision T>
struct formatter<clifford::One<T>> : formatter<string_view> {
  template <typename FormatContext>
  auto format(const clifford::One<T> &, FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "One");
  }
};

template <clifford::Precision T>
struct formatter<clifford::Scalar<T>> : formatter<string_view> {
  template <typename FormatContext>
  auto format(const clifford::Scalar<T> &s, FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "Scalar({})", s.value());
  }
};

template <clifford::Precision T>
struct formatter<clifford::Pseudoscalar<T>> : formatter<string_view> {
  template <typename FormatContext>
  auto format(const clifford::Pseudoscalar<T> &p, FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "Pseudoscalar(dim={}, value={})", p.dim(), p.value());
  }
};

template <clifford::Precision T>
struct formatter<clifford::Blade<T>> : formatter<string_view> {
  template <typename FormatContext>
  auto format(const clifford::Blade<T> &b, FormatContext &ctx) const {
    auto out = fmt::format_to(ctx.out(), "Blade(dim={}, grade={}, volume={}, basis=[", b.dim(),
                              b.grade(), b.volume());
    const auto &q = b.basis();
    for (Eigen::Index j = 0; j < q.cols(); ++j) {
      out = fmt::format_to(out, "{}[", j == 0 ? "" : ", ");
      for (Eigen::Index i = 0; i < q.rows(); ++i) {
        out = fmt::format_to(out, "{}{:.6g}", i == 0 ? "" : ", ", q(i, j));
      }
      out = fmt::format_to(out, "]");
    }
    return fmt::format_to(out, "])");
  }
};

template <clifford::Precision T>
struct formatter<clifford::Multivector<T>> : formatter<string_view> {
  template <typename FormatContext>
  auto format(const clifford::Multivector<T> &m, FormatContext &ctx) const {
    auto out = fmt::format_to(ctx.out(), "Multivector(dim={}, norm={}, terms=[", m.dim(), m.norm());
    bool first = true;
    for (const auto &[k, terms] : m.parts()) {
      for (const auto &t : terms) {
        out = fmt::format_to(out, "{}", first ? "" : " + ");
        out = std::visit([&out](const auto &v) { return fmt::format_to(out, "{}", v); }, t);
        first = false;
      }
    }
    return fmt::format_to(out, "])");
  }
};

template <clifford::Precision T>
struct formatter<clifford::Element<T>> : formatter<string_view> {
  template <typename FormatContext>
  auto format(const clifford::Element<T> &e, FormatContext &ctx) const {
    return std::visit([&ctx](const auto &v) { return fmt::format_to(ctx.out(), "{}", v); }, e);
  }
};

} // namespace fmt

namespace clifford {

template <Algebraic X> std::ostream &operator<<(std::ostream &os, const X &x) {
  return os << fmt::format("{}", x);
}

} // namespace clifford
