#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <variant>
#include <vector>

#include <Eigen/Dense>

#include <clifford/clifford.hpp>

#include "support/blades.hpp"
#include "support/tolerances.hpp"

using namespace clifford;
using clifford::test_support::e;
using clifford::test_support::kTolMedium;
using clifford::test_support::random_blade;

TEST_CASE("Wedge of basis vectors") {
  const Element<double> e12 = wedge(e(3, 0), e(3, 1));
  REQUIRE(std::holds_alternative<Blade<double>>(e12));
  CHECK(grade(e12) == 2);
  CHECK(norm(e12) == doctest::Approx(1.0));
  CHECK(coordinate(e12, {0, 1}) == doctest::Approx(1.0));
  CHECK(coordinate(e12, {0, 2}) == doctest::Approx(0.0));

  const Element<double> e21 = e(3, 1) ^ e(3, 0);
  CHECK(coordinate(e21, {0, 1}) == doctest::Approx(-1.0));

  CHECK(std::holds_alternative<Zero<double>>(wedge(e(3, 0), e(3, 0))));

  const Element<double> e123 = e12 ^ e(3, 2);
  REQUIRE(std::holds_alternative<Pseudoscalar<double>>(e123));
  CHECK(value(e123) == doctest::Approx(1.0));
  CHECK(value(e(3, 2) ^ e12) == doctest::Approx(1.0));
  CHECK(value(e(3, 1) ^ e(3, 0) ^ e(3, 2)) == doctest::Approx(-1.0));
}

TEST_CASE("Raw vectors wedge as grade-1 blades") {
  const Element<double> p = wedge(Eigen::Vector2d(1.0, 0.0), blade(Eigen::Vector2d(0.0, 1.0)));
  REQUIRE(std::holds_alternative<Pseudoscalar<double>>(p));
  CHECK(value(p) == doctest::Approx(1.0));
}

TEST_CASE("Grades add and norms multiply for orthogonal blades") {
  const Element<double> a = blade(Eigen::Vector4d(2.0, 0.0, 0.0, 0.0));
  const Element<double> b = wedge(blade(Eigen::Vector4d(0.0, 3.0, 0.0, 0.0)),
                                  blade(Eigen::Vector4d(0.0, 0.0, 0.5, 0.0)));
  const Element<double> w = wedge(a, b);
  CHECK(grade(w) == 3);
  CHECK(norm(w) == doctest::Approx(3.0));
}

TEST_CASE("Grade sum above dim is Zero") {
  for (int n = 2; n <= 5; ++n) {
    for (int k = 1; k < n; ++k) {
      for (int l = n - k + 1; l < n; ++l) {
        const Element<double> b = random_blade(n, k, static_cast<unsigned>(100 * n + 10 * k + l));
        const Element<double> c = random_blade(n, l, static_cast<unsigned>(7 * n + k + l));
        CHECK(std::holds_alternative<Zero<double>>(wedge(b, c)));
      }
    }
  }
}

TEST_CASE("Wedge is antisymmetric for vectors and agrees with the spanning set") {
  const Eigen::Vector3d u(1.0, 2.0, 0.5);
  const Eigen::Vector3d v(-0.3, 1.0, 2.0);
  const Element<double> uv = wedge(u, v);
  const Element<double> vu = wedge(v, u);
  CHECK(isapprox(uv, negate(vu)));

  Eigen::MatrixXd m(3, 2);
  m << u, v;
  CHECK(isapprox(uv, blade(m)));
  CHECK(norm(uv) == doctest::Approx(u.cross(v).norm()));
}

TEST_CASE("Scalars scale, Zero absorbs, One is the identity") {
  const Element<double> v = e(3, 0);
  CHECK(norm(wedge(3.0, v)) == doctest::Approx(3.0));
  CHECK(volume(wedge(v, -2.0)) == doctest::Approx(-2.0));
  CHECK(std::holds_alternative<Zero<double>>(wedge(Zero<double>{}, v)));
  CHECK(std::holds_alternative<Zero<double>>(wedge(v, 0.0)));
  CHECK(equals(wedge(One<double>{}, v), v));
  CHECK(value(wedge(2.0, 3.0)) == doctest::Approx(6.0));
}

TEST_CASE("Pseudoscalars leave no room") {
  CHECK(std::holds_alternative<Zero<double>>(wedge(pseudoscalar(3, 2.0), pseudoscalar(3, 1.0))));
  CHECK(std::holds_alternative<Zero<double>>(wedge(pseudoscalar(3, 2.0), e(3, 0))));
  CHECK(std::holds_alternative<Zero<double>>(wedge(e(3, 0), pseudoscalar(3, 2.0))));
  CHECK(value(wedge(2.0, pseudoscalar(3, 2.0))) == doctest::Approx(4.0));
}

TEST_CASE("Wedge distributes over multivectors") {
  const Element<double> x =
      multivector(std::vector<Element<double>>{scalar(2.0), e(2, 0)});
  const Element<double> w = wedge(x, e(2, 1));
  REQUIRE(std::holds_alternative<Multivector<double>>(w));
  CHECK(grades(w) == std::vector<int>{1, 2});
  CHECK(isapprox(terms(w, 1).front(), Eigen::Vector2d(0.0, 2.0)));
  CHECK(value(terms(w, 2).front()) == doctest::Approx(1.0));
}

TEST_CASE("Operands from different spaces are rejected") {
  CHECK_THROWS_AS(wedge(pseudoscalar(5, 1.0), pseudoscalar(6, 1.0)), DimensionMismatch);
  CHECK_THROWS_AS(wedge(e(3, 0), e(4, 1)), DimensionMismatch);
  CHECK_THROWS_AS(wedge(e(3, 0), Eigen::Vector2d(1.0, 0.0)), DimensionMismatch);
}

TEST_CASE("Mixed precision computes in the wider type") {
  const Element<float> a = blade(Eigen::Vector3f(1.0f, 0.0f, 0.0f));
  const Element<double> b = e(3, 1);
  const auto w = wedge(a, b);
  CHECK(std::is_same_v<decltype(w), const Element<double>>);
  CHECK(norm(w) == doctest::Approx(1.0).epsilon(kTolMedium));
}
