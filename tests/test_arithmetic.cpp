#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cmath>
#include <limits>
#include <type_traits>
#include <variant>
#include <vector>

#include <Eigen/Dense>

#include <clifford/clifford.hpp>

#include "support/blades.hpp"
#include "support/tolerances.hpp"

using namespace clifford;
using clifford::test_support::e;
using clifford::test_support::kTolFloat;

TEST_CASE("Addition and subtraction") {
  CHECK(value(add(2.0, 3.0)) == doctest::Approx(5.0));
  CHECK(norm(add(e(3, 0), e(3, 0))) == doctest::Approx(2.0));
  CHECK(std::holds_alternative<Zero<double>>(subtract(e(3, 0), e(3, 0))));
  CHECK(equals(add(Zero<double>{}, e(3, 1)), e(3, 1)));

  const Element<double> sum = e(3, 0) + e(3, 1);
  CHECK(isapprox(sum, Eigen::Vector3d(1.0, 1.0, 0.0)));
  const Element<double> mixed = e(3, 0) + 2.0;
  REQUIRE(std::holds_alternative<Multivector<double>>(mixed));
  CHECK(norm(mixed) == doctest::Approx(std::sqrt(5.0)));
  CHECK(isapprox(mixed - 2.0, e(3, 0)));
  CHECK_THROWS_AS(e(3, 0) + e(2, 0), DimensionMismatch);
}

TEST_CASE("Negation") {
  const Element<double> n = -e(3, 0);
  CHECK(volume(n) == doctest::Approx(-1.0));
  CHECK(sign(n) == doctest::Approx(-1.0));
  CHECK(value(negate(One<double>{})) == doctest::Approx(-1.0));
  CHECK(std::holds_alternative<Zero<double>>(negate(Zero<double>{})));
  CHECK(value(negate(pseudoscalar(3, 2.0))) == doctest::Approx(-2.0));

  const Element<double> mv = multivector(std::vector<Element<double>>{scalar(2.0), e(3, 0)});
  CHECK(isapprox(add(mv, negate(mv)), 0.0));
}

TEST_CASE("Scalar multiplication") {
  CHECK(norm(multiply(2.0, e(3, 0))) == doctest::Approx(2.0));
  CHECK(volume(e(3, 0) * -4.0) == doctest::Approx(-4.0));
  CHECK(std::holds_alternative<Zero<double>>(multiply(0.0, e(3, 0))));
  CHECK(std::holds_alternative<One<double>>(multiply(0.5, 2.0)));
  CHECK(value(multiply(pseudoscalar(3, 2.0), 3)) == doctest::Approx(6.0));

  const Element<double> mv = multivector(std::vector<Element<double>>{scalar(2.0), e(3, 0)});
  CHECK(norm(multiply(mv, 2.0)) == doctest::Approx(2.0 * norm(mv)));

  CHECK_THROWS_AS(multiply(e(3, 0), e(3, 1)), UndefinedOperation);
  CHECK_THROWS_AS(e(3, 0) * pseudoscalar(3, 1.0), UndefinedOperation);
}

TEST_CASE("Reversion") {
  CHECK(equals(reverse(e(3, 0)), e(3, 0)));
  const Element<double> e12 = wedge(e(3, 0), e(3, 1));
  CHECK(volume(reverse(e12)) == doctest::Approx(-volume(e12)));
  CHECK(value(reverse(pseudoscalar(3, 2.0))) == doctest::Approx(-2.0));
  CHECK(value(reverse(pseudoscalar(4, 2.0))) == doctest::Approx(2.0));
  CHECK(value(reverse(scalar(2.0))) == doctest::Approx(2.0));

  const Element<double> mv = multivector(std::vector<Element<double>>{e(3, 0), e12});
  CHECK(isapprox(reverse(reverse(mv)), mv));
}

TEST_CASE("Reciprocal") {
  CHECK(value(reciprocal(scalar(4.0))) == doctest::Approx(0.25));
  CHECK(std::holds_alternative<One<double>>(reciprocal(One<double>{})));
  CHECK(std::holds_alternative<Zero<double>>(
      reciprocal(scalar(std::numeric_limits<double>::infinity()))));
  CHECK_THROWS_WITH_AS(reciprocal(Zero<double>{}), "The reciprocal of Zero is not well-defined",
                       UndefinedOperation);

  const Element<double> v = multiply(2.0, e(3, 0));
  CHECK(isapprox(inverse(v), Eigen::Vector3d(0.5, 0.0, 0.0)));

  const Element<double> b = multiply(2.0, wedge(e(3, 0), e(3, 1)));
  CHECK(volume(reciprocal(b)) == doctest::Approx(-0.5));
  CHECK(isapprox(contract_left(reciprocal(b), b), 1.0));

  CHECK(value(reciprocal(pseudoscalar(3, 2.0))) == doctest::Approx(-0.5));

  const Element<double> mv = multivector(std::vector<Element<double>>{scalar(2.0), e(3, 0)});
  CHECK_THROWS_AS(reciprocal(mv), UndefinedOperation);
}

TEST_CASE("Precision conversion") {
  const Element<double> d = multiply(3.0, wedge(e(3, 0), e(3, 1)));
  const Element<float> f = convert<float>(d);
  REQUIRE(std::holds_alternative<Blade<float>>(f));
  CHECK(volume(f) == doctest::Approx(3.0f).epsilon(kTolFloat));
  CHECK(std::holds_alternative<One<float>>(convert<float>(scalar(1.0))));

  const Element<double> mv = multivector(std::vector<Element<double>>{scalar(2.0), e(3, 0)});
  const Element<float> mvf = convert<float>(mv);
  REQUIRE(std::holds_alternative<Multivector<float>>(mvf));
  CHECK(norm(mvf) == doctest::Approx(std::sqrt(5.0f)).epsilon(kTolFloat));

  const auto sum = add(f, 1.0);
  CHECK(std::is_same_v<decltype(sum), const Element<double>>);
}
