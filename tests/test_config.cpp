#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cstdlib>

#include <clifford/core/config.hpp>
#include <clifford/core/errors.hpp>
#include <clifford/core/precision.hpp>

#include "support/test_env.hpp"

using namespace clifford;

TEST_CASE("CLIFFORD_TRACE parsing") {
  unsetenv("CLIFFORD_TRACE");
  CHECK_FALSE(core::trace_enabled_from_env());

  setenv("CLIFFORD_TRACE", "1", 1);
  CHECK(core::trace_enabled_from_env());
  setenv("CLIFFORD_TRACE", "TRUE", 1);
  CHECK(core::trace_enabled_from_env());
  setenv("CLIFFORD_TRACE", "On", 1);
  CHECK(core::trace_enabled_from_env());
  setenv("CLIFFORD_TRACE", "no", 1);
  CHECK_FALSE(core::trace_enabled_from_env());

  clifford::test_support::configure_deterministic_test_env();
  CHECK_FALSE(core::trace_enabled_from_env());
}

TEST_CASE("Default tolerances") {
  CHECK(default_atol<double>() == doctest::Approx(100.0 * 2.220446049250313e-16));
  CHECK(default_rtol<double, double>(0.0) == doctest::Approx(1.4901161193847656e-08));
  CHECK(default_rtol<float, double>(0.0) == doctest::Approx(3.4526698e-04));
  CHECK(default_rtol<double, double>(1e-3) == 0.0);
  CHECK(approx_value(1.0, 1.0 + 1e-10, 0.0, 1e-8));
  CHECK_FALSE(approx_value(1.0, 1.1, 0.0, 1e-8));
}

TEST_CASE("Dimension checks report both sides") {
  CHECK_NOTHROW(assert_dim_equal(3, 3));
  CHECK_THROWS_WITH_AS(
      assert_dim_equal(5, 6),
      "Dimension mismatch: left operand has dim 5, right operand has dim 6", DimensionMismatch);
}
