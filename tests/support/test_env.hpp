#pragma once

#include <cstdlib>

namespace clifford::test_support {

inline void configure_deterministic_test_env() { setenv("CLIFFORD_TRACE", "0", 1); }

} // namespace clifford::test_support
