#pragma once

namespace clifford::test_support {

constexpr double kTolMedium = 1e-9;
constexpr double kTolTight = 1e-12;

constexpr float kTolFloat = 1e-4f;

} // namespace clifford::test_support
