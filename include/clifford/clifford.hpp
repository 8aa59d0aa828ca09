#pragma once

/// \file
/// \brief Umbrella header for the public clifford API.

#include <clifford/core/config.hpp>
#include <clifford/core/errors.hpp>
#include <clifford/core/linalg.hpp>
#include <clifford/core/precision.hpp>

#include <clifford/data/blade.hpp>
#include <clifford/data/element.hpp>
#include <clifford/data/multivector.hpp>
#include <clifford/data/pseudoscalar.hpp>
#include <clifford/data/scalars.hpp>

#include <clifford/ops/arithmetic.hpp>
#include <clifford/ops/comparison.hpp>
#include <clifford/ops/contraction.hpp>
#include <clifford/ops/coordinates.hpp>
#include <clifford/ops/dual.hpp>
#include <clifford/ops/projection.hpp>
#include <clifford/ops/wedge.hpp>

#include <clifford/io/format.hpp>
