// include/rmath/rmathlib.hpp — Umbrella header that exposes rmathlib components.

#pragma once

// Users should generally include only this file.

#include <rmath/context.hpp>
#include <rmath/convert.hpp>
#include <rmath/core/bigint.hpp>
#include <rmath/core/number.hpp>
#include <rmath/core/traits.hpp>
#include <rmath/engine/full_engine.hpp>
#include <rmath/engine/simplified_engine.hpp>
#include <rmath/io/format.hpp>
#include <rmath/io/options.hpp>
#include <rmath/io/parse.hpp>
#include <rmath/radix_math.hpp>
#include <rmath/util/debug.hpp>
#include <rmath/util/random.hpp>

namespace rmath {

using core::bigfloat;
using core::decimal;

} // namespace rmath
