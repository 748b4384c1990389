/*
 * File: math-core.hpp
 * Imports all of lumina's math features into a sub-library or app.
 */

#pragma once

#ifndef lumina_math_core_hpp
#define lumina_math_core_hpp

#include "lumina-core/math/math-common.hpp"
#include "lumina-core/math/math-spatial.hpp"
#include "lumina-core/math/math-projection.hpp"
#include "lumina-core/math/math-ray.hpp"

#endif // end lumina_math_core_hpp
