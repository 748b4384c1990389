/*
 * File: math-common.hpp
 * Brings the linalg::aliases namespace into lumina along with the handful of
 * constants and scalar helpers the baker needs (GLSL-style mix/smoothstep,
 * clamping, angle conversion).
 */

#pragma once

#ifndef lumina_math_common_hpp
#define lumina_math_common_hpp

#include <vector>
#include <cmath>
#include <algorithm>
#include <ostream>
#include <type_traits>

#include "linalg.h"

#define LUMINA_PI            3.1415926535897931
#define LUMINA_HALF_PI       1.5707963267948966
#define LUMINA_TWO_PI        6.2831853071795862
#define LUMINA_INV_PI        0.3183098861837907
#define LUMINA_DEG_TO_RAD    0.0174532925199433
#define LUMINA_RAD_TO_DEG    57.295779513082321

namespace lumina
{
    using namespace linalg::aliases;

    static const float4x4 Identity4x4 = {{1, 0, 0, 0}, {0, 1, 0, 0}, {0, 0, 1, 0}, {0, 0, 0, 1}};
    static const float3x3 Identity3x3 = {{1, 0, 0}, {0, 1, 0}, {0, 0, 1}};

    template<class T> std::ostream & operator << (std::ostream & a, const linalg::vec<T, 2> & b) { return a << '{' << b.x << ", " << b.y << '}'; }
    template<class T> std::ostream & operator << (std::ostream & a, const linalg::vec<T, 3> & b) { return a << '{' << b.x << ", " << b.y << ", " << b.z << '}'; }
    template<class T> std::ostream & operator << (std::ostream & a, const linalg::vec<T, 4> & b) { return a << '{' << b.x << ", " << b.y << ", " << b.z << ", " << b.w << '}'; }

    inline float to_radians(const float degrees) { return degrees * float(LUMINA_PI) / 180.0f; }

    template<typename T, typename = typename std::enable_if<std::is_arithmetic<T>::value, T>::type> T clamp(const T & val, const T & min, const T & max) { return std::min(std::max(val, min), max); }
    template<typename T> bool in_range(T val, T min, T max) { return (val >= min && val <= max); }

    template<class T, int M> linalg::vec<T, M> safe_normalize(const linalg::vec<T, M> & a)
    {
        return a / std::max(T(1E-6), length(a));
    }

    inline float3 project_on_plane(const float3 & I, const float3 & N)
    {
        return I - N * dot(N, I);
    }

    // Linear interpolation (mix terminology from GLSL)
    inline float mix(const float a, const float b, const float t)
    {
        return a * (1.0f - t) + b * t;
    }

    inline float3 mix(const float3 & a, const float3 & b, const float t)
    {
        return a * (1.0f - t) + b * t;
    }

    inline float smoothstep(const float edge0, const float edge1, const float x)
    {
        const float S = std::min(std::max((x - edge0) / (edge1 - edge0), 0.f), 1.f);
        return S * S * (3.f - 2.f * S);
    }

    // Euclidean modulo, always in [0, n)
    inline int wrap_index(const int i, const int n)
    {
        return ((i % n) + n) % n;
    }

} // end namespace lumina

#endif // end lumina_math_common_hpp
