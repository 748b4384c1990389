#pragma once

#ifndef lumina_math_projection_hpp
#define lumina_math_projection_hpp

#include "lumina-core/math/math-common.hpp"

#undef near
#undef far

namespace lumina
{
    // OpenGL-style clip space (z in [-w, w])
    inline float4x4 make_projection_matrix(float l, float r, float b, float t, float n, float f)
    {
        return{ { 2 * n / (r - l),0,0,0 },{ 0,2 * n / (t - b),0,0 },{ (r + l) / (r - l),(t + b) / (t - b),-(f + n) / (f - n),-1 },{ 0,0,-2 * f*n / (f - n),0 } };
    }

    inline float4x4 make_projection_matrix(float vFovInRadians, float aspectRatio, float nearZ, float farZ)
    {
        const float top = nearZ * std::tan(vFovInRadians / 2.f), right = top * aspectRatio;
        return make_projection_matrix(-right, right, -top, top, nearZ, farZ);
    }

    inline float4x4 make_orthographic_matrix(float l, float r, float b, float t, float n, float f)
    {
        return{ { 2 / (r - l),0,0,0 },{ 0,2 / (t - b),0,0 },{ 0,0,-2 / (f - n),0 },{ -(r + l) / (r - l),-(t + b) / (t - b),-(f + n) / (f - n),1 } };
    }

} // end namespace lumina

#endif // end lumina_math_projection_hpp
