#pragma once

#ifndef lumina_math_ray_hpp
#define lumina_math_ray_hpp

#include "lumina-core/math/math-common.hpp"
#include "lumina-core/math/math-spatial.hpp"

namespace lumina
{
    struct ray
    {
        float3 origin;
        float3 direction;
        ray() = default;
        ray(const float3 & ori, const float3 & dir) : origin(ori), direction(dir) {}
        float3 calculate_position(float t) const { return origin + direction * t; }
    };

    inline ray between(const float3 & start, const float3 & end)
    {
        return { start, safe_normalize(end - start) };
    }

    // Real-Time Collision Detection pg. 180
    inline bool intersect_ray_box(const ray & ray, const aabb_3d & box, float * outTmin = nullptr, float * outTmax = nullptr)
    {
        constexpr float PLANE_EPSILON = 0.0001f;

        float tmin = 0.f;
        float tmax = std::numeric_limits<float>::max();

        for (int i = 0; i < 3; ++i)
        {
            if (std::abs(ray.direction[i]) < PLANE_EPSILON)
            {
                // Ray is parallel to slab. No hit if r.origin not within slab
                if ((ray.origin[i] < box._min[i]) || (ray.origin[i] > box._max[i])) return false;
            }
            else
            {
                float t1 = (box._min[i] - ray.origin[i]) / ray.direction[i];
                float t2 = (box._max[i] - ray.origin[i]) / ray.direction[i];
                if (t1 > t2) std::swap(t1, t2);

                tmin = std::max(tmin, t1);
                tmax = std::min(tmax, t2);

                if (tmin > tmax) return false;
            }
        }

        if (outTmin) *outTmin = tmin;
        if (outTmax) *outTmax = tmax;
        return true;
    }

    // Adapted from: http://www.lighthouse3d.com/tutorials/maths/ray-triangle-intersection/
    inline bool intersect_ray_triangle(const ray & ray, const float3 & v0, const float3 & v1, const float3 & v2, float * outT = nullptr, float2 * outUV = nullptr)
    {
        const float3 e1 = v1 - v0, e2 = v2 - v0, h = cross(ray.direction, e2);

        const float a = dot(e1, h);
        if (std::abs(a) == 0.0f) return false; // collinear with triangle plane

        const float3 s = ray.origin - v0;
        const float f = 1 / a;
        const float u = f * dot(s, h);
        if (u < 0 || u > 1) return false;

        const float3 q = cross(s, e1);
        const float v = f * dot(ray.direction, q);
        if (v < 0 || u + v > 1) return false;

        const float t = f * dot(e2, q);
        if (t < 0) return false;

        if (outT) *outT = t;
        if (outUV) *outUV = { u, v };

        return true;
    }

} // end namespace lumina

#endif // end lumina_math_ray_hpp
