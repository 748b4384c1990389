#pragma once

#ifndef lumina_math_spatial_hpp
#define lumina_math_spatial_hpp

#include "lumina-core/math/math-common.hpp"

#include <limits>

namespace lumina
{
    ////////////////
    //   aabb_3d  //
    ////////////////

    struct aabb_3d
    {
        float3 _min { std::numeric_limits<float>::infinity() };
        float3 _max { -std::numeric_limits<float>::infinity() };

        aabb_3d() = default;
        aabb_3d(const float3 & min, const float3 & max) : _min(min), _max(max) {}

        float3 min() const { return _min; }
        float3 max() const { return _max; }
        float3 size() const { return _max - _min; }
        float3 center() const { return (_min + _max) * 0.5f; }
        bool empty() const { return _max.x < _min.x || _max.y < _min.y || _max.z < _min.z; }

        void surround(const float3 & p) { _min = linalg::min(_min, p); _max = linalg::max(_max, p); }
    };

    ///////////////////////////////////
    //   Rotation / affine builders  //
    ///////////////////////////////////

    inline float4 make_rotation_quat_axis_angle(const float3 & axis, float angle)
    {
        return { axis * std::sin(angle / 2), std::cos(angle / 2) };
    }

    inline float4x4 make_translation_matrix(const float3 & translation)
    {
        return { { 1,0,0,0 },{ 0,1,0,0 },{ 0,0,1,0 },{ translation,1 } };
    }

    inline float4x4 make_scaling_matrix(const float3 & scaling)
    {
        return { { scaling.x,0,0,0 },{ 0,scaling.y,0,0 },{ 0,0,scaling.z,0 },{ 0,0,0,1 } };
    }

    inline float4x4 make_rotation_matrix(const float4 & rotation)
    {
        return { { qxdir(rotation),0 },{ qydir(rotation),0 },{ qzdir(rotation),0 },{ 0,0,0,1 } };
    }

    inline float4x4 make_rotation_matrix(const float3 & axis, float angle)
    {
        return make_rotation_matrix(make_rotation_quat_axis_angle(axis, angle));
    }

    // translation * rotation * scale
    inline float4x4 make_trs_matrix(const float3 & translation, const float4 & rotation, const float3 & scale)
    {
        return mul(make_translation_matrix(translation), mul(make_rotation_matrix(rotation), make_scaling_matrix(scale)));
    }

    inline float3 transform_coord(const float4x4 & transform, const float3 & coord)
    {
        const float4 r = mul(transform, float4(coord, 1));
        return r.xyz() / r.w;
    }

    inline float3 transform_vector(const float4x4 & transform, const float3 & vector)
    {
        return mul(transform, float4(vector, 0)).xyz();
    }

    inline float3x3 get_rotation_submatrix(const float4x4 & transform)
    {
        return { transform.x.xyz(), transform.y.xyz(), transform.z.xyz() };
    }

    // Inverse-transpose of the upper 3x3, for carrying normals through non-uniform scale
    inline float3x3 make_normal_matrix(const float4x4 & transform)
    {
        return transpose(inverse(get_rotation_submatrix(transform)));
    }

    // Right-handed view matrix: the camera looks down its local -Z with `up` projected onto +Y
    inline float4x4 make_lookat_view_matrix(const float3 & eye, const float3 & target, const float3 & up)
    {
        const float3 zDir = normalize(eye - target);
        const float3 xDir = normalize(cross(up, zDir));
        const float3 yDir = cross(zDir, xDir);
        return { { xDir.x, yDir.x, zDir.x, 0 },
                 { xDir.y, yDir.y, zDir.y, 0 },
                 { xDir.z, yDir.z, zDir.z, 0 },
                 { -dot(xDir, eye), -dot(yDir, eye), -dot(zDir, eye), 1 } };
    }

    // World pose for an object at `eye` whose -Z axis points at `target`
    inline float4x4 make_lookat_pose_matrix(const float3 & eye, const float3 & target, const float3 & up = { 0, 1, 0 })
    {
        return inverse(make_lookat_view_matrix(eye, target, up));
    }

} // end namespace lumina

#endif // end lumina_math_spatial_hpp
