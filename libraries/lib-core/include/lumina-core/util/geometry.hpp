#pragma once

#ifndef lumina_geometry_hpp
#define lumina_geometry_hpp

#include "lumina-core/math/math-core.hpp"

#include <set>

namespace lumina
{

    // Indexed triangle mesh. `texcoord1` is the lightmap atlas channel, `material` holds optional per-face material ids.
    struct runtime_mesh
    {
        std::vector<float3> vertices;
        std::vector<float3> normals;
        std::vector<float2> texcoord0;
        std::vector<float2> texcoord1;
        std::vector<uint3> faces;
        std::vector<uint32_t> material;
    };

    struct runtime_mesh_quads : public runtime_mesh
    {
        std::vector<uint4> quads;
    };

    // Each quad (a, b, c, d) becomes triangles (a, b, c) and (a, c, d)
    inline runtime_mesh quadmesh_to_trimesh(const runtime_mesh_quads & quadmesh)
    {
        runtime_mesh trimesh = quadmesh;

        for (auto & q : quadmesh.quads)
        {
            trimesh.faces.push_back({ q.x, q.y, q.z });
            trimesh.faces.push_back({ q.x, q.z, q.w });
        }

        return trimesh;
    }

    typedef runtime_mesh geometry;

    inline aabb_3d compute_bounds(const geometry & g)
    {
        aabb_3d bounds;
        for (const auto & vertex : g.vertices) bounds.surround(vertex);
        return bounds;
    }

    // Flat face normals accumulated per vertex
    inline void compute_normals(geometry & g)
    {
        constexpr float NORMAL_EPSILON = 0.0001f;

        g.normals.assign(g.vertices.size(), float3(0, 0, 0));

        for (const auto & f : g.faces)
        {
            const float3 e0 = g.vertices[f.y] - g.vertices[f.x];
            const float3 e1 = g.vertices[f.z] - g.vertices[f.x];

            if (length2(e0) < NORMAL_EPSILON || length2(e1) < NORMAL_EPSILON) continue;

            const float3 n = safe_normalize(cross(e0, e1));
            g.normals[f.x] += n;
            g.normals[f.y] += n;
            g.normals[f.z] += n;
        }

        for (auto & n : g.normals) n = safe_normalize(n);
    }

    // Number of distinct per-face material ids (0 when the mesh carries none)
    inline size_t count_materials(const geometry & g)
    {
        return std::set<uint32_t>(g.material.begin(), g.material.end()).size();
    }

    inline geometry concatenate_geometry(const geometry & a, const geometry & b)
    {
        geometry s = a;
        const uint32_t offset = static_cast<uint32_t>(a.vertices.size());
        s.vertices.insert(s.vertices.end(), b.vertices.begin(), b.vertices.end());
        s.normals.insert(s.normals.end(), b.normals.begin(), b.normals.end());
        s.texcoord0.insert(s.texcoord0.end(), b.texcoord0.begin(), b.texcoord0.end());
        s.texcoord1.insert(s.texcoord1.end(), b.texcoord1.begin(), b.texcoord1.end());
        for (auto & f : b.faces) s.faces.push_back(f + uint3(offset));
        s.material.insert(s.material.end(), b.material.begin(), b.material.end());
        return s;
    }

} // end namespace lumina

#endif // end lumina_geometry_hpp
