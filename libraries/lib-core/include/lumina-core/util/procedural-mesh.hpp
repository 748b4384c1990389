#pragma once

#ifndef lumina_procedural_mesh_hpp
#define lumina_procedural_mesh_hpp

#include "lumina-core/math/math-core.hpp"
#include "lumina-core/util/geometry.hpp"

namespace lumina
{

    // Axis-aligned box centered on the origin. With `inward` the faces point into the box (a room).
    inline geometry make_cube(const float3 & s = { 1, 1, 1 }, bool inward = false)
    {
        geometry cube;

        const struct cube_vertex { float3 position; float3 normal; float2 texCoord; } verts[] =
        {
            // -X
            { { -0.5f, -0.5f, -0.5f }, { -1, 0, 0 }, { 0, 0 } },
            { { -0.5f, -0.5f, +0.5f }, { -1, 0, 0 }, { 1, 0 } },
            { { -0.5f, +0.5f, +0.5f }, { -1, 0, 0 }, { 1, 1 } },
            { { -0.5f, +0.5f, -0.5f }, { -1, 0, 0 }, { 0, 1 } },

            // +X
            { { +0.5f, -0.5f, +0.5f }, { +1, 0, 0 }, { 0, 0 } },
            { { +0.5f, -0.5f, -0.5f }, { +1, 0, 0 }, { 1, 0 } },
            { { +0.5f, +0.5f, -0.5f }, { +1, 0, 0 }, { 1, 1 } },
            { { +0.5f, +0.5f, +0.5f }, { +1, 0, 0 }, { 0, 1 } },

            // -Y
            { { -0.5f, -0.5f, -0.5f }, { 0, -1, 0 }, { 0, 0 } },
            { { +0.5f, -0.5f, -0.5f }, { 0, -1, 0 }, { 1, 0 } },
            { { +0.5f, -0.5f, +0.5f }, { 0, -1, 0 }, { 1, 1 } },
            { { -0.5f, -0.5f, +0.5f }, { 0, -1, 0 }, { 0, 1 } },

            // +Y
            { { +0.5f, +0.5f, -0.5f }, { 0, +1, 0 }, { 0, 0 } },
            { { -0.5f, +0.5f, -0.5f }, { 0, +1, 0 }, { 1, 0 } },
            { { -0.5f, +0.5f, +0.5f }, { 0, +1, 0 }, { 1, 1 } },
            { { +0.5f, +0.5f, +0.5f }, { 0, +1, 0 }, { 0, 1 } },

            // -Z
            { { -0.5f, -0.5f, -0.5f }, { 0, 0, -1 }, { 0, 0 } },
            { { -0.5f, +0.5f, -0.5f }, { 0, 0, -1 }, { 1, 0 } },
            { { +0.5f, +0.5f, -0.5f }, { 0, 0, -1 }, { 1, 1 } },
            { { +0.5f, -0.5f, -0.5f }, { 0, 0, -1 }, { 0, 1 } },

            // +Z
            { { -0.5f, +0.5f, +0.5f }, { 0, 0, +1 }, { 0, 0 } },
            { { -0.5f, -0.5f, +0.5f }, { 0, 0, +1 }, { 1, 0 } },
            { { +0.5f, -0.5f, +0.5f }, { 0, 0, +1 }, { 1, 1 } },
            { { +0.5f, +0.5f, +0.5f }, { 0, 0, +1 }, { 0, 1 } },
        };

        for (uint32_t q = 0; q < 6; ++q)
        {
            const uint32_t b = q * 4;
            if (inward)
            {
                cube.faces.push_back({ b, b + 2, b + 1 });
                cube.faces.push_back({ b, b + 3, b + 2 });
            }
            else
            {
                cube.faces.push_back({ b, b + 1, b + 2 });
                cube.faces.push_back({ b, b + 2, b + 3 });
            }
        }

        for (const auto & v : verts)
        {
            cube.vertices.push_back(v.position * s);
            cube.normals.push_back(inward ? -v.normal : v.normal);
            cube.texcoord0.push_back(v.texCoord);
        }

        return cube;
    }

    // Subdivided plane in XY facing +Z. Grid vertices are shared between neighbouring quads.
    inline geometry make_plane(float width, float height, uint32_t widthSegments = 1, uint32_t heightSegments = 1)
    {
        geometry plane;

        const uint32_t rowVertices = widthSegments + 1;

        for (uint32_t j = 0; j <= heightSegments; ++j)
        {
            for (uint32_t i = 0; i <= widthSegments; ++i)
            {
                const float u = float(i) / widthSegments;
                const float v = float(j) / heightSegments;
                plane.vertices.emplace_back((u - 0.5f) * width, (v - 0.5f) * height, 0.f);
                plane.normals.emplace_back(0.f, 0.f, 1.f);
                plane.texcoord0.emplace_back(u, v);
            }
        }

        for (uint32_t j = 0; j < heightSegments; ++j)
        {
            for (uint32_t i = 0; i < widthSegments; ++i)
            {
                const uint32_t a = j * rowVertices + i;
                const uint32_t b = a + 1;
                const uint32_t c = a + rowVertices + 1;
                const uint32_t d = a + rowVertices;
                plane.faces.push_back({ a, b, c });
                plane.faces.push_back({ a, c, d });
            }
        }

        return plane;
    }

} // end namespace lumina

#endif // end lumina_procedural_mesh_hpp
