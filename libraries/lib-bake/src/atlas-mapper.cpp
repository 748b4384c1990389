#include "lumina-bake/atlas-mapper.hpp"
#include "lumina-bake/logging.hpp"

#include "lumina-core/util/simple-timer.hpp"

#include <stdexcept>

namespace lumina
{
    void compute_face_tangents(const float3 & normal, float3 & u, float3 & v)
    {
        u = (normal.x == 0.f && normal.y == 0.f) ? float3(1, 0, 0) : float3(0, 0, 1);
        v = safe_normalize(cross(normal, u));
        u = safe_normalize(cross(normal, v));
    }

    atlas_map_item make_atlas_map_item(const workbench_item & item, const uint32_t atlasItemIndex, const uint32_t workbenchItemIndex)
    {
        validate_workbench_item(item);

        const runtime_mesh & mesh = *item.mesh;

        atlas_map_item result;
        result.face_count = static_cast<uint32_t>(mesh.faces.size());
        result.original_mesh = item.mesh;
        result.workbench_item = workbenchItemIndex;

        const size_t faceVertexCount = mesh.faces.size() * 3;
        result.face_positions.resize(faceVertexCount);
        result.face_normals.resize(faceVertexCount);
        result.face_atlas_uvs.resize(faceVertexCount);

        for (uint32_t faceIndex = 0; faceIndex < result.face_count; ++faceIndex)
        {
            const uint3 & f = mesh.faces[faceIndex];
            const uint32_t idx[3] = { f.x, f.y, f.z };
            const size_t base = size_t(faceIndex) * 3;
            const float enc = encode_atlas_face(atlasItemIndex, faceIndex);

            for (uint32_t k = 0; k < 3; ++k)
            {
                result.face_atlas_uvs[base + k] = mesh.texcoord1[idx[k]];
                result.face_positions[base + k] = { float(k & 1), float((k & 2) >> 1), enc };
            }

            // the source normal decides the facing since winding order is unknown
            const float3 normal = mesh.normals[idx[0]];
            float3 u, v;
            compute_face_tangents(normal, u, v);

            result.face_normals[base + 0] = normal;
            result.face_normals[base + 1] = u;
            result.face_normals[base + 2] = v;
        }

        return result;
    }

    atlas_mapper::atlas_mapper(const int width, const int height) : width(width), height(height)
    {
        if (width <= 0 || height <= 0) throw std::invalid_argument("atlas must have a positive size");
    }

    atlas_map atlas_mapper::build(render_device & device, const std::vector<workbench_item> & items) const
    {
        simple_cpu_timer t;
        t.start();

        atlas_map atlas;
        atlas.width = width;
        atlas.height = height;
        atlas.data = image_buffer<float>({ width, height }, 4);

        std::vector<atlas_raster_vertex> triangles;

        for (uint32_t i = 0; i < items.size(); ++i)
        {
            if (!items[i].needs_lightmap) continue;

            const uint32_t atlasItemIndex = static_cast<uint32_t>(atlas.items.size());
            atlas.items.push_back(make_atlas_map_item(items[i], atlasItemIndex, i));

            const atlas_map_item & m = atlas.items.back();
            for (size_t v = 0; v < m.face_positions.size(); ++v)
            {
                triangles.push_back({ m.face_atlas_uvs[v], m.face_positions[v] });
            }
        }

        device.rasterize_atlas(triangles, atlas.data);

        t.stop();

        log::get()->atlas_log->info("mapped {} items into {}x{} atlas ({} populated texels) in {:.2f} ms",
            atlas.items.size(), width, height, atlas.count_populated_texels(), t.elapsed_ms());

        return atlas;
    }

    void map_workbench_atlas(render_device & device, workbench & wb, const int width, const int height)
    {
        atlas_mapper mapper(width, height);
        wb.atlas = mapper.build(device, wb.items);
    }

} // end namespace lumina
