#include "lumina-bake/light-probe.hpp"

#include <stdexcept>

namespace lumina
{
    probe_placement make_probe_placement(const atlas_map_item & item, const uint32_t faceIndex, const float u, const float v, const float4x4 & world)
    {
        const runtime_mesh & mesh = *item.original_mesh;
        const uint3 & f = mesh.faces[faceIndex];

        const float3 v0 = mesh.vertices[f.x];
        const float3 e1 = mesh.vertices[f.y] - v0;
        const float3 e2 = mesh.vertices[f.z] - v0;

        const float3 localPosition = v0 + e1 * u + e2 * v;
        const float3 localNormal = safe_normalize(mesh.normals[f.x] * (1.f - u - v) + mesh.normals[f.y] * u + mesh.normals[f.z] * v);
        const float3 localU = item.face_normals[size_t(faceIndex) * 3 + 1];

        probe_placement p;
        p.position = transform_coord(world, localPosition);
        p.normal = safe_normalize(mul(make_normal_matrix(world), localNormal));
        p.u = safe_normalize(project_on_plane(transform_vector(world, localU), p.normal));
        p.v = cross(p.u, p.normal);
        return p;
    }

    std::vector<float> make_probe_area_lookup(const int probeSize)
    {
        std::vector<float> lookup(size_t(probeSize) * size_t(probeSize));

        const float pixelBias = 0.5f / probeSize;

        for (int py = 0; py < probeSize; ++py)
        {
            const float dy = float(py) / probeSize - 0.5f + pixelBias;

            for (int px = 0; px < probeSize; ++px)
            {
                const float dx = float(px) / probeSize - 0.5f + pixelBias;

                const float span = std::hypot(dx * 2.f, dy * 2.f);
                lookup[size_t(py) * probeSize + px] = 1.f / std::hypot(span, 1.f);
            }
        }

        return lookup;
    }

    float4 probe_readback::average() const
    {
        const int size = sampler.probeSize;
        const int half = size / 2;
        const int batchY = slot * size * 2;
        const std::vector<float> & lookup = sampler.areaLookup;

        float3 sum = { 0, 0, 0 };
        float divider = 0.f;

        // box in target pixels plus the matching row origin in the area lookup
        auto accumulate = [&](const int boxX, const int boxY, const int boxH, const int originY)
        {
            for (int row = 0; row < boxH; ++row)
            {
                const int py = originY + row;
                for (int px = 0; px < size; ++px)
                {
                    const float area = lookup[size_t(py) * size + px];
                    const int x = boxX + px;
                    const int y = boxY + row;
                    sum += float3(pixels(y, x, 0), pixels(y, x, 1), pixels(y, x, 2)) * area;
                    divider += area;
                }
            }
        };

        accumulate(0, batchY + size, size, 0);
        for (int k = 0; k < 4; ++k) accumulate(k * size, batchY + half, half, half);

        return { sum / divider, 1.f };
    }

    light_probe_sampler::light_probe_sampler(const int probeSize, const int batchCount) : probeSize(probeSize), batchCount(batchCount)
    {
        if (probeSize < 2 || probeSize % 2 != 0) throw std::invalid_argument("probe size must be even and at least 2");
        if (batchCount < 1) throw std::invalid_argument("probe batch count must be at least 1");

        areaLookup = make_probe_area_lookup(probeSize);
        batchTexels.resize(batchCount, -1);
    }

    std::array<probe_view, 5> light_probe_sampler::make_probe_views(const probe_placement & placement, const int slot) const
    {
        const int size = probeSize;
        const int half = size / 2;
        const int batchY = slot * size * 2;

        const float4x4 projection = make_projection_matrix(to_radians(fov_degrees), 1.f, near_clip, far_clip);
        const float3 & p = placement.position;

        std::array<probe_view, 5> views;

        views[0].view = make_lookat_view_matrix(p, p + placement.normal, placement.u);
        views[0].projection = projection;
        views[0].viewport = { 0, batchY + size, size, size };
        views[0].scissor = { 0, batchY + size, size, size };

        // side views only keep the half above the horizon
        const float3 sideDirections[4] = { placement.u, -placement.u, placement.v, -placement.v };
        for (int k = 0; k < 4; ++k)
        {
            probe_view & side = views[k + 1];
            side.view = make_lookat_view_matrix(p, p + sideDirections[k], placement.normal);
            side.projection = projection;
            side.viewport = { k * size, batchY, size, size };
            side.scissor = { k * size, batchY + half, size, half };
        }

        return views;
    }

    int light_probe_sampler::render_batch(render_device & device, const light_scene & scene, const request_fn & request, const consume_fn & consume)
    {
        device.begin_probe_target(get_target_size(), scene.sky_color);

        std::fill(batchTexels.begin(), batchTexels.end(), -1);

        int filled = 0;
        for (int slot = 0; slot < batchCount; ++slot)
        {
            request([&](const size_t texelIndex, const probe_placement & placement)
            {
                if (batchTexels[slot] >= 0) throw std::logic_error("probe batch slot queued twice");
                batchTexels[slot] = static_cast<int64_t>(texelIndex);

                for (const auto & view : make_probe_views(placement, slot))
                {
                    device.render_light_scene(scene, view);
                }
            });

            // nothing queued means the sweep ran out of texels for this call
            if (batchTexels[slot] < 0) break;
            ++filled;
        }

        device.read_probe_target(readback);

        for (int slot = 0; slot < filled; ++slot)
        {
            consume(static_cast<size_t>(batchTexels[slot]), probe_readback(*this, readback, slot));
        }

        return filled;
    }

} // end namespace lumina
