#include "lumina-bake/soft-render-device.hpp"

#include <array>
#include <stdexcept>

namespace lumina
{
    namespace
    {
        constexpr float SHADOW_BIAS = 0.001f;

        struct soft_vertex
        {
            float4 clip;
            float3 position;
            float3 normal;
            float2 uv0;
            float2 uv1;
        };

        soft_vertex lerp_vertex(const soft_vertex & a, const soft_vertex & b, const float t)
        {
            soft_vertex v;
            v.clip = a.clip + (b.clip - a.clip) * t;
            v.position = a.position + (b.position - a.position) * t;
            v.normal = a.normal + (b.normal - a.normal) * t;
            v.uv0 = a.uv0 + (b.uv0 - a.uv0) * t;
            v.uv1 = a.uv1 + (b.uv1 - a.uv1) * t;
            return v;
        }

        // Sutherland-Hodgman against the GL near plane (z >= -w). A triangle yields at most 4 vertices.
        int clip_near(const std::array<soft_vertex, 3> & in, std::array<soft_vertex, 4> & out)
        {
            int count = 0;
            for (int i = 0; i < 3; ++i)
            {
                const soft_vertex & a = in[i];
                const soft_vertex & b = in[(i + 1) % 3];
                const float da = a.clip.z + a.clip.w;
                const float db = b.clip.z + b.clip.w;

                if (da >= 0.f) out[count++] = a;
                if ((da >= 0.f) != (db >= 0.f)) out[count++] = lerp_vertex(a, b, da / (da - db));
            }
            return count;
        }

        float edge_function(const float2 & a, const float2 & b, const float2 & p)
        {
            return (b.x - a.x) * (p.y - a.y) - (b.y - a.y) * (p.x - a.x);
        }

        // Intersection of two (x, y, w, h) rectangles
        int4 intersect_rect(const int4 & a, const int4 & b)
        {
            const int x0 = std::max(a.x, b.x);
            const int y0 = std::max(a.y, b.y);
            const int x1 = std::min(a.x + a.z, b.x + b.z);
            const int y1 = std::min(a.y + a.w, b.y + b.w);
            return { x0, y0, std::max(0, x1 - x0), std::max(0, y1 - y0) };
        }
    }

    void soft_render_device::rasterize_atlas(const std::vector<atlas_raster_vertex> & triangles, image_buffer<float> & target)
    {
        if (target.num_channels() != 4) throw std::invalid_argument("atlas target must have 4 channels");

        const int2 size = target.size();
        const float2 scale = float2(size);

        for (size_t t = 0; t + 2 < triangles.size(); t += 3)
        {
            const float2 p0 = triangles[t + 0].atlas_uv * scale;
            const float2 p1 = triangles[t + 1].atlas_uv * scale;
            const float2 p2 = triangles[t + 2].atlas_uv * scale;

            const float area = edge_function(p0, p1, p2);
            if (area == 0.f) continue;

            const int minX = std::max(0, int(std::floor(std::min({ p0.x, p1.x, p2.x }))));
            const int minY = std::max(0, int(std::floor(std::min({ p0.y, p1.y, p2.y }))));
            const int maxX = std::min(size.x - 1, int(std::ceil(std::max({ p0.x, p1.x, p2.x }))));
            const int maxY = std::min(size.y - 1, int(std::ceil(std::max({ p0.y, p1.y, p2.y }))));

            const float3 & a0 = triangles[t + 0].payload;
            const float3 & a1 = triangles[t + 1].payload;
            const float3 & a2 = triangles[t + 2].payload;

            for (int y = minY; y <= maxY; ++y)
            {
                for (int x = minX; x <= maxX; ++x)
                {
                    const float2 p = { x + 0.5f, y + 0.5f };

                    // dividing by the signed area makes the test independent of winding
                    const float b0 = edge_function(p1, p2, p) / area;
                    const float b1 = edge_function(p2, p0, p) / area;
                    const float b2 = edge_function(p0, p1, p) / area;
                    if (b0 < 0.f || b1 < 0.f || b2 < 0.f) continue;

                    target(y, x, 0) = a0.x * b0 + a1.x * b1 + a2.x * b2;
                    target(y, x, 1) = a0.y * b0 + a1.y * b1 + a2.y * b2;
                    target(y, x, 2) = a0.z;
                    target(y, x, 3) = 0.f;
                }
            }
        }
    }

    void soft_render_device::begin_probe_target(const int2 & size, const float3 & clearColor)
    {
        if (size.x <= 0 || size.y <= 0) throw std::invalid_argument("probe target must have a positive size");

        if (color.size() != size)
        {
            color = image_buffer<float>(size, 4);
            depth.resize(size_t(size.x) * size_t(size.y));
        }

        for (int y = 0; y < size.y; ++y)
        {
            for (int x = 0; x < size.x; ++x)
            {
                color(y, x, 0) = clearColor.x;
                color(y, x, 1) = clearColor.y;
                color(y, x, 2) = clearColor.z;
                color(y, x, 3) = 0.f;
            }
        }

        std::fill(depth.begin(), depth.end(), 1.f);
    }

    void soft_render_device::build_occluders(const light_scene & scene)
    {
        occluders.clear();
        occluderSceneUid = scene.uid;

        for (const auto & item : scene.items)
        {
            if (!item.mesh) continue;

            occluder o;
            o.triangles.reserve(item.mesh->faces.size() * 3);

            for (const auto & f : item.mesh->faces)
            {
                for (const uint32_t idx : { f.x, f.y, f.z })
                {
                    const float3 p = transform_coord(item.world_matrix, item.mesh->vertices[idx]);
                    o.bounds.surround(p);
                    o.triangles.push_back(p);
                }
            }

            if (!o.triangles.empty()) occluders.push_back(std::move(o));
        }
    }

    bool soft_render_device::is_occluded(const ray & r, const float maxDistance) const
    {
        for (const auto & o : occluders)
        {
            float tmin = 0.f;
            if (!intersect_ray_box(r, o.bounds, &tmin)) continue;
            if (tmin > maxDistance) continue;

            for (size_t i = 0; i + 2 < o.triangles.size(); i += 3)
            {
                float t = 0.f;
                if (intersect_ray_triangle(r, o.triangles[i], o.triangles[i + 1], o.triangles[i + 2], &t) && t > SHADOW_BIAS && t < maxDistance - SHADOW_BIAS)
                {
                    return true;
                }
            }
        }
        return false;
    }

    void soft_render_device::render_light_scene(const light_scene & scene, const probe_view & view)
    {
        if (color.empty()) throw std::runtime_error("render_light_scene called without a bound probe target");

        bool needsShadows = false;
        for (const auto & light : scene.lights) needsShadows |= light.cast_shadow;
        if (needsShadows && occluderSceneUid != scene.uid) build_occluders(scene);

        const int2 targetSize = color.size();
        const int4 vp = view.viewport;
        const int4 bounds = intersect_rect(intersect_rect(vp, view.scissor), { 0, 0, targetSize.x, targetSize.y });
        if (bounds.z == 0 || bounds.w == 0) return;

        const float4x4 viewProj = mul(view.projection, view.view);

        for (const auto & item : scene.items)
        {
            if (!item.mesh) continue;

            const runtime_mesh & mesh = *item.mesh;
            const float4x4 mvp = mul(viewProj, item.world_matrix);
            const float3x3 normalMatrix = make_normal_matrix(item.world_matrix);

            for (const auto & f : mesh.faces)
            {
                std::array<soft_vertex, 3> tri;
                const uint32_t idx[3] = { f.x, f.y, f.z };

                const float3 faceNormal = safe_normalize(cross(mesh.vertices[f.y] - mesh.vertices[f.x], mesh.vertices[f.z] - mesh.vertices[f.x]));

                for (int k = 0; k < 3; ++k)
                {
                    const uint32_t i = idx[k];
                    tri[k].clip = mul(mvp, float4(mesh.vertices[i], 1));
                    tri[k].position = transform_coord(item.world_matrix, mesh.vertices[i]);
                    tri[k].normal = mul(normalMatrix, mesh.normals.empty() ? faceNormal : mesh.normals[i]);
                    tri[k].uv0 = mesh.texcoord0.empty() ? float2(0, 0) : mesh.texcoord0[i];
                    tri[k].uv1 = mesh.texcoord1.empty() ? float2(0, 0) : mesh.texcoord1[i];
                }

                std::array<soft_vertex, 4> poly;
                const int polyCount = clip_near(tri, poly);
                if (polyCount < 3) continue;

                // screen-space positions (pixel units, lower-left origin) and depth in [0, 1]
                std::array<float2, 4> screen;
                std::array<float, 4> screenDepth;
                std::array<float, 4> invW;
                for (int k = 0; k < polyCount; ++k)
                {
                    const float4 & c = poly[k].clip;
                    invW[k] = 1.f / c.w;
                    const float3 ndc = c.xyz() * invW[k];
                    screen[k] = { vp.x + (ndc.x * 0.5f + 0.5f) * vp.z, vp.y + (ndc.y * 0.5f + 0.5f) * vp.w };
                    screenDepth[k] = ndc.z * 0.5f + 0.5f;
                }

                for (int k = 1; k + 1 < polyCount; ++k)
                {
                    const int v[3] = { 0, k, k + 1 };
                    const float2 & s0 = screen[v[0]];
                    const float2 & s1 = screen[v[1]];
                    const float2 & s2 = screen[v[2]];

                    // counter-clockwise is front facing
                    const float area = edge_function(s0, s1, s2);
                    if (area <= 0.f) continue;

                    const int minX = std::max(bounds.x, int(std::floor(std::min({ s0.x, s1.x, s2.x }))));
                    const int minY = std::max(bounds.y, int(std::floor(std::min({ s0.y, s1.y, s2.y }))));
                    const int maxX = std::min(bounds.x + bounds.z - 1, int(std::ceil(std::max({ s0.x, s1.x, s2.x }))));
                    const int maxY = std::min(bounds.y + bounds.w - 1, int(std::ceil(std::max({ s0.y, s1.y, s2.y }))));

                    for (int y = minY; y <= maxY; ++y)
                    {
                        for (int x = minX; x <= maxX; ++x)
                        {
                            const float2 p = { x + 0.5f, y + 0.5f };
                            const float b0 = edge_function(s1, s2, p) / area;
                            const float b1 = edge_function(s2, s0, p) / area;
                            const float b2 = edge_function(s0, s1, p) / area;
                            if (b0 < 0.f || b1 < 0.f || b2 < 0.f) continue;

                            const float z = b0 * screenDepth[v[0]] + b1 * screenDepth[v[1]] + b2 * screenDepth[v[2]];
                            if (z < 0.f || z > 1.f) continue;

                            float & depthValue = depth[size_t(y) * targetSize.x + x];
                            if (z >= depthValue) continue;
                            depthValue = z;

                            // perspective-correct weights
                            const float w0 = b0 * invW[v[0]], w1 = b1 * invW[v[1]], w2 = b2 * invW[v[2]];
                            const float wSum = w0 + w1 + w2;
                            const soft_vertex & a0 = poly[v[0]];
                            const soft_vertex & a1 = poly[v[1]];
                            const soft_vertex & a2 = poly[v[2]];

                            const float3 position = (a0.position * w0 + a1.position * w1 + a2.position * w2) / wSum;
                            const float3 normal = safe_normalize((a0.normal * w0 + a1.normal * w1 + a2.normal * w2) / wSum);
                            const float2 uv0 = (a0.uv0 * w0 + a1.uv0 * w1 + a2.uv0 * w2) / wSum;
                            const float2 uv1 = (a0.uv1 * w0 + a1.uv1 * w1 + a2.uv1 * w2) / wSum;

                            float3 albedo = item.albedo;
                            if (item.albedo_map) albedo *= sample_bilinear(*item.albedo_map, uv0).xyz();

                            float3 emissive = item.emissive;
                            if (item.emissive_map) emissive *= sample_bilinear(*item.emissive_map, uv0).xyz();

                            float3 irradiance = { 0, 0, 0 };
                            for (const auto & light : scene.lights)
                            {
                                const float3 direct = evaluate_direct_light(light, position, normal);
                                if (length2(direct) == 0.f) continue;

                                if (light.cast_shadow)
                                {
                                    float3 toLight;
                                    float maxDistance;
                                    get_light_ray(light, position, toLight, maxDistance);
                                    if (is_occluded(ray(position + normal * SHADOW_BIAS, toLight), maxDistance)) continue;
                                }

                                irradiance += direct;
                            }

                            if (item.lightmap) irradiance += sample_nearest(item.lightmap->get_buffer(), uv1).xyz();

                            const float3 result = albedo * irradiance + emissive;
                            color(y, x, 0) = result.x;
                            color(y, x, 1) = result.y;
                            color(y, x, 2) = result.z;
                            color(y, x, 3) = 1.f;
                        }
                    }
                }
            }
        }
    }

    void soft_render_device::read_probe_target(image_buffer<float> & out)
    {
        out = color;
    }

    void soft_render_device::composite_layers(const std::vector<composite_layer> & layers, lightmap_texture & target)
    {
        const int w = target.width();
        const int h = target.height();

        for (int y = 0; y < h; ++y)
        {
            for (int x = 0; x < w; ++x)
            {
                const float2 uv = { (x + 0.5f) / w, (y + 0.5f) / h };

                float3 sum = { 0, 0, 0 };
                for (const auto & layer : layers)
                {
                    if (!layer.texture || layer.multiplier == 0.f) continue;
                    sum += sample_nearest(layer.texture->get_buffer(), uv).xyz() * layer.multiplier;
                }

                target.set_texel(size_t(y) * w + x, float4(sum, 1.f));
            }
        }

        target.mark_dirty();
    }

} // end namespace lumina
