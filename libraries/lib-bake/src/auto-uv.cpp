#include "lumina-bake/auto-uv.hpp"
#include "lumina-bake/logging.hpp"

#include <limits>
#include <numeric>
#include <stdexcept>

namespace lumina
{
    namespace
    {
        struct uv_chart
        {
            size_t mesh_index{ 0 };
            float3 u_axis;
            float3 v_axis;
            std::vector<uint32_t> vertices;
            std::vector<float2> local;
            bool alive{ true };
        };

        // Corner of the face whose two edges are closest to perpendicular
        int guess_orthogonal_origin(const runtime_mesh & mesh, const uint3 & f)
        {
            const uint32_t idx[3] = { f.x, f.y, f.z };

            float minAbsDot = 1.f;
            int minI = 0;

            for (int i = 0; i < 3; ++i)
            {
                const float3 origin = mesh.vertices[idx[i]];
                const float3 u = safe_normalize(mesh.vertices[idx[(i + 2) % 3]] - origin);
                const float3 v = safe_normalize(mesh.vertices[idx[(i + 1) % 3]] - origin);
                const float absDot = std::abs(dot(u, v));

                if (minAbsDot > absDot)
                {
                    minAbsDot = absDot;
                    minI = i;
                }
            }

            return minI;
        }
    }

    int2 pack_layout_boxes(std::vector<layout_box> & boxes)
    {
        if (boxes.empty()) return { 0, 0 };

        double area = 0.0;
        int maxWidth = 0;
        for (const auto & b : boxes)
        {
            area += double(b.w) * double(b.h);
            maxWidth = std::max(maxWidth, b.w);
        }

        std::vector<size_t> order(boxes.size());
        std::iota(order.begin(), order.end(), size_t(0));
        std::stable_sort(order.begin(), order.end(), [&boxes](size_t a, size_t b) { return boxes[a].h > boxes[b].h; });

        // aim for a squarish result
        const int startWidth = std::max(int(std::ceil(std::sqrt(area / 0.95))), maxWidth);

        std::vector<layout_box> spaces = { { 0, 0, startWidth, std::numeric_limits<int>::max() } };

        int width = 0;
        int height = 0;

        for (const size_t boxIndex : order)
        {
            layout_box & box = boxes[boxIndex];

            // smaller spaces are at the back, try them first
            for (int i = int(spaces.size()) - 1; i >= 0; --i)
            {
                layout_box & space = spaces[i];
                if (box.w > space.w || box.h > space.h) continue;

                box.x = space.x;
                box.y = space.y;
                height = std::max(height, box.y + box.h);
                width = std::max(width, box.x + box.w);

                if (box.w == space.w && box.h == space.h)
                {
                    const layout_box last = spaces.back();
                    spaces.pop_back();
                    if (i < int(spaces.size())) spaces[i] = last;
                }
                else if (box.h == space.h)
                {
                    space.x += box.w;
                    space.w -= box.w;
                }
                else if (box.w == space.w)
                {
                    space.y += box.h;
                    space.h -= box.h;
                }
                else
                {
                    const layout_box remainder = { space.x + box.w, space.y, space.w - box.w, box.h };
                    space.y += box.h;
                    space.h -= box.h;
                    spaces.push_back(remainder);
                }
                break;
            }
        }

        return { width, height };
    }

    void auto_uv2_layout(const std::vector<runtime_mesh *> & meshes, const int atlasWidth, const int atlasHeight, const float worldWidth)
    {
        if (atlasWidth <= 0 || atlasHeight <= 0) throw std::invalid_argument("auto-UV needs a positive atlas size");
        if (worldWidth <= 0.f) throw std::invalid_argument("auto-UV needs a positive world width");

        const float texelSize = worldWidth / atlasWidth;

        std::vector<uv_chart> charts;

        for (size_t m = 0; m < meshes.size(); ++m)
        {
            if (!meshes[m]) throw std::invalid_argument("expected mesh geometry");
            const runtime_mesh & mesh = *meshes[m];

            if (!mesh.texcoord1.empty()) throw std::invalid_argument("uv2 attribute already exists");
            if (mesh.faces.empty()) throw std::invalid_argument("expected face index array");
            if (mesh.normals.size() != mesh.vertices.size()) throw std::invalid_argument("expected normal attribute");

            std::vector<int> vertexChart(mesh.vertices.size(), -1);

            for (const auto & f : mesh.faces)
            {
                const uint32_t idx[3] = { f.x, f.y, f.z };

                // join the chart of any vertex this face shares, merging charts the face bridges
                int existing = -1;
                for (int i = 0; i < 3; ++i)
                {
                    const int possible = vertexChart[idx[i]];
                    if (possible < 0) continue;

                    if (existing >= 0 && existing != possible)
                    {
                        uv_chart & absorbed = charts[possible];
                        uv_chart & target = charts[existing];
                        target.vertices.insert(target.vertices.end(), absorbed.vertices.begin(), absorbed.vertices.end());
                        for (const uint32_t v : absorbed.vertices) vertexChart[v] = existing;
                        absorbed.vertices.clear();
                        absorbed.alive = false;
                    }
                    else
                    {
                        existing = possible;
                    }
                }

                if (existing < 0)
                {
                    const int originIndex = guess_orthogonal_origin(mesh, f);
                    const float3 origin = mesh.vertices[idx[originIndex]];
                    const float3 edgeV = mesh.vertices[idx[(originIndex + 1) % 3]] - origin;
                    const float3 normal = mesh.normals[idx[originIndex]];

                    uv_chart c;
                    c.mesh_index = m;
                    c.u_axis = safe_normalize(cross(edgeV, normal));
                    c.v_axis = safe_normalize(cross(normal, c.u_axis));
                    charts.push_back(std::move(c));
                    existing = int(charts.size()) - 1;
                }

                for (int i = 0; i < 3; ++i)
                {
                    if (vertexChart[idx[i]] >= 0) continue;
                    vertexChart[idx[i]] = existing;
                    charts[existing].vertices.push_back(idx[i]);
                }
            }
        }

        // project each chart onto its plane and size its box in texels, plus a one texel margin per side
        std::vector<uv_chart *> liveCharts;
        std::vector<layout_box> boxes;

        for (auto & c : charts)
        {
            if (!c.alive) continue;

            const runtime_mesh & mesh = *meshes[c.mesh_index];
            float2 minLocal = { std::numeric_limits<float>::infinity(), std::numeric_limits<float>::infinity() };
            float2 maxLocal = -minLocal;

            c.local.resize(c.vertices.size());
            for (size_t i = 0; i < c.vertices.size(); ++i)
            {
                const float3 & p = mesh.vertices[c.vertices[i]];
                c.local[i] = { dot(p, c.u_axis), dot(p, c.v_axis) };
                minLocal = linalg::min(minLocal, c.local[i]);
                maxLocal = linalg::max(maxLocal, c.local[i]);
            }

            const float2 extent = maxLocal - minLocal;
            for (auto & l : c.local)
            {
                l.x = extent.x > 0.f ? (l.x - minLocal.x) / extent.x : 0.f;
                l.y = extent.y > 0.f ? (l.y - minLocal.y) / extent.y : 0.f;
            }

            layout_box box;
            box.w = int(std::ceil(extent.x / texelSize)) + 2;
            box.h = int(std::ceil(extent.y / texelSize)) + 2;
            boxes.push_back(box);
            liveCharts.push_back(&c);
        }

        const int2 used = pack_layout_boxes(boxes);
        if (used.x > atlasWidth || used.y > atlasHeight)
        {
            throw std::runtime_error("auto-UV needs lightmap sized " + std::to_string(used.x) + "x" + std::to_string(used.y));
        }

        for (auto * mesh : meshes) mesh->texcoord1.assign(mesh->vertices.size(), float2(0, 0));

        for (size_t b = 0; b < boxes.size(); ++b)
        {
            const uv_chart & c = *liveCharts[b];
            const layout_box & box = boxes[b];
            runtime_mesh & mesh = *meshes[c.mesh_index];

            // inner box without margins
            const float ix = float(box.x + 1), iy = float(box.y + 1);
            const float iw = float(box.w - 2), ih = float(box.h - 2);

            for (size_t i = 0; i < c.vertices.size(); ++i)
            {
                mesh.texcoord1[c.vertices[i]] = { (ix + c.local[i].x * iw) / atlasWidth, (iy + c.local[i].y * ih) / atlasHeight };
            }
        }

        log::get()->atlas_log->info("auto-UV packed {} charts from {} meshes into {}x{} texels", boxes.size(), meshes.size(), used.x, used.y);
    }

} // end namespace lumina
