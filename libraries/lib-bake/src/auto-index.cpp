#include "lumina-bake/auto-index.hpp"

#include <array>
#include <limits>
#include <map>
#include <stdexcept>

namespace lumina
{
    namespace
    {
        typedef std::array<float, 10> vertex_key;

        vertex_key make_vertex_key(const runtime_mesh & mesh, const size_t i)
        {
            const float3 & p = mesh.vertices[i];
            const float3 n = i < mesh.normals.size() ? mesh.normals[i] : float3(0, 0, 0);
            const float2 t0 = i < mesh.texcoord0.size() ? mesh.texcoord0[i] : float2(0, 0);
            const float2 t1 = i < mesh.texcoord1.size() ? mesh.texcoord1[i] : float2(0, 0);
            return { p.x, p.y, p.z, n.x, n.y, n.z, t0.x, t0.y, t1.x, t1.y };
        }
    }

    void auto_index(runtime_mesh & mesh)
    {
        if (!mesh.faces.empty()) throw std::invalid_argument("mesh already has a face index array");
        if (mesh.vertices.size() % 3 != 0) throw std::invalid_argument("non-indexed mesh needs a multiple of three vertices");
        if (mesh.vertices.size() > std::numeric_limits<uint32_t>::max()) throw std::invalid_argument("too many vertices to index");

        std::map<vertex_key, uint32_t> firstIndex;
        std::vector<uint32_t> remap(mesh.vertices.size());

        for (size_t i = 0; i < mesh.vertices.size(); ++i)
        {
            auto it = firstIndex.emplace(make_vertex_key(mesh, i), static_cast<uint32_t>(i)).first;
            remap[i] = it->second;
        }

        mesh.faces.reserve(mesh.vertices.size() / 3);
        for (size_t i = 0; i < mesh.vertices.size(); i += 3)
        {
            mesh.faces.push_back({ remap[i], remap[i + 1], remap[i + 2] });
        }
    }

} // end namespace lumina
